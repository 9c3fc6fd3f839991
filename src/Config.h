/**
 * @file Config.h
 * @brief Configuration for cuetrack
 */

#ifndef CUETRACK_CONFIG_H
#define CUETRACK_CONFIG_H

#include <string>
#include <vector>
#include <cstdint>

enum class AudioQuality {
    NORMAL,     // ~96 kbps
    HIGH,       // ~160 kbps
    VERY_HIGH   // ~320 kbps
};

const char* audioQualityName(AudioQuality quality);

struct Config {
    // Content
    std::string playlistPath;           // extended M3U, empty = use items
    std::vector<std::string> items;     // bare locations from the command line
    AudioQuality preferredQuality = AudioQuality::VERY_HIGH;

    // Playback
    bool preloadEnabled = true;
    int crossfadeDurationMs = 0;        // 0 = no fades unless metadata asks
    int startPositionMs = 0;            // seek applied to the first item

    // Normalisation (replay gain)
    bool normalisationEnabled = false;
    float normalisationPregain = 3.0f;  // dB

    // Streaming
    int haltThresholdMs = 1000;         // no data for this long = halted

    // Output
    std::string output = "-";           // "-" = stdout, S16_LE 44.1 kHz stereo

    // Logging
    bool verbose = false;
    bool quiet = false;

    // Actions
    bool showVersion = false;
};

#endif // CUETRACK_CONFIG_H
