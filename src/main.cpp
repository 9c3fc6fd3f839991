/**
 * @file main.cpp
 * @brief Main entry point for cuetrack
 *
 * Plays a playlist (local files and http:// streams, Ogg Vorbis and MP3)
 * gaplessly, with optional crossfades, as raw PCM on stdout or into a file.
 */

#include "Config.h"
#include "Decoder.h"
#include "LogLevel.h"
#include "MixingLine.h"
#include "PipeSink.h"
#include "Playlist.h"
#include "PlaylistContentLoader.h"
#include "QueuePlayer.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include <thread>

#define CUETRACK_VERSION "0.1.0"

// ============================================
// Signal Handling
// ============================================

std::atomic<bool> g_running{true};
std::atomic<bool> g_skipRequested{false};

void signalHandler(int /*signal*/) {
    g_running.store(false, std::memory_order_release);
}

void skipSignalHandler(int /*signal*/) {
    g_skipRequested.store(true, std::memory_order_release);
}

// ============================================
// CLI Parsing
// ============================================

static bool parseQuality(const std::string& value, AudioQuality& out) {
    if (value == "normal") out = AudioQuality::NORMAL;
    else if (value == "high") out = AudioQuality::HIGH;
    else if (value == "very-high") out = AudioQuality::VERY_HIGH;
    else return false;
    return true;
}

static void printHelp(const char* argv0) {
    std::cout << "cuetrack - Gapless playlist player with crossfade\n\n"
              << "Usage: " << argv0 << " [options] [location...]\n\n"
              << "Content:\n"
              << "  -P, --playlist <file>  Extended M3U playlist\n"
              << "  --quality <q>          normal, high or very-high (default: very-high)\n"
              << "  --no-preload           Do not preload the next item\n"
              << "\n"
              << "Playback:\n"
              << "  -x, --crossfade <ms>   Crossfade duration (default: 0)\n"
              << "  --start <ms>           Start position of the first item\n"
              << "  --normalise            Apply replay gain\n"
              << "  --pregain <dB>         Replay gain pregain (default: 3.0)\n"
              << "  --halt-threshold <ms>  Stall before a stream counts as halted (default: 1000)\n"
              << "\n"
              << "Output:\n"
              << "  -o, --output <path>    PCM destination, - for stdout (default: -)\n"
              << "                         S16_LE, 44100 Hz, stereo\n"
              << "\n"
              << "Logging:\n"
              << "  -v, --verbose          Debug output (log level: DEBUG)\n"
              << "  -q, --quiet            Errors and warnings only (log level: WARN)\n"
              << "\n"
              << "Other:\n"
              << "  -V, --version          Show version information\n"
              << "  -h, --help             Show this help\n"
              << "\n"
              << "Signals:\n"
              << "  SIGUSR1                Skip to the next item\n"
              << "\n"
              << "Examples:\n"
              << "  " << argv0 << " -P party.m3u -x 6000 | aplay -f cd\n"
              << "  " << argv0 << " song.ogg http://radio.example.org/live.mp3 -o out.raw\n"
              << std::endl;
}

Config parseArguments(int argc, char* argv[]) {
    Config config;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if ((arg == "--playlist" || arg == "-P") && i + 1 < argc) {
            config.playlistPath = argv[++i];
        }
        else if ((arg == "--output" || arg == "-o") && i + 1 < argc) {
            config.output = argv[++i];
        }
        else if (arg == "--quality" && i + 1 < argc) {
            if (!parseQuality(argv[++i], config.preferredQuality)) {
                std::cerr << "Invalid quality. Must be normal, high or very-high" << std::endl;
                exit(1);
            }
        }
        else if (arg == "--no-preload") {
            config.preloadEnabled = false;
        }
        else if ((arg == "--crossfade" || arg == "-x") && i + 1 < argc) {
            config.crossfadeDurationMs = std::atoi(argv[++i]);
            if (config.crossfadeDurationMs < 0) {
                std::cerr << "Invalid crossfade. Must be >= 0" << std::endl;
                exit(1);
            }
        }
        else if (arg == "--normalise") {
            config.normalisationEnabled = true;
        }
        else if (arg == "--pregain" && i + 1 < argc) {
            config.normalisationPregain = static_cast<float>(std::atof(argv[++i]));
        }
        else if (arg == "--start" && i + 1 < argc) {
            config.startPositionMs = std::atoi(argv[++i]);
            if (config.startPositionMs < 0) {
                std::cerr << "Invalid start position. Must be >= 0" << std::endl;
                exit(1);
            }
        }
        else if (arg == "--halt-threshold" && i + 1 < argc) {
            config.haltThresholdMs = std::atoi(argv[++i]);
            if (config.haltThresholdMs < 1) {
                std::cerr << "Invalid halt threshold. Must be >= 1" << std::endl;
                exit(1);
            }
        }
        else if (arg == "--version" || arg == "-V") {
            config.showVersion = true;
        }
        else if (arg == "--verbose" || arg == "-v") {
            config.verbose = true;
        }
        else if (arg == "--quiet" || arg == "-q") {
            config.quiet = true;
        }
        else if (arg == "--help" || arg == "-h") {
            printHelp(argv[0]);
            exit(0);
        }
        else if (!arg.empty() && arg[0] == '-' && arg != "-") {
            std::cerr << "Unknown option: " << arg << std::endl;
            std::cerr << "Use --help for usage information" << std::endl;
            exit(1);
        }
        else {
            config.items.push_back(arg);
        }
    }

    return config;
}

// ============================================
// Main
// ============================================

int main(int argc, char* argv[]) {
    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);
    signal(SIGUSR1, skipSignalHandler);
    // A closed pipe is reported by write() instead
    signal(SIGPIPE, SIG_IGN);

    Config config = parseArguments(argc, argv);

    // Apply log level
    if (config.verbose) {
        g_logLevel = LogLevel::DEBUG;
    } else if (config.quiet) {
        g_logLevel = LogLevel::WARN;
    }

    // stdout may carry PCM: everything human readable goes to stderr
    std::cerr << "═══════════════════════════════════════════════════════\n"
              << "  cuetrack v" << CUETRACK_VERSION << "\n"
              << "  Gapless playlist player with crossfade\n"
              << "═══════════════════════════════════════════════════════\n"
              << std::endl;

    if (config.showVersion) {
        std::cerr << "Version:  " << CUETRACK_VERSION << std::endl;
        std::cerr << "Build:    " << __DATE__ << " " << __TIME__ << std::endl;
        std::cerr << "Codecs:  "
#ifdef ENABLE_OGG
                  << " vorbis"
#endif
#ifdef ENABLE_MP3
                  << " mp3"
#endif
                  << std::endl;
        return 0;
    }

    LOG_DEBUG("Verbose mode enabled (log level: DEBUG)");

    Playlist playlist;
    if (!config.playlistPath.empty() && !playlist.loadFile(config.playlistPath)) {
        std::cerr << "Error: Could not read playlist " << config.playlistPath << std::endl;
        return 1;
    }
    for (const auto& item : config.items) {
        playlist.add(item);
    }

    if (playlist.empty()) {
        std::cerr << "Error: Nothing to play (-P <playlist> or locations required)" << std::endl;
        std::cerr << "Use --help for usage information" << std::endl;
        return 1;
    }

    // Print configuration
    std::cerr << "Configuration:" << std::endl;
    std::cerr << "  Items:      " << playlist.size() << std::endl;
    std::cerr << "  Output:     " << (config.output == "-" ? "stdout" : config.output) << std::endl;
    std::cerr << "  Quality:    " << audioQualityName(config.preferredQuality) << std::endl;
    std::cerr << "  Preload:    " << (config.preloadEnabled ? "enabled" : "disabled") << std::endl;
    std::cerr << "  Crossfade:  " << config.crossfadeDurationMs << " ms" << std::endl;
    if (config.normalisationEnabled) {
        std::cerr << "  Normalise:  pregain " << config.normalisationPregain << " dB" << std::endl;
    }
    std::cerr << std::endl;

    AudioFormat format;
    MixingLine line(format);

    PipeSink sink(line, config.output);
    if (!sink.start()) {
        std::cerr << "Error: Could not open output " << config.output << std::endl;
        return 1;
    }

    PlaylistContentLoader loader(playlist, config);
    PlayerContext context{loader, config, Decoder::create};

    QueuePlayer player(context, playlist, line);
    player.start();

    // Wait for the end of the playlist or a shutdown signal
    while (g_running.load(std::memory_order_acquire) && !player.finished()) {
        if (g_skipRequested.exchange(false, std::memory_order_acq_rel)) {
            player.skip();
        }
        if (sink.failed()) {
            LOG_ERROR("Output failed, stopping");
            break;
        }
        player.waitFinished(100);
    }

    // ============================================
    // Final shutdown
    // ============================================

    LOG_INFO("Shutting down...");
    player.stop();
    sink.stop();

    return sink.failed() ? 1 : 0;
}
