/**
 * @file AudioFormat.h
 * @brief PCM format shared by decoders, the mixing line and the sink
 *
 * Everything past the decoder is signed 16-bit little-endian interleaved.
 */

#ifndef CUETRACK_AUDIO_FORMAT_H
#define CUETRACK_AUDIO_FORMAT_H

#include <cstdint>
#include <cstddef>

struct AudioFormat {
    uint32_t sampleRate = 44100;
    uint32_t channels = 2;
    uint32_t bitDepth = 16;

    size_t frameSize() const { return channels * (bitDepth / 8); }

    // Bytes needed for the given duration
    size_t bytesForMs(int ms) const {
        return static_cast<size_t>(static_cast<uint64_t>(sampleRate) * ms / 1000) * frameSize();
    }

    bool operator==(const AudioFormat& o) const {
        return sampleRate == o.sampleRate && channels == o.channels && bitDepth == o.bitDepth;
    }
    bool operator!=(const AudioFormat& o) const { return !(*this == o); }
};

#endif // CUETRACK_AUDIO_FORMAT_H
