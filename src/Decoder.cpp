/**
 * @file Decoder.cpp
 * @brief Decoder factory and shared PCM output path
 */

#include "Decoder.h"
#include "LogLevel.h"

#ifdef ENABLE_MP3
#include "Mp3Decoder.h"
#endif
#ifdef ENABLE_OGG
#include "VorbisDecoder.h"
#endif

#include <algorithm>
#include <cmath>

Decoder::Decoder(std::unique_ptr<AudioStream> in, const AudioFormat& format,
                 float normalizationFactor, int durationMs)
    : m_in(std::move(in))
    , m_format(format)
    , m_normalizationFactor(normalizationFactor)
    , m_durationMs(durationMs)
{
}

bool Decoder::time(int& outMs) const {
    int t = m_timeMs.load(std::memory_order_acquire);
    if (t == TIME_UNAVAILABLE) return false;
    outMs = t;
    return true;
}

int Decoder::writePcm(SampleStream& out, const int16_t* samples, size_t count,
                      PlaybackError& error) {
    m_writeBuffer.resize(count * 2);

    bool scale = m_normalizationFactor != 1.0f;
    for (size_t i = 0; i < count; i++) {
        int32_t s = samples[i];
        if (scale) {
            s = static_cast<int32_t>(std::lround(s * m_normalizationFactor));
            s = std::max(-32768, std::min(32767, s));
        }
        // S16_LE
        m_writeBuffer[i * 2] = static_cast<uint8_t>(s & 0xFF);
        m_writeBuffer[i * 2 + 1] = static_cast<uint8_t>((s >> 8) & 0xFF);
    }

    if (!out.write(m_writeBuffer.data(), m_writeBuffer.size())) {
        error = PlaybackError(PlaybackError::Kind::IO, "output stream write failed");
        return WRITE_FAILED;
    }
    return static_cast<int>(m_writeBuffer.size());
}

std::unique_ptr<Decoder> Decoder::create(Codec codec, std::unique_ptr<AudioStream> in,
                                         const AudioFormat& format,
                                         const NormalizationData& normalization,
                                         const Config& config, int durationMs,
                                         LoadError& error) {
    float factor = normalization.factor(config);

    switch (codec) {
#ifdef ENABLE_OGG
        case Codec::VORBIS: {
            auto decoder = std::make_unique<VorbisDecoder>(std::move(in), format, factor, durationMs);
            if (!decoder->open(error)) return nullptr;
            return decoder;
        }
#endif
#ifdef ENABLE_MP3
        case Codec::MP3: {
            auto decoder = std::make_unique<Mp3Decoder>(std::move(in), format, factor, durationMs);
            if (!decoder->open(error)) return nullptr;
            return decoder;
        }
#endif
        default:
            error = LoadError(LoadError::Kind::FORMAT,
                              std::string("unsupported codec ") + codecName(codec));
            return nullptr;
    }
}
