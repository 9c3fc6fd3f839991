/**
 * @file Decoder.h
 * @brief Abstract decoder interface for playback entries
 *
 * A decoder owns the encoded AudioStream it was created with and pulls from
 * it on demand. All decoders emit S16_LE interleaved PCM in the output
 * AudioFormat, scaled by the normalisation factor.
 */

#ifndef CUETRACK_DECODER_H
#define CUETRACK_DECODER_H

#include "AudioFormat.h"
#include "AudioStream.h"
#include "Config.h"
#include "NormalizationData.h"
#include "OutputSlot.h"
#include "PlaybackErrors.h"

#include <atomic>
#include <climits>
#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

class Decoder {
public:
    static constexpr int END_OF_STREAM = -1;
    static constexpr int WRITE_FAILED = -2;

    virtual ~Decoder() = default;

    // Non-copyable
    Decoder(const Decoder&) = delete;
    Decoder& operator=(const Decoder&) = delete;

    /**
     * @brief Current playback position in milliseconds
     *
     * Safe to call from any thread.
     * @return false if the position cannot be determined
     */
    bool time(int& outMs) const;

    /**
     * @brief Reposition to the given time (called from the playback thread)
     */
    virtual void seek(int positionMs) = 0;

    /**
     * @brief Decode one block and write it to the stream
     * @return Bytes written (may be 0), END_OF_STREAM, or WRITE_FAILED with error set
     */
    virtual int writeSomeTo(SampleStream& out, PlaybackError& error) = 0;

    virtual const char* name() const = 0;

    int durationMs() const { return m_durationMs; }
    const AudioFormat& format() const { return m_format; }

    /**
     * @brief Create and open the decoder matching the stream's codec
     * @return Decoder instance, or nullptr with error set (FORMAT for an
     *         unsupported codec, DECODER_INIT if the headers are rejected)
     */
    static std::unique_ptr<Decoder> create(Codec codec, std::unique_ptr<AudioStream> in,
                                           const AudioFormat& format,
                                           const NormalizationData& normalization,
                                           const Config& config, int durationMs,
                                           LoadError& error);

protected:
    Decoder(std::unique_ptr<AudioStream> in, const AudioFormat& format,
            float normalizationFactor, int durationMs);

    // True if a stream with this layout can be written without conversion
    bool matchesOutput(long rate, int channels) const {
        return rate > 0 && channels > 0 &&
               static_cast<uint32_t>(rate) == m_format.sampleRate &&
               static_cast<uint32_t>(channels) == m_format.channels;
    }

    void setTime(int ms) { m_timeMs.store(ms, std::memory_order_release); }
    void setTimeUnavailable() { m_timeMs.store(TIME_UNAVAILABLE, std::memory_order_release); }

    /**
     * @brief Scale samples by the normalisation factor and write them as S16_LE
     * @return Bytes written, or WRITE_FAILED with error set
     */
    int writePcm(SampleStream& out, const int16_t* samples, size_t count, PlaybackError& error);

    std::unique_ptr<AudioStream> m_in;
    AudioFormat m_format;
    float m_normalizationFactor;
    int m_durationMs;

private:
    static constexpr int TIME_UNAVAILABLE = INT_MIN;

    std::atomic<int> m_timeMs{0};
    std::vector<uint8_t> m_writeBuffer;
};

using DecoderFactory = std::function<std::unique_ptr<Decoder>(
    Codec, std::unique_ptr<AudioStream>, const AudioFormat&,
    const NormalizationData&, const Config&, int, LoadError&)>;

#endif // CUETRACK_DECODER_H
