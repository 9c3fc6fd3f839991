/**
 * @file MixingLine.h
 * @brief Two-slot PCM mixer feeding the sink
 *
 * Each playback entry writes into one of the two outputs; during a
 * crossfade both are enabled and read() sums them, each scaled by its gain
 * and clamped to 16 bits. An output shorter than the requested block is
 * padded with silence.
 */

#ifndef CUETRACK_MIXING_LINE_H
#define CUETRACK_MIXING_LINE_H

#include "AudioFormat.h"
#include "CircularBuffer.h"
#include "OutputSlot.h"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <vector>

class MixingLine {
public:
    class MixingOutput : public OutputSlot, public SampleStream {
    public:
        MixingOutput(MixingLine& line, const char* name, size_t bufferBytes);

        // OutputSlot
        void toggle(bool enabled) override;
        void clear() override;
        void gain(float g) override;
        SampleStream& stream() override { return *this; }

        // SampleStream
        bool write(const uint8_t* data, size_t len) override;
        void emptyBuffer() override;

        bool enabled() const { return m_enabled.load(std::memory_order_acquire); }
        float currentGain() const { return m_gain.load(std::memory_order_acquire); }
        const char* name() const { return m_name; }

    private:
        friend class MixingLine;

        MixingLine& m_line;
        const char* m_name;
        CircularBuffer m_buffer;
        std::atomic<bool> m_enabled{false};
        std::atomic<float> m_gain{1.0f};
    };

    // Audio buffered per output; dropped when the output is cleared
    static constexpr int BUFFER_MS = 50;

    explicit MixingLine(const AudioFormat& format);

    // Non-copyable
    MixingLine(const MixingLine&) = delete;
    MixingLine& operator=(const MixingLine&) = delete;

    MixingOutput& firstOut() { return m_first; }
    MixingOutput& secondOut() { return m_second; }

    // The output that is not the given one
    MixingOutput& other(const OutputSlot& output);

    /**
     * @brief Mix the next block
     *
     * Waits up to timeoutMs for an output to be enabled, then until every
     * enabled output has delivered len bytes (or been disabled).
     * @return len, or 0 if nothing was enabled in time or the line is shut down
     */
    size_t read(uint8_t* out, size_t len, int timeoutMs);

    // Fail every writer and stop reads
    void shutdown();

    const AudioFormat& format() const { return m_format; }

private:
    void outputToggled();
    bool anyEnabled() const { return m_first.enabled() || m_second.enabled(); }

    AudioFormat m_format;
    MixingOutput m_first;
    MixingOutput m_second;

    std::mutex m_mutex;
    std::condition_variable m_cond;
    std::atomic<bool> m_shutdown{false};

    std::vector<uint8_t> m_scratch;
    std::vector<int32_t> m_accum;
};

#endif // CUETRACK_MIXING_LINE_H
