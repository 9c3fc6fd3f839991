/**
 * @file PipeSink.h
 * @brief Drains the mixing line into stdout or a file
 *
 * Raw S16_LE interleaved PCM, no header, e.g.
 *   cuetrack -P list.m3u | aplay -f cd
 */

#ifndef CUETRACK_PIPE_SINK_H
#define CUETRACK_PIPE_SINK_H

#include "MixingLine.h"

#include <atomic>
#include <cstdint>
#include <string>
#include <thread>

class PipeSink {
public:
    // Block handed to the sink per read of the line
    static constexpr int BLOCK_MS = 20;

    /**
     * @param path "-" for stdout, otherwise a file created or truncated
     */
    PipeSink(MixingLine& line, std::string path);
    ~PipeSink();

    // Non-copyable
    PipeSink(const PipeSink&) = delete;
    PipeSink& operator=(const PipeSink&) = delete;

    // Open the destination and start the drain thread
    bool start();

    // Stop the drain thread; the line is shut down if writing failed
    void stop();

    // Writing to the destination failed; playback cannot continue
    bool failed() const { return m_failed.load(std::memory_order_acquire); }

    uint64_t bytesWritten() const { return m_bytesWritten.load(std::memory_order_relaxed); }

private:
    void run();
    bool writeAll(const uint8_t* data, size_t len);

    MixingLine& m_line;
    std::string m_path;
    int m_fd = -1;
    bool m_ownsFd = false;

    std::thread m_thread;
    std::atomic<bool> m_running{false};
    std::atomic<bool> m_failed{false};
    std::atomic<uint64_t> m_bytesWritten{0};
};

#endif // CUETRACK_PIPE_SINK_H
