/**
 * @file PipeSink.cpp
 * @brief PCM sink thread
 */

#include "PipeSink.h"
#include "LogLevel.h"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <vector>

PipeSink::PipeSink(MixingLine& line, std::string path)
    : m_line(line)
    , m_path(std::move(path))
{
}

PipeSink::~PipeSink() {
    stop();
    if (m_ownsFd && m_fd >= 0) {
        ::close(m_fd);
    }
}

bool PipeSink::start() {
    if (m_path == "-") {
        m_fd = STDOUT_FILENO;
        m_ownsFd = false;
    } else {
        m_fd = ::open(m_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
        if (m_fd < 0) {
            LOG_ERROR("[Sink] Cannot open " << m_path << ": " << strerror(errno));
            return false;
        }
        m_ownsFd = true;
    }

    m_running.store(true, std::memory_order_release);
    m_thread = std::thread(&PipeSink::run, this);

    LOG_DEBUG("[Sink] Writing PCM to " << (m_path == "-" ? "stdout" : m_path));
    return true;
}

void PipeSink::stop() {
    m_running.store(false, std::memory_order_release);
    if (m_thread.joinable()) {
        m_thread.join();
    }
}

bool PipeSink::writeAll(const uint8_t* data, size_t len) {
    while (len > 0) {
        ssize_t n = ::write(m_fd, data, len);
        if (n < 0) {
            if (errno == EINTR) continue;
            LOG_ERROR("[Sink] Write failed: " << strerror(errno));
            return false;
        }
        data += n;
        len -= static_cast<size_t>(n);
    }
    return true;
}

void PipeSink::run() {
    std::vector<uint8_t> block(m_line.format().bytesForMs(BLOCK_MS));

    while (m_running.load(std::memory_order_acquire)) {
        // Short timeout so stop() is noticed while idle
        size_t n = m_line.read(block.data(), block.size(), 100);
        if (n == 0) continue;

        if (!writeAll(block.data(), n)) {
            m_failed.store(true, std::memory_order_release);
            m_line.shutdown();
            break;
        }
        m_bytesWritten.fetch_add(n, std::memory_order_relaxed);
    }

    LOG_DEBUG("[Sink] Stopped after " << m_bytesWritten.load() << " bytes");
}
