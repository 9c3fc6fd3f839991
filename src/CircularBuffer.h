/**
 * @file CircularBuffer.h
 * @brief Blocking byte ring buffer between one writer and one reader
 *
 * write() blocks while the buffer is full. A closed buffer drops writes and
 * releases blocked writers; a shut down buffer fails them. readFully()
 * blocks until the requested amount is buffered or the buffer is closed.
 */

#ifndef CUETRACK_CIRCULAR_BUFFER_H
#define CUETRACK_CIRCULAR_BUFFER_H

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <vector>

class CircularBuffer {
public:
    explicit CircularBuffer(size_t capacity);

    // Non-copyable
    CircularBuffer(const CircularBuffer&) = delete;
    CircularBuffer& operator=(const CircularBuffer&) = delete;

    /**
     * @brief Append bytes, blocking while full
     * @return false once shut down; true otherwise (including dropped writes)
     */
    bool write(const uint8_t* data, size_t len);

    /**
     * @brief Copy up to len bytes, waiting until len are buffered or closed
     * @return Bytes copied
     */
    size_t readFully(uint8_t* out, size_t len);

    // Copy what is buffered right now, without waiting
    size_t readAvailable(uint8_t* out, size_t len);

    // Discard buffered bytes
    void empty();

    void open();
    void close();

    // Permanent: writers fail from now on
    void shutdown();

    size_t available() const;
    size_t capacity() const { return m_data.size(); }

private:
    size_t copyOut(uint8_t* out, size_t len);

    std::vector<uint8_t> m_data;
    size_t m_readPos = 0;
    size_t m_count = 0;
    bool m_closed = true;
    bool m_shutdown = false;

    mutable std::mutex m_mutex;
    std::condition_variable m_notFull;
    std::condition_variable m_notEmpty;
};

#endif // CUETRACK_CIRCULAR_BUFFER_H
