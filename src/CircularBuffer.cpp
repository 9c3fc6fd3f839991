/**
 * @file CircularBuffer.cpp
 * @brief Blocking ring buffer implementation
 */

#include "CircularBuffer.h"

#include <algorithm>
#include <cstring>

CircularBuffer::CircularBuffer(size_t capacity)
    : m_data(capacity > 0 ? capacity : 1)
{
}

bool CircularBuffer::write(const uint8_t* data, size_t len) {
    std::unique_lock<std::mutex> lock(m_mutex);

    while (len > 0) {
        m_notFull.wait(lock, [this] {
            return m_shutdown || m_closed || m_count < m_data.size();
        });
        if (m_shutdown) return false;
        if (m_closed) return true;

        size_t writePos = (m_readPos + m_count) % m_data.size();
        size_t space = m_data.size() - m_count;
        size_t toCopy = std::min({len, space, m_data.size() - writePos});

        std::memcpy(m_data.data() + writePos, data, toCopy);
        m_count += toCopy;
        data += toCopy;
        len -= toCopy;

        m_notEmpty.notify_all();
    }

    return true;
}

size_t CircularBuffer::copyOut(uint8_t* out, size_t len) {
    size_t total = std::min(len, m_count);
    size_t done = 0;
    while (done < total) {
        size_t toCopy = std::min(total - done, m_data.size() - m_readPos);
        std::memcpy(out + done, m_data.data() + m_readPos, toCopy);
        m_readPos = (m_readPos + toCopy) % m_data.size();
        done += toCopy;
    }

    m_count -= total;
    if (total > 0) m_notFull.notify_all();
    return total;
}

size_t CircularBuffer::readFully(uint8_t* out, size_t len) {
    std::unique_lock<std::mutex> lock(m_mutex);

    // Never wait for more than fits
    size_t want = std::min(len, m_data.size());
    m_notEmpty.wait(lock, [&] {
        return m_closed || m_shutdown || m_count >= want;
    });

    return copyOut(out, len);
}

size_t CircularBuffer::readAvailable(uint8_t* out, size_t len) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return copyOut(out, len);
}

void CircularBuffer::empty() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_readPos = 0;
    m_count = 0;
    m_notFull.notify_all();
}

void CircularBuffer::open() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_closed = false;
}

void CircularBuffer::close() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_closed = true;
    m_notFull.notify_all();
    m_notEmpty.notify_all();
}

void CircularBuffer::shutdown() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_shutdown = true;
    m_notFull.notify_all();
    m_notEmpty.notify_all();
}

size_t CircularBuffer::available() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_count;
}
