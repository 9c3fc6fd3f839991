/**
 * @file MixingLine.cpp
 * @brief Two-slot mixer implementation
 */

#include "MixingLine.h"
#include "LogLevel.h"

#include <algorithm>
#include <chrono>
#include <cstring>

// ============================================
// MixingOutput
// ============================================

MixingLine::MixingOutput::MixingOutput(MixingLine& line, const char* name, size_t bufferBytes)
    : m_line(line)
    , m_name(name)
    , m_buffer(bufferBytes)
{
}

void MixingLine::MixingOutput::toggle(bool enabled) {
    if (enabled) {
        m_buffer.open();
    } else {
        m_buffer.close();
    }

    bool was = m_enabled.exchange(enabled, std::memory_order_acq_rel);
    if (was != enabled) {
        LOG_DEBUG("[Mixer] Toggled " << m_name << " " << (enabled ? "on" : "off"));
    }
    m_line.outputToggled();
}

void MixingLine::MixingOutput::clear() {
    m_enabled.store(false, std::memory_order_release);
    m_buffer.close();
    m_buffer.empty();
    m_gain.store(1.0f, std::memory_order_release);
    m_line.outputToggled();
}

void MixingLine::MixingOutput::gain(float g) {
    m_gain.store(std::max(0.0f, std::min(1.0f, g)), std::memory_order_release);
}

bool MixingLine::MixingOutput::write(const uint8_t* data, size_t len) {
    return m_buffer.write(data, len);
}

void MixingLine::MixingOutput::emptyBuffer() {
    m_buffer.empty();
}

// ============================================
// MixingLine
// ============================================

MixingLine::MixingLine(const AudioFormat& format)
    : m_format(format)
    , m_first(*this, "first", format.bytesForMs(BUFFER_MS))
    , m_second(*this, "second", format.bytesForMs(BUFFER_MS))
{
}

MixingLine::MixingOutput& MixingLine::other(const OutputSlot& output) {
    return &output == &m_first ? m_second : m_first;
}

void MixingLine::outputToggled() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_cond.notify_all();
}

size_t MixingLine::read(uint8_t* out, size_t len, int timeoutMs) {
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        bool ready = m_cond.wait_for(lock, std::chrono::milliseconds(timeoutMs), [this] {
            return m_shutdown.load(std::memory_order_acquire) || anyEnabled();
        });
        if (!ready || m_shutdown.load(std::memory_order_acquire)) return 0;
    }

    size_t samples = len / sizeof(int16_t);
    m_scratch.resize(len);
    m_accum.assign(samples, 0);

    for (MixingOutput* output : {&m_first, &m_second}) {
        if (!output->enabled()) continue;

        size_t n = output->m_buffer.readFully(m_scratch.data(), len);
        float g = output->currentGain();
        for (size_t i = 0; i + 1 < n; i += 2) {
            int16_t s = static_cast<int16_t>(m_scratch[i] | (m_scratch[i + 1] << 8));
            m_accum[i / 2] += static_cast<int32_t>(s * g);
        }
    }

    for (size_t i = 0; i < samples; i++) {
        int32_t v = std::max(-32768, std::min(32767, m_accum[i]));
        out[i * 2] = static_cast<uint8_t>(v & 0xFF);
        out[i * 2 + 1] = static_cast<uint8_t>((v >> 8) & 0xFF);
    }
    if (len % 2) out[len - 1] = 0;

    return len;
}

void MixingLine::shutdown() {
    m_shutdown.store(true, std::memory_order_release);
    m_first.m_buffer.shutdown();
    m_second.m_buffer.shutdown();
    outputToggled();
}
