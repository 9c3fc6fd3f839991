/**
 * @file CrossfadeController.cpp
 * @brief Fade curve implementation
 */

#include "CrossfadeController.h"
#include "LogLevel.h"

#include <algorithm>
#include <cerrno>
#include <cstdlib>

CrossfadeController::CrossfadeController(const std::string& playbackId, int durationMs,
                                         const std::map<std::string, std::string>& metadata,
                                         const Config& config)
    : m_durationMs(durationMs)
{
    int fallback = std::max(0, config.crossfadeDurationMs);
    m_fadeInDuration = std::max(0, readInt(metadata, "audio.fade_in_duration", fallback));
    m_fadeOutDuration = std::max(0, readInt(metadata, "audio.fade_out_duration", fallback));

    // Unknown length: there is no end to fade towards
    if (m_durationMs <= 0) m_fadeOutDuration = 0;

    m_fadeOutStart = readInt(metadata, "audio.fade_out_start_time", m_durationMs - m_fadeOutDuration);
    m_fadeOutStart = std::max(0, m_fadeOutStart);

    LOG_DEBUG("[Crossfade] Created {fadeIn: " << m_fadeInDuration
              << ", fadeOut: " << m_fadeOutDuration
              << ", fadeOutStart: " << m_fadeOutStart
              << ", duration: " << m_durationMs
              << ", id: " << playbackId << "}");
}

int CrossfadeController::readInt(const std::map<std::string, std::string>& metadata,
                                 const char* key, int fallback) {
    auto it = metadata.find(key);
    if (it == metadata.end() || it->second.empty()) return fallback;

    errno = 0;
    char* end = nullptr;
    long value = std::strtol(it->second.c_str(), &end, 10);
    if (errno != 0 || *end != '\0') {
        LOG_WARN("[Crossfade] Ignoring invalid " << key << ": " << it->second);
        return fallback;
    }
    return static_cast<int>(value);
}

float CrossfadeController::gain(int positionMs) const {
    float g = 1.0f;

    if (m_fadeInDuration > 0 && positionMs < m_fadeInDuration) {
        g *= static_cast<float>(std::max(0, positionMs)) / m_fadeInDuration;
    }

    if (hasAnyFadeOut() && positionMs >= m_fadeOutStart) {
        float elapsed = static_cast<float>(positionMs - m_fadeOutStart);
        g *= 1.0f - elapsed / m_fadeOutDuration;
    }

    return std::min(1.0f, std::max(0.0f, g));
}

int CrossfadeController::fadeOutStartTimeMin() const {
    return hasAnyFadeOut() ? m_fadeOutStart : m_durationMs;
}
