/**
 * @file CrossfadeController.h
 * @brief Per-entry fade in / fade out gain curve
 *
 * Durations come from the item's metadata map when present:
 *   audio.fade_in_duration, audio.fade_out_duration, audio.fade_out_start_time
 * and fall back to Config::crossfadeDurationMs. Both fades are linear.
 */

#ifndef CUETRACK_CROSSFADE_CONTROLLER_H
#define CUETRACK_CROSSFADE_CONTROLLER_H

#include "Config.h"

#include <map>
#include <string>

class CrossfadeController {
public:
    CrossfadeController(const std::string& playbackId, int durationMs,
                        const std::map<std::string, std::string>& metadata,
                        const Config& config);

    /**
     * @brief Gain at the given position, in [0,1]
     */
    float gain(int positionMs) const;

    /**
     * @brief Position where the fade out starts (the duration when there is none)
     */
    int fadeOutStartTimeMin() const;

    bool hasAnyFadeOut() const { return m_fadeOutDuration > 0; }

    int fadeInDuration() const { return m_fadeInDuration; }
    int fadeOutDuration() const { return m_fadeOutDuration; }

private:
    static int readInt(const std::map<std::string, std::string>& metadata,
                       const char* key, int fallback);

    int m_durationMs;
    int m_fadeInDuration = 0;
    int m_fadeOutDuration = 0;
    int m_fadeOutStart = 0;
};

#endif // CUETRACK_CROSSFADE_CONTROLLER_H
