/**
 * @file NormalizationData.cpp
 * @brief Replay gain factor computation
 */

#include "NormalizationData.h"
#include "LogLevel.h"

#include <cmath>

float NormalizationData::factor(const Config& config) const {
    if (!config.normalisationEnabled) return 1.0f;

    float normalisationFactor = std::pow(10.0f, (trackGainDb + config.normalisationPregain) / 20.0f);
    if (trackPeak > 0.0f && normalisationFactor * trackPeak > 1.0f) {
        LOG_DEBUG("[Norm] Reducing factor to prevent clipping (peak=" << trackPeak << ")");
        normalisationFactor = 1.0f / trackPeak;
    }

    return normalisationFactor;
}
