/**
 * @file NormalizationData.h
 * @brief Replay gain values delivered with a stream
 */

#ifndef CUETRACK_NORMALIZATION_DATA_H
#define CUETRACK_NORMALIZATION_DATA_H

#include "Config.h"

struct NormalizationData {
    float trackGainDb = 0.0f;
    float trackPeak = 1.0f;
    float albumGainDb = 0.0f;
    float albumPeak = 1.0f;

    /**
     * @brief Linear factor to apply to every sample
     *
     * 10^((trackGain + pregain) / 20), lowered to 1 / trackPeak when the
     * result would clip. 1.0 when normalisation is disabled.
     */
    float factor(const Config& config) const;
};

#endif // CUETRACK_NORMALIZATION_DATA_H
