/**
 * @file Config.cpp
 * @brief Configuration helpers
 */

#include "Config.h"

const char* audioQualityName(AudioQuality quality) {
    switch (quality) {
        case AudioQuality::NORMAL:    return "normal";
        case AudioQuality::HIGH:      return "high";
        case AudioQuality::VERY_HIGH: return "very-high";
    }
    return "unknown";
}
