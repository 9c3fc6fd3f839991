/**
 * @file AudioStream.cpp
 * @brief Codec names
 */

#include "AudioStream.h"

const char* codecName(Codec codec) {
    switch (codec) {
        case Codec::VORBIS:  return "VORBIS";
        case Codec::MP3:     return "MP3";
        case Codec::UNKNOWN: return "UNKNOWN";
    }
    return "UNKNOWN";
}
