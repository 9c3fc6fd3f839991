/**
 * @file PlaybackErrors.cpp
 * @brief Human readable error descriptions
 */

#include "PlaybackErrors.h"

std::string LoadError::describe() const {
    const char* prefix = "load error";
    switch (kind) {
        case Kind::RESTRICTED:   prefix = "restricted"; break;
        case Kind::TRANSPORT:    prefix = "transport"; break;
        case Kind::FORMAT:       prefix = "unsupported format"; break;
        case Kind::RIGHTS:       prefix = "rights"; break;
        case Kind::DECODER_INIT: prefix = "decoder init"; break;
    }
    return std::string(prefix) + ": " + message;
}

std::string PlaybackError::describe() const {
    return std::string(kind == Kind::IO ? "I/O error: " : "decode error: ") + message;
}
