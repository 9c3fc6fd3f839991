/**
 * @file PlaybackErrors.h
 * @brief Error values reported by loaders, decoders and playback entries
 */

#ifndef CUETRACK_PLAYBACK_ERRORS_H
#define CUETRACK_PLAYBACK_ERRORS_H

#include <string>

/**
 * @brief Why content could not be loaded
 *
 * RESTRICTED will not change with a retry; the others may.
 */
struct LoadError {
    enum class Kind {
        RESTRICTED,     // content not available to this client
        TRANSPORT,      // network or file access failure
        FORMAT,         // unsupported or unrecognised encoding
        RIGHTS,         // licensing / key retrieval failure
        DECODER_INIT    // decoder rejected the stream headers
    };

    Kind kind = Kind::TRANSPORT;
    std::string message;

    LoadError() = default;
    LoadError(Kind k, std::string msg) : kind(k), message(std::move(msg)) {}

    std::string describe() const;
};

/**
 * @brief Why playback of a loaded item had to stop
 */
struct PlaybackError {
    enum class Kind {
        DECODE,         // malformed data
        IO              // reading the stream or writing the output failed
    };

    Kind kind = Kind::DECODE;
    std::string message;

    PlaybackError() = default;
    PlaybackError(Kind k, std::string msg) : kind(k), message(std::move(msg)) {}

    std::string describe() const;
};

#endif // CUETRACK_PLAYBACK_ERRORS_H
