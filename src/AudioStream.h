/**
 * @file AudioStream.h
 * @brief Encoded input stream handed from the content loader to a decoder
 */

#ifndef CUETRACK_AUDIO_STREAM_H
#define CUETRACK_AUDIO_STREAM_H

#include <cstdint>
#include <cstddef>
#include <string>
#include <sys/types.h>

enum class Codec { VORBIS, MP3, UNKNOWN };

const char* codecName(Codec codec);

/**
 * @brief Receives stall notifications from a stream that fetches remotely
 *
 * Times are steady-clock milliseconds.
 */
class HaltListener {
public:
    virtual ~HaltListener() = default;

    virtual void streamReadHalted(int chunk, int64_t timeMs) = 0;
    virtual void streamReadResumed(int chunk, int64_t timeMs) = 0;
};

class AudioStream {
public:
    virtual ~AudioStream() = default;

    // Non-copyable
    AudioStream() = default;
    AudioStream(const AudioStream&) = delete;
    AudioStream& operator=(const AudioStream&) = delete;

    /**
     * @brief Read encoded bytes (blocking)
     * @return Bytes read, 0 = EOF, -1 = error
     */
    virtual ssize_t read(uint8_t* buf, size_t maxLen) = 0;

    virtual bool seekable() const = 0;

    /**
     * @brief Reposition (lseek semantics)
     * @return New absolute offset, or -1 if unsupported/failed
     */
    virtual int64_t seek(int64_t offset, int whence) = 0;

    virtual int64_t tell() const = 0;

    // Total size in bytes, -1 if unknown
    virtual int64_t size() const = 0;

    virtual Codec codec() const = 0;

    virtual std::string describe() const = 0;
};

#endif // CUETRACK_AUDIO_STREAM_H
