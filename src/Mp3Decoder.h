/**
 * @file Mp3Decoder.h
 * @brief MP3 decoder using libmpg123
 *
 * Uses mpg123 with a replaced reader so it pulls directly from the owned
 * AudioStream:
 * - the lseek callback is installed only for seekable streams
 * - writeSomeTo() pulls one mpg123_read() block of S16_LE samples
 *
 * Handles ID3v2 tags, VBR streams, and automatic resync on errors.
 */

#ifndef CUETRACK_MP3_DECODER_H
#define CUETRACK_MP3_DECODER_H

#include "Decoder.h"
#include <mpg123.h>
#include <mutex>

class Mp3Decoder : public Decoder {
public:
    Mp3Decoder(std::unique_ptr<AudioStream> in, const AudioFormat& format,
               float normalizationFactor, int durationMs);
    ~Mp3Decoder() override;

    /**
     * @brief Create the handle, parse the first frame and check its format
     */
    bool open(LoadError& error);

    void seek(int positionMs) override;
    int writeSomeTo(SampleStream& out, PlaybackError& error) override;
    const char* name() const override { return "mp3"; }

private:
    static ssize_t readCallback(void* handle, void* buf, size_t count);
    static off_t lseekCallback(void* handle, off_t offset, int whence);

    bool checkFormat();
    void updateTime();

    mpg123_handle* m_handle = nullptr;
    bool m_readFailed = false;  // set by readCallback, separates I/O from decode faults

    static std::once_flag s_initFlag;
};

#endif // CUETRACK_MP3_DECODER_H
