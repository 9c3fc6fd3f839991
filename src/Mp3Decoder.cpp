/**
 * @file Mp3Decoder.cpp
 * @brief MP3 decoder implementation using libmpg123
 *
 * Key design: mpg123 reader-handle mode.
 * - mpg123_open_handle() binds the decoder to our read/lseek callbacks
 * - mpg123_read() pulls decoded PCM, MPG123_DONE marks the end of the stream
 * - MPG123_NEW_FORMAT is re-checked against the output format
 * - Error recovery is automatic (mpg123 resyncs on corrupted frames)
 *
 * Output: MPG123_ENC_SIGNED_16 at every rate, so mpg123 reports the native
 * layout instead of resampling; a layout other than the output format is
 * rejected at open.
 */

#include "Mp3Decoder.h"
#include "LogLevel.h"

#include <cstring>

std::once_flag Mp3Decoder::s_initFlag;

Mp3Decoder::Mp3Decoder(std::unique_ptr<AudioStream> in, const AudioFormat& format,
                       float normalizationFactor, int durationMs)
    : Decoder(std::move(in), format, normalizationFactor, durationMs)
{
    // Global mpg123 init (thread-safe, once)
    std::call_once(s_initFlag, [] {
        mpg123_init();
    });
}

Mp3Decoder::~Mp3Decoder() {
    if (m_handle) {
        mpg123_close(m_handle);
        mpg123_delete(m_handle);
    }
}

ssize_t Mp3Decoder::readCallback(void* handle, void* buf, size_t count) {
    auto* self = static_cast<Mp3Decoder*>(handle);
    ssize_t n = self->m_in->read(static_cast<uint8_t*>(buf), count);
    if (n < 0) self->m_readFailed = true;
    return n;
}

off_t Mp3Decoder::lseekCallback(void* handle, off_t offset, int whence) {
    auto* self = static_cast<Mp3Decoder*>(handle);
    return static_cast<off_t>(self->m_in->seek(offset, whence));
}

bool Mp3Decoder::open(LoadError& error) {
    int err;
    m_handle = mpg123_new(nullptr, &err);
    if (!m_handle) {
        LOG_ERROR("[MP3] Failed to create decoder: " << mpg123_plain_strerror(err));
        error = LoadError(LoadError::Kind::DECODER_INIT, mpg123_plain_strerror(err));
        return false;
    }

    mpg123_param(m_handle, MPG123_ADD_FLAGS, MPG123_QUIET, 0.0);

    if (mpg123_replace_reader_handle(m_handle, readCallback,
                                     m_in->seekable() ? lseekCallback : nullptr,
                                     nullptr) != MPG123_OK) {
        LOG_ERROR("[MP3] Failed to install reader: " << mpg123_strerror(m_handle));
        error = LoadError(LoadError::Kind::DECODER_INIT, mpg123_strerror(m_handle));
        return false;
    }

    // Signed 16-bit only, native rate and channels
    mpg123_format_none(m_handle);
    const long* rates = nullptr;
    size_t rateCount = 0;
    mpg123_rates(&rates, &rateCount);
    for (size_t i = 0; i < rateCount; i++) {
        mpg123_format(m_handle, rates[i], MPG123_MONO | MPG123_STEREO, MPG123_ENC_SIGNED_16);
    }

    if (mpg123_open_handle(m_handle, this) != MPG123_OK) {
        LOG_ERROR("[MP3] Failed to open " << m_in->describe() << ": " << mpg123_strerror(m_handle));
        error = LoadError(LoadError::Kind::DECODER_INIT, mpg123_strerror(m_handle));
        return false;
    }

    // Parses up to the first frame
    if (!checkFormat()) {
        error = LoadError(LoadError::Kind::DECODER_INIT,
                          "stream format does not match the output format");
        return false;
    }

    LOG_INFO("[MP3] Format: " << m_format.sampleRate << " Hz, " << m_format.channels << " ch"
             << (m_in->seekable() ? "" : " (non-seekable)"));
    updateTime();
    return true;
}

bool Mp3Decoder::checkFormat() {
    long rate = 0;
    int ch = 0;
    int encoding = 0;
    if (mpg123_getformat(m_handle, &rate, &ch, &encoding) != MPG123_OK) {
        LOG_ERROR("[MP3] No usable format: " << mpg123_strerror(m_handle));
        return false;
    }

    if (!matchesOutput(rate, ch) || encoding != MPG123_ENC_SIGNED_16) {
        LOG_ERROR("[MP3] Stream is " << rate << " Hz, " << ch << " ch; output is "
                  << m_format.sampleRate << " Hz, " << m_format.channels << " ch");
        return false;
    }
    return true;
}

void Mp3Decoder::updateTime() {
    off_t sample = mpg123_tell(m_handle);
    if (sample < 0) {
        setTimeUnavailable();
        return;
    }
    setTime(static_cast<int>(static_cast<int64_t>(sample) * 1000 / m_format.sampleRate));
}

void Mp3Decoder::seek(int positionMs) {
    off_t target = static_cast<off_t>(static_cast<int64_t>(positionMs) * m_format.sampleRate / 1000);
    off_t ret = mpg123_seek(m_handle, target, SEEK_SET);
    if (ret < 0) {
        LOG_WARN("[MP3] Seek to " << positionMs << " ms failed: " << mpg123_strerror(m_handle));
        return;
    }
    updateTime();
}

int Mp3Decoder::writeSomeTo(SampleStream& out, PlaybackError& error) {
    // One MPEG frame is at most 1152 frames * 2 ch * 2 bytes
    int16_t samples[1152 * 2];
    size_t done = 0;

    int ret = mpg123_read(m_handle, reinterpret_cast<unsigned char*>(samples),
                          sizeof(samples), &done);

    if (ret == MPG123_NEW_FORMAT && !checkFormat()) {
        error = PlaybackError(PlaybackError::Kind::DECODE, "stream changed format mid-play");
        return WRITE_FAILED;
    }

    if (ret == MPG123_ERR) {
        if (m_readFailed) {
            error = PlaybackError(PlaybackError::Kind::IO, "read from " + m_in->describe() + " failed");
        } else {
            error = PlaybackError(PlaybackError::Kind::DECODE, mpg123_strerror(m_handle));
        }
        return WRITE_FAILED;
    }

    if (done == 0) {
        if (ret == MPG123_DONE) return END_OF_STREAM;
        return 0;
    }

    updateTime();
    return writePcm(out, samples, done / sizeof(int16_t), error);
}
