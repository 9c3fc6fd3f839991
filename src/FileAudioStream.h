/**
 * @file FileAudioStream.h
 * @brief Seekable AudioStream over a local file
 */

#ifndef CUETRACK_FILE_AUDIO_STREAM_H
#define CUETRACK_FILE_AUDIO_STREAM_H

#include "AudioStream.h"

#include <string>

class FileAudioStream : public AudioStream {
public:
    FileAudioStream(std::string path, Codec codec);
    ~FileAudioStream() override;

    /**
     * @brief Open the file read-only
     * @return false with errno preserved on failure
     */
    bool open();

    ssize_t read(uint8_t* buf, size_t maxLen) override;
    bool seekable() const override { return true; }
    int64_t seek(int64_t offset, int whence) override;
    int64_t tell() const override { return m_position; }
    int64_t size() const override { return m_size; }
    Codec codec() const override { return m_codec; }
    std::string describe() const override { return "file:" + m_path; }

private:
    std::string m_path;
    Codec m_codec;
    int m_fd = -1;
    int64_t m_size = -1;
    int64_t m_position = 0;
};

#endif // CUETRACK_FILE_AUDIO_STREAM_H
