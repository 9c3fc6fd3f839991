/**
 * @file FileAudioStream.cpp
 * @brief Local file stream implementation
 */

#include "FileAudioStream.h"
#include "LogLevel.h"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

FileAudioStream::FileAudioStream(std::string path, Codec codec)
    : m_path(std::move(path))
    , m_codec(codec)
{
}

FileAudioStream::~FileAudioStream() {
    if (m_fd >= 0) {
        ::close(m_fd);
    }
}

bool FileAudioStream::open() {
    m_fd = ::open(m_path.c_str(), O_RDONLY | O_CLOEXEC);
    if (m_fd < 0) {
        return false;
    }

    struct stat st{};
    if (fstat(m_fd, &st) == 0 && S_ISREG(st.st_mode)) {
        m_size = static_cast<int64_t>(st.st_size);
    }

    LOG_DEBUG("[Loader] Opened " << m_path << " (" << m_size << " bytes)");
    return true;
}

ssize_t FileAudioStream::read(uint8_t* buf, size_t maxLen) {
    if (m_fd < 0) return -1;

    while (true) {
        ssize_t n = ::read(m_fd, buf, maxLen);
        if (n >= 0) {
            m_position += n;
            return n;
        }
        if (errno == EINTR) continue;

        LOG_ERROR("[Loader] Read error on " << m_path << ": " << strerror(errno));
        return -1;
    }
}

int64_t FileAudioStream::seek(int64_t offset, int whence) {
    if (m_fd < 0) return -1;

    off_t pos = ::lseek(m_fd, static_cast<off_t>(offset), whence);
    if (pos < 0) {
        LOG_WARN("[Loader] Seek failed on " << m_path << ": " << strerror(errno));
        return -1;
    }

    m_position = static_cast<int64_t>(pos);
    return m_position;
}
