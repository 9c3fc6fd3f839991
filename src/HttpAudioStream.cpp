/**
 * @file HttpAudioStream.cpp
 * @brief HTTP audio stream implementation
 */

#include "HttpAudioStream.h"
#include "LogLevel.h"

#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <netdb.h>
#include <unistd.h>
#include <poll.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>

static int64_t steadyNowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
}

HttpAudioStream::HttpAudioStream(std::string url, Codec codec, int haltThresholdMs,
                                 HaltListener* haltListener, int readTimeoutMs)
    : m_url(std::move(url))
    , m_codec(codec)
    , m_haltThresholdMs(haltThresholdMs > 0 ? haltThresholdMs : 1000)
    , m_haltListener(haltListener)
    , m_readTimeoutMs(readTimeoutMs > 0 ? readTimeoutMs : READ_TIMEOUT_MS)
{
}

HttpAudioStream::~HttpAudioStream() {
    disconnect();
}

bool HttpAudioStream::parseUrl(const std::string& url, std::string& host, uint16_t& port,
                               std::string& path) {
    static const std::string scheme = "http://";
    if (url.compare(0, scheme.size(), scheme) != 0) return false;

    size_t hostStart = scheme.size();
    size_t pathStart = url.find('/', hostStart);
    std::string authority = url.substr(hostStart, pathStart == std::string::npos
                                                      ? std::string::npos
                                                      : pathStart - hostStart);
    path = pathStart == std::string::npos ? "/" : url.substr(pathStart);

    size_t colon = authority.rfind(':');
    if (colon != std::string::npos) {
        std::string portStr = authority.substr(colon + 1);
        if (portStr.empty() ||
            !std::all_of(portStr.begin(), portStr.end(), [](unsigned char c) { return std::isdigit(c); })) {
            return false;
        }
        long p = std::strtol(portStr.c_str(), nullptr, 10);
        if (p <= 0 || p > 65535) return false;
        port = static_cast<uint16_t>(p);
        host = authority.substr(0, colon);
    } else {
        port = 80;
        host = authority;
    }

    return !host.empty();
}

bool HttpAudioStream::open() {
    std::string host;
    std::string path;
    uint16_t port = 0;
    if (!parseUrl(m_url, host, port, path)) {
        LOG_ERROR("[HTTP] Invalid URL: " << m_url);
        return false;
    }

    struct addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    struct addrinfo* res = nullptr;
    int rc = getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &res);
    if (rc != 0) {
        LOG_ERROR("[HTTP] Cannot resolve " << host << ": " << gai_strerror(rc));
        return false;
    }

    LOG_DEBUG("[HTTP] Connecting to " << host << ":" << port);

    for (struct addrinfo* ai = res; ai != nullptr; ai = ai->ai_next) {
        m_socket = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (m_socket < 0) continue;

        if (::connect(m_socket, ai->ai_addr, ai->ai_addrlen) == 0) break;

        ::close(m_socket);
        m_socket = -1;
    }
    freeaddrinfo(res);

    if (m_socket < 0) {
        LOG_ERROR("[HTTP] Connection to " << host << ":" << port << " failed: " << strerror(errno));
        return false;
    }

    // TCP_NODELAY for responsiveness
    int flag = 1;
    setsockopt(m_socket, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag));

    // Larger receive buffer for streaming
    int rcvBuf = 256 * 1024;
    setsockopt(m_socket, SOL_SOCKET, SO_RCVBUF, &rcvBuf, sizeof(rcvBuf));

    std::string request = "GET " + path + " HTTP/1.0\r\n"
                          "Host: " + host + "\r\n"
                          "User-Agent: cuetrack\r\n"
                          "Icy-MetaData: 1\r\n"
                          "Connection: close\r\n\r\n";

    if (!sendAll(request.c_str(), request.size())) {
        LOG_ERROR("[HTTP] Failed to send request");
        disconnect();
        return false;
    }

    if (!parseResponseHeaders()) {
        disconnect();
        return false;
    }

    if (m_httpStatus != 200) {
        LOG_WARN("[HTTP] Unexpected status " << m_httpStatus << " for " << m_url);
        disconnect();
        return false;
    }

    LOG_DEBUG("[HTTP] Stream connected (status " << m_httpStatus << ", length "
              << m_contentLength << ")");
    return true;
}

void HttpAudioStream::disconnect() {
    if (m_socket >= 0) {
        shutdown(m_socket, SHUT_RDWR);
        ::close(m_socket);
        m_socket = -1;
    }
}

bool HttpAudioStream::waitReadable() {
    int64_t stalledSince = steadyNowMs();

    while (true) {
        struct pollfd pfd;
        pfd.fd = m_socket;
        pfd.events = POLLIN;
        pfd.revents = 0;

        int ready = poll(&pfd, 1, m_haltThresholdMs);
        if (ready < 0) {
            if (errno == EINTR) continue;
            LOG_ERROR("[HTTP] Poll error: " << strerror(errno));
            return false;
        }

        int64_t now = steadyNowMs();
        if (ready > 0) {
            if (m_halted) {
                m_halted = false;
                LOG_DEBUG("[HTTP] Read resumed at chunk " << currentChunk());
                if (m_haltListener) m_haltListener->streamReadResumed(currentChunk(), now);
            }
            // POLLHUP with pending data still reads; recv reports the end
            return true;
        }

        if (!m_halted && now - stalledSince >= m_haltThresholdMs) {
            m_halted = true;
            LOG_DEBUG("[HTTP] Read halted at chunk " << currentChunk());
            if (m_haltListener) m_haltListener->streamReadHalted(currentChunk(), now);
        }

        if (now - stalledSince >= m_readTimeoutMs) {
            LOG_ERROR("[HTTP] No data for " << m_readTimeoutMs << " ms from " << m_url);
            return false;
        }
    }
}

ssize_t HttpAudioStream::readRaw(uint8_t* buf, size_t maxLen) {
    if (!waitReadable()) return -1;

    while (true) {
        ssize_t n = recv(m_socket, buf, maxLen, 0);
        if (n >= 0) return n;
        if (errno == EINTR) continue;

        LOG_ERROR("[HTTP] Read error: " << strerror(errno));
        return -1;
    }
}

bool HttpAudioStream::skipIcyMetadata() {
    // 1 byte: metadata length / 16
    uint8_t lenByte = 0;
    ssize_t n = readRaw(&lenByte, 1);
    if (n != 1) return false;

    size_t remaining = static_cast<size_t>(lenByte) * 16;
    uint8_t discardBuf[256];
    while (remaining > 0) {
        n = readRaw(discardBuf, std::min(remaining, sizeof(discardBuf)));
        if (n <= 0) return false;
        remaining -= static_cast<size_t>(n);
    }

    return true;
}

ssize_t HttpAudioStream::read(uint8_t* buf, size_t maxLen) {
    if (m_socket < 0) return -1;

    size_t canRead = maxLen;
    if (m_icyMetaInt != 0) {
        // Stop at the next metadata block
        if (m_icyBytesUntilMeta == 0) {
            if (!skipIcyMetadata()) return -1;
            m_icyBytesUntilMeta = m_icyMetaInt;
        }
        canRead = std::min(maxLen, static_cast<size_t>(m_icyBytesUntilMeta));
    }

    ssize_t n = readRaw(buf, canRead);
    if (n > 0) {
        m_bytesReceived += static_cast<uint64_t>(n);
        if (m_icyMetaInt != 0) m_icyBytesUntilMeta -= static_cast<uint32_t>(n);
    }
    return n;
}

int64_t HttpAudioStream::seek(int64_t, int) {
    return -1;
}

bool HttpAudioStream::sendAll(const void* buf, size_t len) {
    const uint8_t* ptr = static_cast<const uint8_t*>(buf);
    size_t remaining = len;

    while (remaining > 0) {
        ssize_t n = send(m_socket, ptr, remaining, MSG_NOSIGNAL);
        if (n <= 0) {
            if (n < 0 && errno == EINTR) continue;
            return false;
        }
        ptr += n;
        remaining -= static_cast<size_t>(n);
    }
    return true;
}

bool HttpAudioStream::parseResponseHeaders() {
    // Read until \r\n\r\n
    std::string headerBuf;
    headerBuf.reserve(4096);

    char c;
    int endSeq = 0;

    while (true) {
        ssize_t n = recv(m_socket, &c, 1, 0);
        if (n <= 0) {
            if (n < 0 && errno == EINTR) continue;
            LOG_ERROR("[HTTP] Connection closed while reading headers");
            return false;
        }

        headerBuf += c;

        if (c == '\r' && (endSeq == 0 || endSeq == 2)) {
            endSeq++;
        } else if (c == '\n' && (endSeq == 1 || endSeq == 3)) {
            endSeq++;
            if (endSeq == 4) break;
        } else {
            endSeq = 0;
        }

        if (headerBuf.size() > 16384) {
            LOG_ERROR("[HTTP] Headers too large (>16KB)");
            return false;
        }
    }

    LOG_DEBUG("[HTTP] Response headers:\n" << headerBuf);

    // "HTTP/1.0 200 OK" or "ICY 200 OK"
    size_t spacePos = headerBuf.find(' ');
    if (spacePos != std::string::npos && spacePos + 3 < headerBuf.size()) {
        m_httpStatus = std::atoi(headerBuf.c_str() + spacePos + 1);
    }

    std::string lowerHeaders = headerBuf;
    std::transform(lowerHeaders.begin(), lowerHeaders.end(), lowerHeaders.begin(),
                   [](unsigned char ch) { return std::tolower(ch); });

    auto headerValue = [&](const char* name) -> const char* {
        size_t pos = lowerHeaders.find(name);
        if (pos == std::string::npos) return nullptr;
        size_t valStart = pos + std::strlen(name);
        while (valStart < lowerHeaders.size() && lowerHeaders[valStart] == ' ') valStart++;
        return headerBuf.c_str() + valStart;
    };

    if (const char* len = headerValue("\ncontent-length:")) {
        m_contentLength = std::atoll(len);
    }

    if (const char* metaInt = headerValue("\nicy-metaint:")) {
        uint32_t interval = static_cast<uint32_t>(std::atoi(metaInt));
        if (interval > 0) {
            m_icyMetaInt = interval;
            m_icyBytesUntilMeta = interval;
            LOG_DEBUG("[HTTP] ICY metadata interval: " << interval << " bytes");
        }
    }

    return true;
}
