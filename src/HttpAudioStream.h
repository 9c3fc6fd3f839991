/**
 * @file HttpAudioStream.h
 * @brief AudioStream over an HTTP/1.0 GET (or ICY) response
 *
 * The request is sent by open(); read() then pulls the body through poll()
 * so that a stalled server is noticed: after haltThresholdMs without data the
 * HaltListener gets streamReadHalted(), and streamReadResumed() once bytes
 * flow again. Chunk indices are bytes received / CHUNK_SIZE.
 */

#ifndef CUETRACK_HTTP_AUDIO_STREAM_H
#define CUETRACK_HTTP_AUDIO_STREAM_H

#include "AudioStream.h"

#include <cstdint>
#include <string>

class HttpAudioStream : public AudioStream {
public:
    static constexpr size_t CHUNK_SIZE = 128 * 1024;

    // Default for giving up on a server that sends nothing
    static constexpr int READ_TIMEOUT_MS = 30000;

    HttpAudioStream(std::string url, Codec codec, int haltThresholdMs,
                    HaltListener* haltListener, int readTimeoutMs = READ_TIMEOUT_MS);
    ~HttpAudioStream() override;

    /**
     * @brief Split http://host[:port]/path
     * @return false if the URL is not a plain http URL
     */
    static bool parseUrl(const std::string& url, std::string& host, uint16_t& port,
                         std::string& path);

    /**
     * @brief Connect, send the request and read the response headers
     * @return false on a socket failure or a non-200 status (see httpStatus())
     */
    bool open();

    ssize_t read(uint8_t* buf, size_t maxLen) override;
    bool seekable() const override { return false; }
    int64_t seek(int64_t offset, int whence) override;
    int64_t tell() const override { return static_cast<int64_t>(m_bytesReceived); }
    int64_t size() const override { return m_contentLength; }
    Codec codec() const override { return m_codec; }
    std::string describe() const override { return m_url; }

    // 0 if no response was received
    int httpStatus() const { return m_httpStatus; }

private:
    void disconnect();
    ssize_t readRaw(uint8_t* buf, size_t maxLen);
    bool waitReadable();
    bool skipIcyMetadata();
    bool sendAll(const void* buf, size_t len);
    bool parseResponseHeaders();
    int currentChunk() const { return static_cast<int>(m_bytesReceived / CHUNK_SIZE); }

    std::string m_url;
    Codec m_codec;
    int m_haltThresholdMs;
    HaltListener* m_haltListener;
    int m_readTimeoutMs;

    int m_socket = -1;
    int m_httpStatus = 0;
    int64_t m_contentLength = -1;
    uint64_t m_bytesReceived = 0;
    bool m_halted = false;

    // ICY metadata handling
    uint32_t m_icyMetaInt = 0;        // Metadata interval (bytes), 0 = disabled
    uint32_t m_icyBytesUntilMeta = 0; // Countdown to next metadata block
};

#endif // CUETRACK_HTTP_AUDIO_STREAM_H
