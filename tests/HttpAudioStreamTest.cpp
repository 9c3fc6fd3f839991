/**
 * @file HttpAudioStreamTest.cpp
 * @brief HTTP streaming against a loopback server: stalls, timeouts, ICY
 */

#include "HttpAudioStream.h"
#include "LogLevel.h"

#include <gtest/gtest.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace {

int64_t nowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
}

bool sendAll(int fd, const void* data, size_t len) {
    const uint8_t* ptr = static_cast<const uint8_t*>(data);
    while (len > 0) {
        ssize_t n = send(fd, ptr, len, MSG_NOSIGNAL);
        if (n <= 0) return false;
        ptr += n;
        len -= static_cast<size_t>(n);
    }
    return true;
}

bool sendText(int fd, const std::string& text) {
    return sendAll(fd, text.data(), text.size());
}

/**
 * @brief One-connection HTTP server on 127.0.0.1
 *
 * Accepts a single client, consumes the request headers and hands the
 * socket to the handler on its own thread.
 */
class LoopbackServer {
public:
    explicit LoopbackServer(std::function<void(int)> handler)
        : m_handler(std::move(handler))
    {
        m_listenFd = socket(AF_INET, SOCK_STREAM, 0);
        if (m_listenFd < 0) return;

        int flag = 1;
        setsockopt(m_listenFd, SOL_SOCKET, SO_REUSEADDR, &flag, sizeof(flag));

        struct sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        socklen_t addrLen = sizeof(addr);
        if (bind(m_listenFd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) != 0 ||
            listen(m_listenFd, 1) != 0 ||
            getsockname(m_listenFd, reinterpret_cast<struct sockaddr*>(&addr), &addrLen) != 0) {
            ::close(m_listenFd);
            m_listenFd = -1;
            return;
        }
        m_port = ntohs(addr.sin_port);

        m_thread = std::thread(&LoopbackServer::serve, this);
    }

    ~LoopbackServer() { join(); }

    // Non-copyable
    LoopbackServer(const LoopbackServer&) = delete;
    LoopbackServer& operator=(const LoopbackServer&) = delete;

    bool ok() const { return m_listenFd >= 0; }

    std::string url(const std::string& path) const {
        return "http://127.0.0.1:" + std::to_string(m_port) + path;
    }

    void join() {
        // Wakes accept() if no client ever connected
        if (m_listenFd >= 0) shutdown(m_listenFd, SHUT_RDWR);
        if (m_thread.joinable()) m_thread.join();
        if (m_listenFd >= 0) {
            ::close(m_listenFd);
            m_listenFd = -1;
        }
    }

private:
    void serve() {
        int fd = accept(m_listenFd, nullptr, nullptr);
        if (fd < 0) return;

        std::string request;
        char c;
        while (request.size() < 4 || request.compare(request.size() - 4, 4, "\r\n\r\n") != 0) {
            if (recv(fd, &c, 1, 0) != 1) break;
            request += c;
        }

        m_handler(fd);
        ::close(fd);
    }

    std::function<void(int)> m_handler;
    int m_listenFd = -1;
    uint16_t m_port = 0;
    std::thread m_thread;
};

class RecordingHaltListener : public HaltListener {
public:
    struct Record {
        bool halted;
        int chunk;
        int64_t timeMs;
    };

    void streamReadHalted(int chunk, int64_t timeMs) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_records.push_back(Record{true, chunk, timeMs});
    }

    void streamReadResumed(int chunk, int64_t timeMs) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_records.push_back(Record{false, chunk, timeMs});
    }

    std::vector<Record> records() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_records;
    }

private:
    mutable std::mutex m_mutex;
    std::vector<Record> m_records;
};

// Reads until end of stream or error; returns the last read() result
ssize_t drain(HttpAudioStream& stream, std::string& body) {
    std::vector<uint8_t> buf(16 * 1024);
    while (true) {
        ssize_t n = stream.read(buf.data(), buf.size());
        if (n <= 0) return n;
        body.append(reinterpret_cast<const char*>(buf.data()), static_cast<size_t>(n));
    }
}

} // namespace

class HttpAudioStreamTest : public ::testing::Test {
protected:
    void SetUp() override { g_logLevel = LogLevel::ERROR; }

    RecordingHaltListener listener;
};

TEST_F(HttpAudioStreamTest, ParsesUrls)
{
    std::string host;
    std::string path;
    uint16_t port = 0;

    ASSERT_TRUE(HttpAudioStream::parseUrl("http://radio.example.org:8000/live.mp3", host, port, path));
    EXPECT_EQ(host, "radio.example.org");
    EXPECT_EQ(port, 8000);
    EXPECT_EQ(path, "/live.mp3");

    ASSERT_TRUE(HttpAudioStream::parseUrl("http://host", host, port, path));
    EXPECT_EQ(port, 80);
    EXPECT_EQ(path, "/");

    EXPECT_FALSE(HttpAudioStream::parseUrl("https://host/x", host, port, path));
    EXPECT_FALSE(HttpAudioStream::parseUrl("http://host:port/x", host, port, path));
    EXPECT_FALSE(HttpAudioStream::parseUrl("http:///x", host, port, path));
}

TEST_F(HttpAudioStreamTest, StallReportsHaltThenResumeWithChunk)
{
    const size_t firstPart = 200 * 1024;
    const size_t secondPart = 1000;
    const int stallMs = 400;
    const int thresholdMs = 100;

    LoopbackServer server([&](int fd) {
        sendText(fd, "HTTP/1.0 200 OK\r\nContent-Length: " +
                         std::to_string(firstPart + secondPart) + "\r\n\r\n");
        std::vector<uint8_t> body(firstPart, 0x55);
        sendAll(fd, body.data(), body.size());
        std::this_thread::sleep_for(std::chrono::milliseconds(stallMs));
        body.assign(secondPart, 0xAA);
        sendAll(fd, body.data(), body.size());
    });
    ASSERT_TRUE(server.ok());

    HttpAudioStream stream(server.url("/a.ogg"), Codec::VORBIS, thresholdMs, &listener);
    ASSERT_TRUE(stream.open());
    EXPECT_EQ(stream.httpStatus(), 200);
    EXPECT_EQ(stream.size(), static_cast<int64_t>(firstPart + secondPart));

    std::string body;
    EXPECT_EQ(drain(stream, body), 0);
    EXPECT_EQ(body.size(), firstPart + secondPart);

    auto records = listener.records();
    ASSERT_EQ(records.size(), 2u);
    EXPECT_TRUE(records[0].halted);
    EXPECT_EQ(records[0].chunk, 1);
    EXPECT_FALSE(records[1].halted);
    EXPECT_EQ(records[1].chunk, 1);

    // Halt is reported one threshold into the stall
    EXPECT_GE(records[1].timeMs - records[0].timeMs, stallMs - thresholdMs - 100);
}

TEST_F(HttpAudioStreamTest, SilentServerTimesOut)
{
    const int timeoutMs = 300;

    LoopbackServer server([](int fd) {
        sendText(fd, "HTTP/1.0 200 OK\r\n\r\n0123456789");
        // Hold the connection until the client gives up
        char c;
        while (recv(fd, &c, 1, 0) > 0) {}
    });
    ASSERT_TRUE(server.ok());

    auto stream = std::make_unique<HttpAudioStream>(server.url("/live.mp3"), Codec::MP3, 50,
                                                    &listener, timeoutMs);
    ASSERT_TRUE(stream->open());

    uint8_t buf[64];
    EXPECT_EQ(stream->read(buf, sizeof(buf)), 10);

    int64_t start = nowMs();
    EXPECT_EQ(stream->read(buf, sizeof(buf)), -1);
    EXPECT_GE(nowMs() - start, timeoutMs);

    auto records = listener.records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_TRUE(records[0].halted);
    EXPECT_EQ(records[0].chunk, 0);

    stream.reset();
    server.join();
}

TEST_F(HttpAudioStreamTest, ErrorStatusFailsOpen)
{
    LoopbackServer server([](int fd) {
        sendText(fd, "HTTP/1.0 403 Forbidden\r\nContent-Length: 0\r\n\r\n");
    });
    ASSERT_TRUE(server.ok());

    HttpAudioStream stream(server.url("/private.mp3"), Codec::MP3, 100, &listener);
    EXPECT_FALSE(stream.open());
    EXPECT_EQ(stream.httpStatus(), 403);
}

TEST_F(HttpAudioStreamTest, IcyMetadataIsSkipped)
{
    LoopbackServer server([](int fd) {
        std::string response = "ICY 200 OK\r\nicy-metaint: 4\r\n\r\nabcd";
        response += '\x01';
        response += std::string(16, 'M');
        response += "efgh";
        response += '\x00';
        response += "ij";
        sendText(fd, response);
    });
    ASSERT_TRUE(server.ok());

    HttpAudioStream stream(server.url("/radio"), Codec::MP3, 100, &listener);
    ASSERT_TRUE(stream.open());

    std::string body;
    EXPECT_EQ(drain(stream, body), 0);
    EXPECT_EQ(body, "abcdefghij");
    EXPECT_TRUE(listener.records().empty());
}
