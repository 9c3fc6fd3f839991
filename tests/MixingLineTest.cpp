/**
 * @file MixingLineTest.cpp
 * @brief Ring buffer and two-slot mixer
 */

#include "CircularBuffer.h"
#include "MixingLine.h"
#include "LogLevel.h"

#include <gtest/gtest.h>

#include <chrono>
#include <thread>
#include <vector>

static std::vector<uint8_t> pcm(size_t samples, int16_t value) {
    std::vector<uint8_t> out(samples * 2);
    for (size_t i = 0; i < samples; i++) {
        out[i * 2] = static_cast<uint8_t>(value & 0xFF);
        out[i * 2 + 1] = static_cast<uint8_t>((value >> 8) & 0xFF);
    }
    return out;
}

static int16_t sampleAt(const std::vector<uint8_t>& buf, size_t i) {
    return static_cast<int16_t>(buf[i * 2] | (buf[i * 2 + 1] << 8));
}

// ============================================
// CircularBuffer
// ============================================

TEST(CircularBufferTest, WrapsAround)
{
    CircularBuffer buffer(8);
    buffer.open();

    const uint8_t first[6] = {1, 2, 3, 4, 5, 6};
    const uint8_t second[6] = {7, 8, 9, 10, 11, 12};
    uint8_t out[8] = {};

    ASSERT_TRUE(buffer.write(first, 6));
    EXPECT_EQ(buffer.readAvailable(out, 4), 4u);
    ASSERT_TRUE(buffer.write(second, 6));
    EXPECT_EQ(buffer.available(), 8u);

    ASSERT_EQ(buffer.readAvailable(out, 8), 8u);
    const uint8_t expected[8] = {5, 6, 7, 8, 9, 10, 11, 12};
    for (int i = 0; i < 8; i++) EXPECT_EQ(out[i], expected[i]);
}

TEST(CircularBufferTest, ClosedBufferDropsWrites)
{
    CircularBuffer buffer(4);
    const uint8_t data[16] = {};

    EXPECT_TRUE(buffer.write(data, sizeof(data)));
    EXPECT_EQ(buffer.available(), 0u);
}

TEST(CircularBufferTest, CloseReleasesBlockedWriter)
{
    CircularBuffer buffer(4);
    buffer.open();
    const uint8_t data[16] = {};

    std::thread writer([&] { EXPECT_TRUE(buffer.write(data, sizeof(data))); });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    buffer.close();
    writer.join();

    EXPECT_EQ(buffer.available(), 4u);
}

TEST(CircularBufferTest, ShutdownFailsWriters)
{
    CircularBuffer buffer(4);
    buffer.open();
    buffer.shutdown();

    const uint8_t data[2] = {};
    EXPECT_FALSE(buffer.write(data, sizeof(data)));
}

// ============================================
// MixingLine
// ============================================

class MixingLineTest : public ::testing::Test {
protected:
    void SetUp() override { g_logLevel = LogLevel::ERROR; }

    AudioFormat format;
    MixingLine line{format};
};

TEST_F(MixingLineTest, MixesEnabledOutputsWithGain)
{
    auto& a = line.firstOut();
    auto& b = line.secondOut();
    a.toggle(true);
    b.toggle(true);
    a.gain(0.5f);

    auto da = pcm(8, 1000);
    auto db = pcm(8, -300);
    ASSERT_TRUE(a.write(da.data(), da.size()));
    ASSERT_TRUE(b.write(db.data(), db.size()));

    std::vector<uint8_t> out(16);
    ASSERT_EQ(line.read(out.data(), out.size(), 100), 16u);
    for (size_t i = 0; i < 8; i++) EXPECT_EQ(sampleAt(out, i), 200);
}

TEST_F(MixingLineTest, ClampsToSixteenBits)
{
    auto& a = line.firstOut();
    auto& b = line.secondOut();
    a.toggle(true);
    b.toggle(true);

    auto loud = pcm(4, 30000);
    auto quiet = pcm(4, -30000);
    ASSERT_TRUE(a.write(loud.data(), loud.size()));
    ASSERT_TRUE(b.write(loud.data(), loud.size()));

    std::vector<uint8_t> out(8);
    ASSERT_EQ(line.read(out.data(), out.size(), 100), 8u);
    EXPECT_EQ(sampleAt(out, 0), 32767);

    ASSERT_TRUE(a.write(quiet.data(), quiet.size()));
    ASSERT_TRUE(b.write(quiet.data(), quiet.size()));
    ASSERT_EQ(line.read(out.data(), out.size(), 100), 8u);
    EXPECT_EQ(sampleAt(out, 3), -32768);
}

TEST_F(MixingLineTest, ShortOutputIsPaddedWithSilence)
{
    auto& a = line.firstOut();
    auto& b = line.secondOut();
    a.toggle(true);
    b.toggle(true);

    auto full = pcm(8, 100);
    auto half = pcm(4, 50);
    ASSERT_TRUE(a.write(full.data(), full.size()));
    ASSERT_TRUE(b.write(half.data(), half.size()));

    // b is disabled while the line waits for the rest of its block
    std::thread stopper([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        b.toggle(false);
    });

    std::vector<uint8_t> out(16);
    ASSERT_EQ(line.read(out.data(), out.size(), 100), 16u);
    stopper.join();

    EXPECT_EQ(sampleAt(out, 0), 150);
    EXPECT_EQ(sampleAt(out, 3), 150);
    EXPECT_EQ(sampleAt(out, 4), 100);
    EXPECT_EQ(sampleAt(out, 7), 100);
}

TEST_F(MixingLineTest, NothingEnabledTimesOut)
{
    std::vector<uint8_t> out(16);
    EXPECT_EQ(line.read(out.data(), out.size(), 20), 0u);
}

TEST_F(MixingLineTest, DisabledOutputDropsWritesWithoutBlocking)
{
    auto& a = line.firstOut();
    auto big = pcm(format.bytesForMs(1000) / 2, 1);

    EXPECT_TRUE(a.write(big.data(), big.size()));
    EXPECT_FALSE(a.enabled());
}

TEST_F(MixingLineTest, ClearResetsOutput)
{
    auto& a = line.firstOut();
    a.toggle(true);
    a.gain(0.25f);
    auto stale = pcm(8, 9999);
    ASSERT_TRUE(a.write(stale.data(), stale.size()));

    a.clear();
    EXPECT_FALSE(a.enabled());
    EXPECT_FLOAT_EQ(a.currentGain(), 1.0f);

    a.toggle(true);
    auto fresh = pcm(8, 1234);
    ASSERT_TRUE(a.write(fresh.data(), fresh.size()));

    std::vector<uint8_t> out(16);
    ASSERT_EQ(line.read(out.data(), out.size(), 100), 16u);
    EXPECT_EQ(sampleAt(out, 0), 1234);
}

TEST_F(MixingLineTest, ShutdownFailsWritersAndReads)
{
    auto& a = line.firstOut();
    a.toggle(true);
    line.shutdown();

    auto data = pcm(4, 1);
    EXPECT_FALSE(a.write(data.data(), data.size()));

    std::vector<uint8_t> out(8);
    EXPECT_EQ(line.read(out.data(), out.size(), 20), 0u);
}

TEST_F(MixingLineTest, OtherOutput)
{
    EXPECT_EQ(&line.other(line.firstOut()), &line.secondOut());
    EXPECT_EQ(&line.other(line.secondOut()), &line.firstOut());
}
