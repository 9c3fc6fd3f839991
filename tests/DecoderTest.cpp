/**
 * @file DecoderTest.cpp
 * @brief Shared PCM output path and output format checks of the decoders
 */

#include "Decoder.h"
#include "FileAudioStream.h"
#include "LogLevel.h"

#include <gtest/gtest.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <unistd.h>
#include <vector>

#ifdef CUETRACK_TEST_VORBISENC
#include <vorbis/vorbisenc.h>
#endif

namespace {

class CapturingStream : public SampleStream {
public:
    bool write(const uint8_t* data, size_t len) override {
        if (failing) return false;
        bytes.insert(bytes.end(), data, data + len);
        return true;
    }

    void emptyBuffer() override { bytes.clear(); }

    // Captured bytes read back as S16_LE samples
    std::vector<int16_t> samples() const {
        std::vector<int16_t> out;
        for (size_t i = 0; i + 1 < bytes.size(); i += 2) {
            out.push_back(static_cast<int16_t>(bytes[i] | (bytes[i + 1] << 8)));
        }
        return out;
    }

    std::vector<uint8_t> bytes;
    bool failing = false;
};

// Writes caller-supplied samples through the shared output path
class SampleDecoder : public Decoder {
public:
    SampleDecoder(const AudioFormat& format, float factor)
        : Decoder(nullptr, format, factor, 0)
    {
    }

    int emit(SampleStream& out, const std::vector<int16_t>& samples, PlaybackError& error) {
        return writePcm(out, samples.data(), samples.size(), error);
    }

    using Decoder::matchesOutput;

    void seek(int) override {}
    int writeSomeTo(SampleStream&, PlaybackError&) override { return END_OF_STREAM; }
    const char* name() const override { return "samples"; }
};

std::string makeTempPath(const char* suffix) {
    std::string tmpl = std::string("/tmp/cuetrack_decoder_XXXXXX") + suffix;
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');
    int fd = mkstemps(buf.data(), static_cast<int>(std::string(suffix).size()));
    if (fd < 0) return "";
    ::close(fd);
    return std::string(buf.data());
}

} // namespace

class DecoderTest : public ::testing::Test {
protected:
    void SetUp() override { g_logLevel = LogLevel::ERROR; }

    void TearDown() override {
        if (!path.empty()) std::remove(path.c_str());
    }

    std::unique_ptr<Decoder> open(Codec codec, const AudioFormat& output, LoadError& error) {
        auto in = std::make_unique<FileAudioStream>(path, codec);
        if (!in->open()) {
            error = LoadError(LoadError::Kind::TRANSPORT, "cannot open " + path);
            return nullptr;
        }
        return Decoder::create(codec, std::move(in), output, NormalizationData(), config, 0, error);
    }

    Config config;
    AudioFormat format;
    std::string path;
};

TEST_F(DecoderTest, NormalisationScalesAndClamps)
{
    SampleDecoder decoder(format, 2.0f);
    CapturingStream out;
    PlaybackError error;

    ASSERT_EQ(decoder.emit(out, {1000, 20000, -20000, 0}, error), 8);
    EXPECT_EQ(out.samples(), (std::vector<int16_t>{2000, 32767, -32768, 0}));
}

TEST_F(DecoderTest, AttenuationRoundsToNearest)
{
    SampleDecoder decoder(format, 0.5f);
    CapturingStream out;
    PlaybackError error;

    ASSERT_EQ(decoder.emit(out, {1001, -1001, 32767, -32768}, error), 8);
    EXPECT_EQ(out.samples(), (std::vector<int16_t>{501, -501, 16384, -16384}));
}

TEST_F(DecoderTest, UnityFactorPassesSamplesThrough)
{
    SampleDecoder decoder(format, 1.0f);
    CapturingStream out;
    PlaybackError error;

    ASSERT_EQ(decoder.emit(out, {32767, -32768, 1}, error), 6);
    EXPECT_EQ(out.bytes, (std::vector<uint8_t>{0xFF, 0x7F, 0x00, 0x80, 0x01, 0x00}));
}

TEST_F(DecoderTest, RejectedWriteIsIoError)
{
    SampleDecoder decoder(format, 1.0f);
    CapturingStream out;
    out.failing = true;
    PlaybackError error;

    EXPECT_EQ(decoder.emit(out, {1, 2}, error), Decoder::WRITE_FAILED);
    EXPECT_EQ(error.kind, PlaybackError::Kind::IO);
}

TEST_F(DecoderTest, OnlyTheOutputLayoutMatches)
{
    SampleDecoder decoder(format, 1.0f);

    EXPECT_TRUE(decoder.matchesOutput(44100, 2));
    EXPECT_FALSE(decoder.matchesOutput(48000, 2));
    EXPECT_FALSE(decoder.matchesOutput(22050, 2));
    EXPECT_FALSE(decoder.matchesOutput(44100, 1));
    EXPECT_FALSE(decoder.matchesOutput(0, 2));
    EXPECT_FALSE(decoder.matchesOutput(44100, 0));
}

TEST_F(DecoderTest, UnknownCodecIsFormatError)
{
    path = makeTempPath(".bin");
    ASSERT_FALSE(path.empty());

    LoadError error;
    EXPECT_EQ(open(Codec::UNKNOWN, format, error), nullptr);
    EXPECT_EQ(error.kind, LoadError::Kind::FORMAT);
}

#ifdef ENABLE_MP3

namespace {

// MPEG-1 Layer III, 128 kbit/s, no CRC; all-zero side info decodes as silence
void writeSilentMp3(const std::string& path, uint8_t rateBits, bool mono, int frames) {
    int rate = rateBits == 0x04 ? 48000 : 44100;
    size_t frameSize = 144 * 128000 / rate;

    std::vector<uint8_t> frame(frameSize, 0);
    frame[0] = 0xFF;
    frame[1] = 0xFB;
    frame[2] = static_cast<uint8_t>(0x90 | rateBits);
    frame[3] = mono ? 0xC0 : 0x00;

    std::ofstream file(path, std::ios::binary);
    for (int i = 0; i < frames; i++) {
        file.write(reinterpret_cast<const char*>(frame.data()),
                   static_cast<std::streamsize>(frame.size()));
    }
}

} // namespace

TEST_F(DecoderTest, Mp3AtOutputRateOpens)
{
    path = makeTempPath(".mp3");
    ASSERT_FALSE(path.empty());
    writeSilentMp3(path, 0x00, false, 40);

    LoadError error;
    auto decoder = open(Codec::MP3, format, error);
    ASSERT_NE(decoder, nullptr) << error.describe();
    EXPECT_STREQ(decoder->name(), "mp3");
}

TEST_F(DecoderTest, Mp3SampleRateMismatchIsDecoderInitError)
{
    path = makeTempPath(".mp3");
    ASSERT_FALSE(path.empty());
    writeSilentMp3(path, 0x04, false, 40);

    LoadError error;
    EXPECT_EQ(open(Codec::MP3, format, error), nullptr);
    EXPECT_EQ(error.kind, LoadError::Kind::DECODER_INIT);
}

TEST_F(DecoderTest, Mp3ChannelMismatchIsDecoderInitError)
{
    path = makeTempPath(".mp3");
    ASSERT_FALSE(path.empty());
    writeSilentMp3(path, 0x00, true, 40);

    LoadError error;
    EXPECT_EQ(open(Codec::MP3, format, error), nullptr);
    EXPECT_EQ(error.kind, LoadError::Kind::DECODER_INIT);
}

#endif // ENABLE_MP3

#if defined(ENABLE_OGG) && defined(CUETRACK_TEST_VORBISENC)

namespace {

void writePages(std::ofstream& file, ogg_stream_state& os, bool flush) {
    ogg_page og;
    while (flush ? ogg_stream_flush(&os, &og) : ogg_stream_pageout(&os, &og)) {
        file.write(reinterpret_cast<const char*>(og.header), og.header_len);
        file.write(reinterpret_cast<const char*>(og.body), og.body_len);
    }
}

// Encodes one second of silence
bool writeSilentVorbis(const std::string& path, long rate, int channels) {
    vorbis_info vi;
    vorbis_info_init(&vi);
    if (vorbis_encode_init_vbr(&vi, channels, rate, 0.1f) != 0) {
        vorbis_info_clear(&vi);
        return false;
    }

    vorbis_comment vc;
    vorbis_comment_init(&vc);
    vorbis_dsp_state vd;
    vorbis_analysis_init(&vd, &vi);
    vorbis_block vb;
    vorbis_block_init(&vd, &vb);
    ogg_stream_state os;
    ogg_stream_init(&os, 1);

    std::ofstream file(path, std::ios::binary);

    ogg_packet header;
    ogg_packet comments;
    ogg_packet codebooks;
    vorbis_analysis_headerout(&vd, &vc, &header, &comments, &codebooks);
    ogg_stream_packetin(&os, &header);
    ogg_stream_packetin(&os, &comments);
    ogg_stream_packetin(&os, &codebooks);
    writePages(file, os, true);

    float** buffer = vorbis_analysis_buffer(&vd, static_cast<int>(rate));
    for (int ch = 0; ch < channels; ch++) {
        for (long i = 0; i < rate; i++) buffer[ch][i] = 0.0f;
    }
    vorbis_analysis_wrote(&vd, static_cast<int>(rate));
    vorbis_analysis_wrote(&vd, 0);

    while (vorbis_analysis_blockout(&vd, &vb) == 1) {
        vorbis_analysis(&vb, nullptr);
        vorbis_bitrate_addblock(&vb);

        ogg_packet op;
        while (vorbis_bitrate_flushpacket(&vd, &op)) {
            ogg_stream_packetin(&os, &op);
            writePages(file, os, false);
        }
    }
    writePages(file, os, true);

    ogg_stream_clear(&os);
    vorbis_block_clear(&vb);
    vorbis_dsp_clear(&vd);
    vorbis_comment_clear(&vc);
    vorbis_info_clear(&vi);
    return static_cast<bool>(file);
}

} // namespace

TEST_F(DecoderTest, VorbisAtOutputRateOpens)
{
    path = makeTempPath(".ogg");
    ASSERT_FALSE(path.empty());
    ASSERT_TRUE(writeSilentVorbis(path, 44100, 2));

    LoadError error;
    auto decoder = open(Codec::VORBIS, format, error);
    ASSERT_NE(decoder, nullptr) << error.describe();
    EXPECT_STREQ(decoder->name(), "vorbis");
}

TEST_F(DecoderTest, VorbisSampleRateMismatchIsDecoderInitError)
{
    path = makeTempPath(".ogg");
    ASSERT_FALSE(path.empty());
    ASSERT_TRUE(writeSilentVorbis(path, 48000, 2));

    LoadError error;
    EXPECT_EQ(open(Codec::VORBIS, format, error), nullptr);
    EXPECT_EQ(error.kind, LoadError::Kind::DECODER_INIT);
}

TEST_F(DecoderTest, VorbisChannelMismatchIsDecoderInitError)
{
    path = makeTempPath(".ogg");
    ASSERT_FALSE(path.empty());
    ASSERT_TRUE(writeSilentVorbis(path, 44100, 1));

    LoadError error;
    EXPECT_EQ(open(Codec::VORBIS, format, error), nullptr);
    EXPECT_EQ(error.kind, LoadError::Kind::DECODER_INIT);
}

#endif // ENABLE_OGG && CUETRACK_TEST_VORBISENC
