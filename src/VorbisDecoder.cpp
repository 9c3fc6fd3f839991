/**
 * @file VorbisDecoder.cpp
 * @brief Ogg Vorbis decoder implementation using libvorbisfile
 *
 * ov_read() decodes to 16-bit little-endian signed PCM, which is already the
 * output sample format; the shared Decoder::writePcm() path applies the
 * normalisation factor.
 *
 * Position: ov_time_tell() after every block. A negative result means the
 * library cannot place the stream in time and the position is reported as
 * unavailable from then on.
 */

#include "VorbisDecoder.h"
#include "LogLevel.h"

#include <cerrno>
#include <cstring>

VorbisDecoder::VorbisDecoder(std::unique_ptr<AudioStream> in, const AudioFormat& format,
                             float normalizationFactor, int durationMs)
    : Decoder(std::move(in), format, normalizationFactor, durationMs)
{
    std::memset(&m_vf, 0, sizeof(m_vf));
}

VorbisDecoder::~VorbisDecoder() {
    if (m_vfOpen) {
        ov_clear(&m_vf);
    }
}

size_t VorbisDecoder::readCallback(void* ptr, size_t size, size_t nmemb, void* datasource) {
    auto* self = static_cast<VorbisDecoder*>(datasource);

    ssize_t n = self->m_in->read(static_cast<uint8_t*>(ptr), size * nmemb);
    if (n < 0) {
        errno = EIO;  // vorbisfile maps 0 + errno to OV_EREAD
        return 0;
    }
    if (n == 0) {
        errno = 0;    // clean EOF
        return 0;
    }
    return static_cast<size_t>(n) / size;
}

int VorbisDecoder::seekCallback(void* datasource, ogg_int64_t offset, int whence) {
    auto* self = static_cast<VorbisDecoder*>(datasource);
    return self->m_in->seek(offset, whence) < 0 ? -1 : 0;
}

long VorbisDecoder::tellCallback(void* datasource) {
    auto* self = static_cast<VorbisDecoder*>(datasource);
    return static_cast<long>(self->m_in->tell());
}

bool VorbisDecoder::open(LoadError& error) {
    ov_callbacks cb;
    cb.read_func = readCallback;
    cb.close_func = nullptr;    // the stream is owned by Decoder
    if (m_in->seekable()) {
        cb.seek_func = seekCallback;
        cb.tell_func = tellCallback;
    } else {
        cb.seek_func = nullptr;
        cb.tell_func = nullptr;
    }

    int ret = ov_open_callbacks(this, &m_vf, nullptr, 0, cb);
    if (ret < 0) {
        LOG_ERROR("[OGG] Failed to open " << m_in->describe() << " (error " << ret << ")");
        error = LoadError(LoadError::Kind::DECODER_INIT,
                          "ov_open_callbacks failed with " + std::to_string(ret));
        return false;
    }
    m_vfOpen = true;

    vorbis_info* vi = ov_info(&m_vf, -1);
    if (!vi) {
        error = LoadError(LoadError::Kind::DECODER_INIT, "missing Vorbis info header");
        return false;
    }

    if (!matchesOutput(vi->rate, vi->channels)) {
        LOG_ERROR("[OGG] Stream is " << vi->rate << " Hz, " << vi->channels
                  << " ch; output is " << m_format.sampleRate << " Hz, "
                  << m_format.channels << " ch");
        error = LoadError(LoadError::Kind::DECODER_INIT,
                          "stream format does not match the output format");
        return false;
    }

    m_currentBitstream = 0;
    LOG_INFO("[OGG] Format: " << vi->rate << " Hz, " << vi->channels << " ch"
             << (m_in->seekable() ? "" : " (non-seekable)"));
    updateTime();
    return true;
}

void VorbisDecoder::updateTime() {
    double seconds = ov_time_tell(&m_vf);
    if (seconds < 0) {
        setTimeUnavailable();
        return;
    }
    setTime(static_cast<int>(seconds * 1000.0));
}

void VorbisDecoder::seek(int positionMs) {
    if (!m_in->seekable()) {
        LOG_WARN("[OGG] Cannot seek " << m_in->describe() << ": stream is not seekable");
        return;
    }

    int ret = ov_time_seek(&m_vf, positionMs / 1000.0);
    if (ret != 0) {
        LOG_WARN("[OGG] Seek to " << positionMs << " ms failed (error " << ret << ")");
        return;
    }
    updateTime();
}

int VorbisDecoder::writeSomeTo(SampleStream& out, PlaybackError& error) {
    char pcmBuf[4096];
    int bitstream = 0;
    long ret = ov_read(&m_vf, pcmBuf, sizeof(pcmBuf),
                       0 /* little-endian */,
                       2 /* 16-bit */,
                       1 /* signed */,
                       &bitstream);

    if (ret == 0) {
        return END_OF_STREAM;
    }

    if (ret == OV_HOLE) {
        // Gap in data, continue with the next block
        LOG_DEBUG("[OGG] Data gap (OV_HOLE), continuing");
        return 0;
    }

    if (ret == OV_EBADLINK) {
        LOG_WARN("[OGG] Bad link in stream, attempting recovery");
        return 0;
    }

    if (ret == OV_EREAD) {
        error = PlaybackError(PlaybackError::Kind::IO, "read from " + m_in->describe() + " failed");
        return WRITE_FAILED;
    }

    if (ret < 0) {
        error = PlaybackError(PlaybackError::Kind::DECODE,
                              "ov_read failed with " + std::to_string(ret));
        return WRITE_FAILED;
    }

    // Chained stream: the new link must still match the output format
    if (bitstream != m_currentBitstream) {
        m_currentBitstream = bitstream;
        vorbis_info* vi = ov_info(&m_vf, -1);
        if (vi && !matchesOutput(vi->rate, vi->channels)) {
            error = PlaybackError(PlaybackError::Kind::DECODE,
                                  "chained stream changed format to " +
                                  std::to_string(vi->rate) + " Hz");
            return WRITE_FAILED;
        }
    }

    updateTime();

    size_t numSamples = static_cast<size_t>(ret) / 2;
    int16_t samples[sizeof(pcmBuf) / 2];
    std::memcpy(samples, pcmBuf, numSamples * 2);
    return writePcm(out, samples, numSamples, error);
}
