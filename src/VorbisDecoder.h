/**
 * @file VorbisDecoder.h
 * @brief Ogg Vorbis decoder using libvorbisfile
 *
 * Uses libvorbisfile with callbacks onto the owned AudioStream:
 * - seek/tell callbacks are installed only for seekable streams, so remote
 *   streams open in non-seekable mode
 * - writeSomeTo() decodes one ov_read() block to S16_LE
 *
 * OV_HOLE gaps are skipped (normal for streamed Ogg).
 */

#ifndef CUETRACK_VORBIS_DECODER_H
#define CUETRACK_VORBIS_DECODER_H

#include "Decoder.h"
#include <vorbis/vorbisfile.h>

class VorbisDecoder : public Decoder {
public:
    VorbisDecoder(std::unique_ptr<AudioStream> in, const AudioFormat& format,
                  float normalizationFactor, int durationMs);
    ~VorbisDecoder() override;

    /**
     * @brief Read the Vorbis headers and check the stream matches the output format
     */
    bool open(LoadError& error);

    void seek(int positionMs) override;
    int writeSomeTo(SampleStream& out, PlaybackError& error) override;
    const char* name() const override { return "vorbis"; }

private:
    static size_t readCallback(void* ptr, size_t size, size_t nmemb, void* datasource);
    static int seekCallback(void* datasource, ogg_int64_t offset, int whence);
    static long tellCallback(void* datasource);

    void updateTime();

    OggVorbis_File m_vf;
    bool m_vfOpen = false;
    int m_currentBitstream = -1;
};

#endif // CUETRACK_VORBIS_DECODER_H
