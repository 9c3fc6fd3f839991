/**
 * @file ContentLoader.h
 * @brief Abstract content retrieval: PlayableId -> decodable stream + metadata
 */

#ifndef CUETRACK_CONTENT_LOADER_H
#define CUETRACK_CONTENT_LOADER_H

#include "AudioStream.h"
#include "Config.h"
#include "NormalizationData.h"
#include "PlayableId.h"
#include "PlaybackErrors.h"
#include "TrackOrEpisode.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

struct LoadMetrics {
    std::string location;       // where the bytes came from
    bool preloaded = false;     // loaded ahead of being needed
    int64_t loadTimeMs = 0;     // time spent resolving and opening
};

struct LoadedStream {
    std::unique_ptr<AudioStream> in;
    std::optional<Track> track;
    std::optional<Episode> episode;
    NormalizationData normalizationData;
    LoadMetrics metrics;
};

class ContentLoader {
public:
    virtual ~ContentLoader() = default;

    /**
     * @brief Resolve and open the content
     * @param haltListener Receives stall notifications from the stream (may be null)
     * @return false with error filled in on failure
     */
    virtual bool load(const PlayableId& playable, AudioQuality quality, bool preload,
                      HaltListener* haltListener, LoadedStream& out, LoadError& error) = 0;
};

#endif // CUETRACK_CONTENT_LOADER_H
