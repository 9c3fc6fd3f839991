/**
 * @file PlaylistContentLoader.cpp
 * @brief Playlist item resolution
 */

#include "PlaylistContentLoader.h"
#include "FileAudioStream.h"
#include "HttpAudioStream.h"
#include "LogLevel.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>

PlaylistContentLoader::PlaylistContentLoader(const Playlist& playlist, const Config& config)
    : m_playlist(playlist)
    , m_config(config)
{
}

Codec PlaylistContentLoader::codecForLocation(const std::string& location) {
    // Ignore a URL query
    std::string path = location.substr(0, location.find('?'));
    size_t dot = path.rfind('.');
    size_t slash = path.rfind('/');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
        return Codec::UNKNOWN;
    }

    std::string ext = path.substr(dot + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (ext == "ogg" || ext == "oga") return Codec::VORBIS;
    if (ext == "mp3") return Codec::MP3;
    return Codec::UNKNOWN;
}

LoadError PlaylistContentLoader::fileError(const std::string& path, int err) {
    std::string message = path + ": " + strerror(err);
    if (err == EACCES || err == EPERM) {
        return LoadError(LoadError::Kind::RESTRICTED, message);
    }
    return LoadError(LoadError::Kind::TRANSPORT, message);
}

LoadError PlaylistContentLoader::httpError(const std::string& url, int status) {
    if (status == 0) {
        return LoadError(LoadError::Kind::TRANSPORT, url + ": no response");
    }

    std::string message = url + ": HTTP " + std::to_string(status);
    switch (status) {
        case 401:
        case 403:
        case 451:
            return LoadError(LoadError::Kind::RESTRICTED, message);
        case 402:
            return LoadError(LoadError::Kind::RIGHTS, message);
        default:
            return LoadError(LoadError::Kind::TRANSPORT, message);
    }
}

NormalizationData PlaylistContentLoader::normalizationFor(const PlaylistItem& item) {
    NormalizationData data;
    auto read = [&](const char* key, float& field) {
        auto it = item.metadata.find(key);
        if (it == item.metadata.end()) return;

        char* end = nullptr;
        float value = std::strtof(it->second.c_str(), &end);
        if (end != it->second.c_str()) field = value;
    };

    read("replaygain_track_gain", data.trackGainDb);
    read("replaygain_track_peak", data.trackPeak);
    read("replaygain_album_gain", data.albumGainDb);
    read("replaygain_album_peak", data.albumPeak);
    return data;
}

bool PlaylistContentLoader::load(const PlayableId& playable, AudioQuality quality, bool preload,
                                 HaltListener* haltListener, LoadedStream& out,
                                 LoadError& error) {
    auto started = std::chrono::steady_clock::now();

    const PlaylistItem* item = m_playlist.find(playable);
    if (!item) {
        error = LoadError(LoadError::Kind::TRANSPORT, "unknown item " + playable.toUri());
        return false;
    }

    // Local content has a single quality; the preference only matters remotely
    LOG_DEBUG("[Loader] Loading " << item->location << " (quality " << audioQualityName(quality)
              << (preload ? ", preload" : "") << ")");

    Codec codec = codecForLocation(item->location);
    if (item->location.compare(0, 7, "http://") == 0) {
        auto stream = std::make_unique<HttpAudioStream>(item->location, codec,
                                                        m_config.haltThresholdMs, haltListener);
        if (!stream->open()) {
            error = httpError(item->location, stream->httpStatus());
            return false;
        }
        out.in = std::move(stream);
    } else if (item->location.find("://") != std::string::npos) {
        error = LoadError(LoadError::Kind::FORMAT, "unsupported scheme in " + item->location);
        return false;
    } else {
        auto stream = std::make_unique<FileAudioStream>(item->location, codec);
        if (!stream->open()) {
            error = fileError(item->location, errno);
            return false;
        }
        out.in = std::move(stream);
    }

    out.track = item->track;
    out.episode = item->episode;
    out.normalizationData = normalizationFor(*item);
    out.metrics.location = item->location;
    out.metrics.preloaded = preload;
    out.metrics.loadTimeMs = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();
    return true;
}
