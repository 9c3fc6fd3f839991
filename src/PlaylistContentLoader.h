/**
 * @file PlaylistContentLoader.h
 * @brief ContentLoader serving the items of a Playlist
 *
 * Local paths open as FileAudioStream, http:// locations as HttpAudioStream.
 * Replay gain comes from the item's replaygain_track_gain /
 * replaygain_track_peak / replaygain_album_gain / replaygain_album_peak
 * attributes when present.
 */

#ifndef CUETRACK_PLAYLIST_CONTENT_LOADER_H
#define CUETRACK_PLAYLIST_CONTENT_LOADER_H

#include "Config.h"
#include "ContentLoader.h"
#include "Playlist.h"

class PlaylistContentLoader : public ContentLoader {
public:
    PlaylistContentLoader(const Playlist& playlist, const Config& config);

    bool load(const PlayableId& playable, AudioQuality quality, bool preload,
              HaltListener* haltListener, LoadedStream& out, LoadError& error) override;

    // Codec from the location's extension, UNKNOWN if unrecognised
    static Codec codecForLocation(const std::string& location);

    // Load error for a failed open(2), by errno
    static LoadError fileError(const std::string& path, int err);

    // Load error for a refused HTTP request, by status (0 = no response)
    static LoadError httpError(const std::string& url, int status);

    static NormalizationData normalizationFor(const PlaylistItem& item);

private:
    const Playlist& m_playlist;
    const Config& m_config;
};

#endif // CUETRACK_PLAYLIST_CONTENT_LOADER_H
