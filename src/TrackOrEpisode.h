/**
 * @file TrackOrEpisode.h
 * @brief Metadata of a loaded content item
 *
 * Exactly one of track/episode is expected to be present once loaded.
 */

#ifndef CUETRACK_TRACK_OR_EPISODE_H
#define CUETRACK_TRACK_OR_EPISODE_H

#include <optional>
#include <string>
#include <vector>

struct Track {
    std::string name;
    std::vector<std::string> artists;
    int durationMs = 0;     // 0 = unknown
};

struct Episode {
    std::string name;
    std::string show;
    int durationMs = 0;     // 0 = unknown
};

class TrackOrEpisode {
public:
    TrackOrEpisode() = default;
    TrackOrEpisode(std::optional<Track> track, std::optional<Episode> episode);

    const std::optional<Track>& track() const { return m_track; }
    const std::optional<Episode>& episode() const { return m_episode; }

    int durationMs() const;
    std::string name() const;

    // "a, b, c" for tracks, the show name for episodes
    std::string artistsString() const;

private:
    std::optional<Track> m_track;
    std::optional<Episode> m_episode;
};

#endif // CUETRACK_TRACK_OR_EPISODE_H
