/**
 * @file TrackOrEpisode.cpp
 * @brief Metadata accessors
 */

#include "TrackOrEpisode.h"

TrackOrEpisode::TrackOrEpisode(std::optional<Track> track, std::optional<Episode> episode)
    : m_track(std::move(track))
    , m_episode(std::move(episode))
{
}

int TrackOrEpisode::durationMs() const {
    if (m_track) return m_track->durationMs;
    if (m_episode) return m_episode->durationMs;
    return 0;
}

std::string TrackOrEpisode::name() const {
    if (m_track) return m_track->name;
    if (m_episode) return m_episode->name;
    return "";
}

std::string TrackOrEpisode::artistsString() const {
    if (m_episode && !m_track) return m_episode->show;
    if (!m_track) return "";

    std::string out;
    for (const auto& artist : m_track->artists) {
        if (!out.empty()) out += ", ";
        out += artist;
    }
    return out;
}
