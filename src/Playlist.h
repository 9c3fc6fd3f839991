/**
 * @file Playlist.h
 * @brief Extended M3U playlist: the list of items the player plays
 *
 * Format:
 *   #EXTM3U
 *   #EXTINF:215 audio.fade_out_duration="4000",Artist A, Artist B - Title
 *   /music/title.ogg
 *   #EXTINF:1800 type="episode" show="Some Show",Episode title
 *   http://example.org/ep1.mp3
 *
 * Attributes between the duration and the comma form the item's metadata
 * map. Bare locations (no #EXTINF) are tracks of unknown duration. A
 * location listed again gets the id of "<location>#<n>" for its n-th repeat.
 */

#ifndef CUETRACK_PLAYLIST_H
#define CUETRACK_PLAYLIST_H

#include "PlayableId.h"
#include "TrackOrEpisode.h"

#include <climits>
#include <istream>
#include <map>
#include <optional>
#include <string>
#include <vector>

struct PlaylistItem {
    PlayableId id;
    std::string location;               // file path or http:// URL
    std::optional<Track> track;
    std::optional<Episode> episode;
    std::map<std::string, std::string> metadata;
};

class Playlist {
public:
    Playlist() = default;

    /**
     * @brief Parse an extended M3U document
     * @return false if a line is malformed (the offending line is logged)
     */
    bool parse(std::istream& in);

    bool loadFile(const std::string& path);

    // Append a bare location
    void add(const std::string& location);

    const std::vector<PlaylistItem>& items() const { return m_items; }
    size_t size() const { return m_items.size(); }
    bool empty() const { return m_items.empty(); }

    // Null if no item has this id
    const PlaylistItem* find(const PlayableId& id) const;

    /**
     * @brief FNV-1a 64-bit hash of the location, 16 lowercase hex chars
     *
     * Only the first occurrence of a location uses this id directly.
     */
    static std::string idForLocation(const std::string& location);

    // Longest #EXTINF duration kept; longer ones are clamped
    static constexpr int MAX_DURATION_SEC = INT_MAX / 1000;

private:
    struct PendingInfo {
        int durationSec = -1;
        std::string title;
        std::map<std::string, std::string> attributes;
    };

    static bool parseExtInf(const std::string& line, PendingInfo& out);
    void addItem(const std::string& location, const PendingInfo* info);

    std::vector<PlaylistItem> m_items;
    std::map<PlayableId, size_t> m_index;
    std::map<std::string, int> m_occurrences;   // per location
};

#endif // CUETRACK_PLAYLIST_H
