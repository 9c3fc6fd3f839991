/**
 * @file Playlist.cpp
 * @brief Extended M3U parsing
 */

#include "Playlist.h"
#include "LogLevel.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <fstream>

static std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) start++;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) end--;
    return s.substr(start, end - start);
}

std::string Playlist::idForLocation(const std::string& location) {
    uint64_t hash = 0xcbf29ce484222325ULL;
    for (unsigned char c : location) {
        hash ^= c;
        hash *= 0x100000001b3ULL;
    }

    static const char hex[] = "0123456789abcdef";
    std::string out(16, '0');
    for (int i = 15; i >= 0; i--) {
        out[i] = hex[hash & 0xF];
        hash >>= 4;
    }
    return out;
}

bool Playlist::parseExtInf(const std::string& line, PendingInfo& out) {
    static const std::string tag = "#EXTINF:";
    size_t pos = tag.size();

    // Duration: integer or decimal seconds, -1 = unknown
    const char* start = line.c_str() + pos;
    char* end = nullptr;
    double seconds = std::strtod(start, &end);
    if (end == start) return false;
    if (seconds < 0) {
        out.durationSec = -1;
    } else {
        // Saturate so the duration still fits in milliseconds
        out.durationSec = static_cast<int>(std::lround(std::min(seconds, double(MAX_DURATION_SEC))));
    }
    pos += static_cast<size_t>(end - start);

    // key="value" attributes up to the first unquoted comma
    while (pos < line.size()) {
        char c = line[pos];
        if (c == ',') break;
        if (std::isspace(static_cast<unsigned char>(c))) {
            pos++;
            continue;
        }

        size_t eq = line.find('=', pos);
        if (eq == std::string::npos || eq + 1 >= line.size() || line[eq + 1] != '"') return false;

        std::string key = line.substr(pos, eq - pos);
        size_t closeQuote = line.find('"', eq + 2);
        if (key.empty() || closeQuote == std::string::npos) return false;

        out.attributes[key] = line.substr(eq + 2, closeQuote - eq - 2);
        pos = closeQuote + 1;
    }

    if (pos >= line.size()) return false;
    out.title = trim(line.substr(pos + 1));
    return true;
}

void Playlist::addItem(const std::string& location, const PendingInfo* info) {
    PlaylistItem item;
    item.location = location;

    // Each occurrence of a location is its own item with its own attributes
    int occurrence = m_occurrences[location]++;
    std::string hexId = occurrence == 0
        ? idForLocation(location)
        : idForLocation(location + "#" + std::to_string(occurrence));

    int durationMs = 0;
    std::string title = location;
    if (info) {
        item.metadata = info->attributes;
        if (info->durationSec > 0) durationMs = info->durationSec * 1000;
        if (!info->title.empty()) title = info->title;
    }

    // "Artist A, Artist B - Name"
    std::string name = title;
    std::string byline;
    size_t sep = title.find(" - ");
    if (info && sep != std::string::npos) {
        byline = trim(title.substr(0, sep));
        name = trim(title.substr(sep + 3));
    }

    auto type = item.metadata.find("type");
    if (type != item.metadata.end() && type->second == "episode") {
        Episode episode;
        episode.name = name;
        auto show = item.metadata.find("show");
        episode.show = show != item.metadata.end() ? show->second : byline;
        episode.durationMs = durationMs;
        item.episode = episode;
        item.id = PlayableId(PlayableId::Type::EPISODE, hexId);
    } else {
        Track track;
        track.name = name;
        size_t from = 0;
        while (!byline.empty() && from <= byline.size()) {
            size_t comma = byline.find(',', from);
            std::string artist = trim(byline.substr(from, comma == std::string::npos
                                                              ? std::string::npos
                                                              : comma - from));
            if (!artist.empty()) track.artists.push_back(artist);
            if (comma == std::string::npos) break;
            from = comma + 1;
        }
        track.durationMs = durationMs;
        item.track = track;
        item.id = PlayableId(PlayableId::Type::TRACK, hexId);
    }

    m_index.emplace(item.id, m_items.size());
    m_items.push_back(std::move(item));
}

bool Playlist::parse(std::istream& in) {
    std::string line;
    PendingInfo pending;
    bool hasPending = false;
    int lineNo = 0;

    while (std::getline(in, line)) {
        lineNo++;
        line = trim(line);
        if (line.empty()) continue;

        if (line.compare(0, 8, "#EXTINF:") == 0) {
            pending = PendingInfo();
            if (!parseExtInf(line, pending)) {
                LOG_ERROR("[Queue] Malformed #EXTINF at line " << lineNo << ": " << line);
                return false;
            }
            hasPending = true;
            continue;
        }

        // #EXTM3U and other directives
        if (line[0] == '#') continue;

        addItem(line, hasPending ? &pending : nullptr);
        hasPending = false;
    }

    if (hasPending) {
        LOG_WARN("[Queue] #EXTINF without a location at end of playlist");
    }
    return true;
}

bool Playlist::loadFile(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        LOG_ERROR("[Queue] Cannot open playlist " << path);
        return false;
    }
    return parse(file);
}

void Playlist::add(const std::string& location) {
    addItem(location, nullptr);
}

const PlaylistItem* Playlist::find(const PlayableId& id) const {
    auto it = m_index.find(id);
    return it == m_index.end() ? nullptr : &m_items[it->second];
}
