/**
 * @file PlayableId.h
 * @brief Identifier of a piece of playable content (track or episode)
 *
 * URI form: cuetrack:track:<hex id> / cuetrack:episode:<hex id>
 */

#ifndef CUETRACK_PLAYABLE_ID_H
#define CUETRACK_PLAYABLE_ID_H

#include <string>

class PlayableId {
public:
    enum class Type { TRACK, EPISODE };

    PlayableId() = default;
    PlayableId(Type type, std::string hexId);

    /**
     * @brief Parse a URI of the form cuetrack:<type>:<hex id>
     * @return false if the URI is malformed (out is left untouched)
     */
    static bool fromUri(const std::string& uri, PlayableId& out);

    std::string toUri() const;

    Type type() const { return m_type; }
    const std::string& hexId() const { return m_hexId; }
    bool isEpisode() const { return m_type == Type::EPISODE; }

    bool operator==(const PlayableId& o) const { return m_type == o.m_type && m_hexId == o.m_hexId; }
    bool operator!=(const PlayableId& o) const { return !(*this == o); }
    bool operator<(const PlayableId& o) const {
        return m_type != o.m_type ? m_type < o.m_type : m_hexId < o.m_hexId;
    }

private:
    Type m_type = Type::TRACK;
    std::string m_hexId;
};

#endif // CUETRACK_PLAYABLE_ID_H
