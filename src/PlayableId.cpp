/**
 * @file PlayableId.cpp
 * @brief PlayableId URI parsing and formatting
 */

#include "PlayableId.h"

#include <algorithm>
#include <cctype>

static const char URI_PREFIX[] = "cuetrack:";

PlayableId::PlayableId(Type type, std::string hexId)
    : m_type(type)
    , m_hexId(std::move(hexId))
{
}

bool PlayableId::fromUri(const std::string& uri, PlayableId& out) {
    const std::string prefix(URI_PREFIX);
    if (uri.compare(0, prefix.size(), prefix) != 0) return false;

    size_t typeEnd = uri.find(':', prefix.size());
    if (typeEnd == std::string::npos) return false;

    std::string type = uri.substr(prefix.size(), typeEnd - prefix.size());
    std::string id = uri.substr(typeEnd + 1);
    if (id.empty()) return false;

    bool hex = std::all_of(id.begin(), id.end(),
                           [](unsigned char c) { return std::isxdigit(c) != 0; });
    if (!hex) return false;

    std::transform(id.begin(), id.end(), id.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (type == "track") {
        out = PlayableId(Type::TRACK, id);
    } else if (type == "episode") {
        out = PlayableId(Type::EPISODE, id);
    } else {
        return false;
    }
    return true;
}

std::string PlayableId::toUri() const {
    return std::string(URI_PREFIX) + (m_type == Type::EPISODE ? "episode:" : "track:") + m_hexId;
}
