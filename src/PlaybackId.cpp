/**
 * @file PlaybackId.cpp
 * @brief Playback id generation
 */

#include "PlaybackId.h"

#include <cstdint>
#include <iomanip>
#include <mutex>
#include <random>
#include <sstream>

std::string generatePlaybackId() {
    static std::mutex s_mutex;
    static std::mt19937 s_rng{std::random_device{}()};

    uint8_t bytes[16];
    {
        std::lock_guard<std::mutex> lock(s_mutex);
        std::uniform_int_distribution<int> dist(0, 255);
        for (auto& b : bytes) {
            b = static_cast<uint8_t>(dist(s_rng));
        }
    }
    bytes[0] = 1;

    std::ostringstream out;
    out << std::hex << std::setfill('0');
    for (uint8_t b : bytes) {
        out << std::setw(2) << static_cast<int>(b);
    }
    return out.str();
}
