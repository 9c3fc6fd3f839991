/**
 * @file PlaybackId.h
 * @brief Per-attempt playback session identifier
 */

#ifndef CUETRACK_PLAYBACK_ID_H
#define CUETRACK_PLAYBACK_ID_H

#include <string>

/**
 * @brief Generate a fresh playback id
 *
 * 16 random bytes with the first byte forced to 0x01, as 32 lowercase
 * hex characters. Thread-safe.
 */
std::string generatePlaybackId();

#endif // CUETRACK_PLAYBACK_ID_H
