/**
 * @file OutputSlot.h
 * @brief Toggleable audio destination a playback entry writes into
 */

#ifndef CUETRACK_OUTPUT_SLOT_H
#define CUETRACK_OUTPUT_SLOT_H

#include <cstdint>
#include <cstddef>

/**
 * @brief Writable PCM stream (S16_LE interleaved)
 */
class SampleStream {
public:
    virtual ~SampleStream() = default;

    /**
     * @brief Write PCM bytes, blocking while the destination is full
     * @return false on an I/O failure
     */
    virtual bool write(const uint8_t* data, size_t len) = 0;

    // Drop everything buffered but not yet played
    virtual void emptyBuffer() = 0;
};

class OutputSlot {
public:
    virtual ~OutputSlot() = default;

    // Enable or disable the slot; writes to a disabled slot are dropped
    virtual void toggle(bool enabled) = 0;

    // Reset the slot to its idle state (disabled, empty, unity gain)
    virtual void clear() = 0;

    // Gain applied when the slot is mixed, in [0,1]
    virtual void gain(float g) = 0;

    virtual SampleStream& stream() = 0;
};

#endif // CUETRACK_OUTPUT_SLOT_H
