/**
 * @file PlaybackEntry.h
 * @brief One playback attempt of one content item
 *
 * A PlaybackEntry owns a single item from loading to the end of playback:
 * it loads the content, waits for an output slot, then decodes into that
 * slot on its own thread (run()), applying crossfade gain and firing
 * time-keyed instant notifications for the queue controller.
 *
 * Threading:
 * - run() is called exactly once, on a thread dedicated to this entry
 * - setOutput(), seek(), close(), closeIfUseless(), notifyInstant() and the
 *   accessors may be called from any thread
 * - every Listener call is made synchronously on the entry's thread (halt
 *   notifications come from whichever thread reads the stream), so
 *   listeners must not block there
 *
 * The entry must outlive its run() call.
 */

#ifndef CUETRACK_PLAYBACK_ENTRY_H
#define CUETRACK_PLAYBACK_ENTRY_H

#include "AudioFormat.h"
#include "AudioStream.h"
#include "ContentLoader.h"
#include "CrossfadeController.h"
#include "Decoder.h"
#include "OutputSlot.h"
#include "PlayableId.h"
#include "PlaybackErrors.h"
#include "TrackOrEpisode.h"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>

/**
 * @brief Collaborators shared by every entry of a player
 */
struct PlayerContext {
    ContentLoader& loader;
    const Config& config;
    DecoderFactory decoderFactory = Decoder::create;
};

struct PlayerMetrics {
    LoadMetrics content;
    std::string decoder;        // empty if not loaded
    int durationMs = 0;
    int fadeInDurationMs = 0;
    int fadeOutDurationMs = 0;
};

class PlaybackEntry : public HaltListener {
public:
    static constexpr int INSTANT_PRELOAD = 1;
    static constexpr int INSTANT_START_NEXT = 2;
    static constexpr int INSTANT_END = 3;

    // How far ahead of the fade out the next item is preloaded
    static constexpr int PRELOAD_ADVANCE_MS = 20000;

    enum class EndReason {
        END_PLAY,       // default, nothing more specific known
        TRACK_DONE,
        TRACK_ERROR,
        FORWARD_BTN
    };

    class Listener {
    public:
        virtual ~Listener() = default;

        /**
         * @brief An unrecoverable decode or I/O error stopped playback
         *
         * Terminal: playbackEnded() is not called for this entry.
         */
        virtual void playbackError(PlaybackEntry& entry, const PlaybackError& error) = 0;

        /**
         * @brief The play loop exited (end of stream or close)
         */
        virtual void playbackEnded(PlaybackEntry& entry) = 0;

        /**
         * @brief Reading the stream stalled while fetching the given chunk
         */
        virtual void playbackHalted(PlaybackEntry& entry, int chunk) = 0;

        /**
         * @brief Reading resumed after a stall
         * @param diff Milliseconds the stall lasted
         */
        virtual void playbackResumed(PlaybackEntry& entry, int chunk, int diff) = 0;

        /**
         * @brief A requested instant was reached. Called from the play loop, be quick.
         * @param exactTime Playback time at which it was detected
         */
        virtual void instantReached(PlaybackEntry& entry, int callbackId, int exactTime) = 0;

        virtual void startedLoading(PlaybackEntry& entry) = 0;

        /**
         * @brief Loading failed. Terminal for this entry.
         * @param retried Whether this entry already was a retry
         */
        virtual void loadingError(PlaybackEntry& entry, const LoadError& error, bool retried) = 0;

        virtual void finishedLoading(PlaybackEntry& entry, const TrackOrEpisode& metadata) = 0;

        /**
         * @brief Extra metadata used to configure the crossfade
         */
        virtual std::map<std::string, std::string> metadataFor(const PlayableId& playable) = 0;
    };

    PlaybackEntry(const PlayerContext& context, const AudioFormat& format,
                  PlayableId playable, bool preloaded, Listener& listener);
    ~PlaybackEntry() override;

    // Non-copyable
    PlaybackEntry(const PlaybackEntry&) = delete;
    PlaybackEntry& operator=(const PlaybackEntry&) = delete;

    /**
     * @brief New entry for the same content, marked as a retry
     * @throws std::logic_error if this entry already is a retry
     */
    std::unique_ptr<PlaybackEntry> retrySelf(bool preloaded) const;

    /**
     * @brief Load and play. Returns when the entry terminates.
     */
    void run();

    /**
     * @brief Attach the output slot; playback starts as soon as this returns
     * @throws std::logic_error if closed or an output is already attached.
     *         The offered output is cleared in that case.
     */
    void setOutput(OutputSlot& output);

    /**
     * @brief Request a seek; a newer request replaces a pending one
     */
    void seek(int positionMs);

    /**
     * @brief Ask to be notified when playback reaches the given time
     *
     * Fires immediately (on the calling thread) if that time has already
     * passed. An instant at the same time as a pending one replaces it.
     */
    void notifyInstant(int callbackId, int whenMs);

    /**
     * @brief Terminate the entry and detach its output. Idempotent.
     */
    void close();

    /**
     * @brief Close this entry if it is not attached to an output
     * @return Whether it has been closed
     */
    bool closeIfUseless();

    /**
     * @brief Current position in milliseconds, -1 if not loaded or unavailable
     */
    int time() const;

    // Null until finishedLoading
    const TrackOrEpisode* metadata() const;
    const CrossfadeController* crossfade() const;

    PlayerMetrics metrics() const;

    const std::string& playbackId() const { return m_playbackId; }
    const PlayableId& playable() const { return m_playable; }
    bool isPreloaded() const { return m_preloaded; }
    bool isRetried() const { return m_retried; }
    bool isClosed() const { return m_closed.load(std::memory_order_acquire); }
    bool hasOutput() const;
    size_t pendingInstants() const;

    EndReason endReason() const { return m_endReason.load(std::memory_order_acquire); }
    void setEndReason(EndReason reason) { m_endReason.store(reason, std::memory_order_release); }

    // HaltListener
    void streamReadHalted(int chunk, int64_t timeMs) override;
    void streamReadResumed(int chunk, int64_t timeMs) override;

    std::string toString() const;

private:
    PlaybackEntry(const PlayerContext& context, const AudioFormat& format,
                  PlayableId playable, bool preloaded, bool retried, Listener& listener);

    bool load(LoadError& error);
    void applyPendingSeek();
    void checkInstants(int timeMs);

    // Blocks until an output is attached; null once closed
    OutputSlot* waitForOutput();
    OutputSlot* currentOutput() const;
    void clearOutput();

    const PlayerContext m_context;
    const AudioFormat m_format;
    const PlayableId m_playable;
    const std::string m_playbackId;
    const bool m_preloaded;
    const bool m_retried;
    Listener& m_listener;

    // Output attachment (m_outputMutex guards m_output)
    mutable std::mutex m_outputMutex;
    std::condition_variable m_outputCond;
    OutputSlot* m_output = nullptr;

    // Pending instants, time (ms) -> callback id
    mutable std::mutex m_instantsMutex;
    std::map<int, int> m_instants;

    std::atomic<bool> m_closed{false};
    std::atomic<int> m_seekTime{-1};
    std::atomic<int64_t> m_playbackHaltedAt{0};
    std::atomic<EndReason> m_endReason{EndReason::END_PLAY};

    // Written by load() on the entry thread, published by m_loaded
    std::atomic<bool> m_loaded{false};
    TrackOrEpisode m_metadata;
    LoadMetrics m_contentMetrics;
    std::unique_ptr<CrossfadeController> m_crossfade;
    std::unique_ptr<Decoder> m_decoder;
};

#endif // CUETRACK_PLAYBACK_ENTRY_H
