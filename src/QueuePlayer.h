/**
 * @file QueuePlayer.h
 * @brief Plays a playlist in order through the mixing line
 *
 * QueuePlayer is the listener of every PlaybackEntry it creates. Listener
 * calls only post an event; a single control thread consumes them, so the
 * entry threads never block on the player and the player state has one
 * owner. Per item:
 *   - INSTANT_PRELOAD: create the next entry (preloaded, no output)
 *   - INSTANT_START_NEXT (at fade-out start): attach the next entry to the
 *     other mixer output so both play during the crossfade
 *   - playbackEnded / playbackError: advance to the next item
 *   - loadingError: retry once, then skip
 */

#ifndef CUETRACK_QUEUE_PLAYER_H
#define CUETRACK_QUEUE_PLAYER_H

#include "AudioFormat.h"
#include "MixingLine.h"
#include "PlaybackEntry.h"
#include "Playlist.h"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <list>
#include <memory>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

class QueuePlayer : public PlaybackEntry::Listener {
public:
    struct EndedItem {
        size_t index;
        PlaybackEntry::EndReason reason;
    };

    QueuePlayer(const PlayerContext& context, const Playlist& playlist, MixingLine& line);
    ~QueuePlayer() override;

    // Non-copyable
    QueuePlayer(const QueuePlayer&) = delete;
    QueuePlayer& operator=(const QueuePlayer&) = delete;

    // Start playing from the first item
    void start();

    // Close the current item and move to the next one (any thread)
    void skip();

    // Close everything and stop the control thread (any thread)
    void stop();

    // Every item has been played, skipped or failed
    bool finished() const { return m_finished.load(std::memory_order_acquire); }

    bool waitFinished(int timeoutMs);

    // Items in the order they stopped playing
    std::vector<EndedItem> endedItems() const;

    // PlaybackEntry::Listener
    void playbackError(PlaybackEntry& entry, const PlaybackError& error) override;
    void playbackEnded(PlaybackEntry& entry) override;
    void playbackHalted(PlaybackEntry& entry, int chunk) override;
    void playbackResumed(PlaybackEntry& entry, int chunk, int diff) override;
    void instantReached(PlaybackEntry& entry, int callbackId, int exactTime) override;
    void startedLoading(PlaybackEntry& entry) override;
    void loadingError(PlaybackEntry& entry, const LoadError& error, bool retried) override;
    void finishedLoading(PlaybackEntry& entry, const TrackOrEpisode& metadata) override;
    std::map<std::string, std::string> metadataFor(const PlayableId& playable) override;

private:
    struct Event {
        enum class Type {
            ENDED, FAILED, LOAD_FAILED, LOADED, INSTANT, SKIP, STOP
        };

        Type type;
        PlaybackEntry* entry = nullptr;
        int callbackId = 0;
        bool retried = false;
    };

    struct Running {
        std::unique_ptr<PlaybackEntry> entry;
        std::thread thread;
        size_t index = 0;
        OutputSlot* output = nullptr;
        bool startNextScheduled = false;
        bool terminated = false;
    };

    void post(Event event);
    void controlLoop();
    void handle(const Event& event);

    Running* find(PlaybackEntry* entry);
    Running* launch(size_t index, bool preloaded);
    Running* launchRetry(Running& failed);
    void attach(Running& running, OutputSlot& output);
    void scheduleStartNext(Running& running);
    size_t nextIndex(size_t after) const;
    void preloadNext();
    void startNext();
    void advance(Running& ended, PlaybackEntry::EndReason reason);
    void recordEnd(Running& running, PlaybackEntry::EndReason reason);
    void reap();
    void closeAll();
    void markFinished();

    PlayerContext m_context;
    const Playlist& m_playlist;
    MixingLine& m_line;

    // Control thread state
    std::list<std::unique_ptr<Running>> m_running;
    Running* m_current = nullptr;
    Running* m_next = nullptr;
    std::set<size_t> m_failedItems;     // could not be loaded as the next item

    std::thread m_controlThread;
    std::mutex m_eventMutex;
    std::condition_variable m_eventCond;
    std::deque<Event> m_events;

    mutable std::mutex m_stateMutex;
    std::condition_variable m_finishedCond;
    std::vector<EndedItem> m_ended;
    std::atomic<bool> m_finished{false};
    std::atomic<bool> m_stopped{false};
};

#endif // CUETRACK_QUEUE_PLAYER_H
