/**
 * @file QueuePlayer.cpp
 * @brief Playlist playback controller
 */

#include "QueuePlayer.h"
#include "LogLevel.h"

#include <chrono>
#include <stdexcept>

static const char* endReasonName(PlaybackEntry::EndReason reason) {
    switch (reason) {
        case PlaybackEntry::EndReason::END_PLAY:    return "end-play";
        case PlaybackEntry::EndReason::TRACK_DONE:  return "track-done";
        case PlaybackEntry::EndReason::TRACK_ERROR: return "track-error";
        case PlaybackEntry::EndReason::FORWARD_BTN: return "forward-btn";
    }
    return "unknown";
}

QueuePlayer::QueuePlayer(const PlayerContext& context, const Playlist& playlist, MixingLine& line)
    : m_context(context)
    , m_playlist(playlist)
    , m_line(line)
{
}

QueuePlayer::~QueuePlayer() {
    stop();
}

void QueuePlayer::start() {
    if (m_controlThread.joinable()) return;
    m_controlThread = std::thread(&QueuePlayer::controlLoop, this);
}

void QueuePlayer::skip() {
    Event event;
    event.type = Event::Type::SKIP;
    post(event);
}

void QueuePlayer::stop() {
    if (!m_controlThread.joinable()) return;

    Event event;
    event.type = Event::Type::STOP;
    post(event);

    if (m_controlThread.get_id() != std::this_thread::get_id()) {
        m_controlThread.join();
    }
}

bool QueuePlayer::waitFinished(int timeoutMs) {
    std::unique_lock<std::mutex> lock(m_stateMutex);
    return m_finishedCond.wait_for(lock, std::chrono::milliseconds(timeoutMs), [this] {
        return m_finished.load(std::memory_order_acquire);
    });
}

std::vector<QueuePlayer::EndedItem> QueuePlayer::endedItems() const {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_ended;
}

// ============================================
// Listener (entry threads): post and return
// ============================================

void QueuePlayer::post(Event event) {
    std::lock_guard<std::mutex> lock(m_eventMutex);
    m_events.push_back(event);
    m_eventCond.notify_one();
}

void QueuePlayer::playbackError(PlaybackEntry& entry, const PlaybackError& error) {
    LOG_ERROR("[Queue] Playback failed for " << entry.playable().toUri() << ": " << error.describe());

    Event event;
    event.type = Event::Type::FAILED;
    event.entry = &entry;
    post(event);
}

void QueuePlayer::playbackEnded(PlaybackEntry& entry) {
    Event event;
    event.type = Event::Type::ENDED;
    event.entry = &entry;
    post(event);
}

void QueuePlayer::playbackHalted(PlaybackEntry& entry, int chunk) {
    LOG_WARN("[Queue] Playback halted on " << entry.toString() << " at chunk " << chunk);
}

void QueuePlayer::playbackResumed(PlaybackEntry& entry, int chunk, int diff) {
    LOG_INFO("[Queue] Playback resumed on " << entry.toString() << " at chunk " << chunk
             << " after " << diff << " ms");
}

void QueuePlayer::instantReached(PlaybackEntry& entry, int callbackId, int exactTime) {
    LOG_DEBUG("[Queue] Instant " << callbackId << " reached at " << exactTime << " ms on "
              << entry.toString());

    Event event;
    event.type = Event::Type::INSTANT;
    event.entry = &entry;
    event.callbackId = callbackId;
    post(event);
}

void QueuePlayer::startedLoading(PlaybackEntry& entry) {
    LOG_DEBUG("[Queue] " << entry.toString() << " started loading " << entry.playable().toUri());
}

void QueuePlayer::loadingError(PlaybackEntry& entry, const LoadError& error, bool retried) {
    LOG_WARN("[Queue] Failed loading " << entry.playable().toUri() << ": " << error.describe()
             << (retried ? " (after retry)" : ""));

    Event event;
    event.type = Event::Type::LOAD_FAILED;
    event.entry = &entry;
    event.retried = retried;
    post(event);
}

void QueuePlayer::finishedLoading(PlaybackEntry& entry, const TrackOrEpisode& metadata) {
    LOG_DEBUG("[Queue] " << entry.toString() << " loaded '" << metadata.name() << "' ("
              << metadata.durationMs() << " ms)");

    Event event;
    event.type = Event::Type::LOADED;
    event.entry = &entry;
    post(event);
}

std::map<std::string, std::string> QueuePlayer::metadataFor(const PlayableId& playable) {
    const PlaylistItem* item = m_playlist.find(playable);
    if (!item) return {};
    return item->metadata;
}

// ============================================
// Control thread
// ============================================

void QueuePlayer::controlLoop() {
    if (m_playlist.empty()) {
        LOG_WARN("[Queue] Nothing to play");
        markFinished();
    } else {
        m_current = launch(0, false);
        attach(*m_current, m_line.firstOut());
        if (m_context.config.startPositionMs > 0) {
            m_current->entry->seek(m_context.config.startPositionMs);
        }
    }

    while (!m_stopped.load(std::memory_order_acquire)) {
        Event event;
        {
            std::unique_lock<std::mutex> lock(m_eventMutex);
            m_eventCond.wait(lock, [this] { return !m_events.empty(); });
            event = m_events.front();
            m_events.pop_front();
        }

        handle(event);

        // Events still queued may name an entry that ended; free it once they are handled
        bool drained;
        {
            std::lock_guard<std::mutex> lock(m_eventMutex);
            drained = m_events.empty();
        }
        if (drained) reap();

        if (!m_stopped.load(std::memory_order_acquire) &&
            !m_finished.load(std::memory_order_acquire) && m_current == nullptr &&
            m_running.empty()) {
            markFinished();
        }
    }

    LOG_DEBUG("[Queue] Control loop stopped");
}

QueuePlayer::Running* QueuePlayer::find(PlaybackEntry* entry) {
    for (auto& running : m_running) {
        if (running->entry.get() == entry) return running.get();
    }
    return nullptr;
}

QueuePlayer::Running* QueuePlayer::launch(size_t index, bool preloaded) {
    const PlaylistItem& item = m_playlist.items()[index];

    auto running = std::make_unique<Running>();
    running->index = index;
    running->entry = std::make_unique<PlaybackEntry>(m_context, m_line.format(), item.id,
                                                     preloaded, *this);
    running->thread = std::thread(&PlaybackEntry::run, running->entry.get());

    LOG_DEBUG("[Queue] Started " << running->entry->toString() << " for item " << index
              << (preloaded ? " (preload)" : ""));

    m_running.push_back(std::move(running));
    return m_running.back().get();
}

QueuePlayer::Running* QueuePlayer::launchRetry(Running& failed) {
    auto running = std::make_unique<Running>();
    running->index = failed.index;
    running->entry = failed.entry->retrySelf(failed.entry->isPreloaded());
    running->thread = std::thread(&PlaybackEntry::run, running->entry.get());

    LOG_INFO("[Queue] Retrying item " << failed.index << " as " << running->entry->toString());

    m_running.push_back(std::move(running));
    return m_running.back().get();
}

void QueuePlayer::attach(Running& running, OutputSlot& output) {
    // Remembered even if rejected, a retry takes the same slot
    running.output = &output;
    try {
        running.entry->setOutput(output);
    } catch (const std::logic_error& e) {
        // Already closed: its terminal event is on the way
        LOG_WARN("[Queue] " << e.what());
    }
}

void QueuePlayer::scheduleStartNext(Running& running) {
    if (running.startNextScheduled) return;

    const CrossfadeController* crossfade = running.entry->crossfade();
    const TrackOrEpisode* metadata = running.entry->metadata();
    if (!crossfade || !metadata) return;

    running.startNextScheduled = true;
    if (crossfade->hasAnyFadeOut() && nextIndex(running.index) < m_playlist.size()) {
        running.entry->notifyInstant(PlaybackEntry::INSTANT_START_NEXT,
                                     crossfade->fadeOutStartTimeMin());
    }
    if (metadata->durationMs() > 0) {
        running.entry->notifyInstant(PlaybackEntry::INSTANT_END, metadata->durationMs());
    }
}

size_t QueuePlayer::nextIndex(size_t after) const {
    size_t index = after + 1;
    while (m_failedItems.count(index)) index++;
    return index;
}

void QueuePlayer::preloadNext() {
    if (!m_current || m_next) return;

    size_t index = nextIndex(m_current->index);
    if (index >= m_playlist.size()) return;

    m_next = launch(index, true);
}

void QueuePlayer::startNext() {
    preloadNext();
    if (!m_next) return;

    Running* old = m_current;
    OutputSlot& output = old->output ? static_cast<OutputSlot&>(m_line.other(*old->output))
                                     : static_cast<OutputSlot&>(m_line.firstOut());
    old->entry->setEndReason(PlaybackEntry::EndReason::TRACK_DONE);

    LOG_DEBUG("[Queue] Crossfading " << old->entry->toString() << " into "
              << m_next->entry->toString());

    m_current = m_next;
    m_next = nullptr;
    attach(*m_current, output);
    scheduleStartNext(*m_current);
}

void QueuePlayer::advance(Running& ended, PlaybackEntry::EndReason reason) {
    recordEnd(ended, reason);

    OutputSlot& output = ended.output ? *ended.output
                                      : static_cast<OutputSlot&>(m_line.firstOut());
    if (m_next) {
        m_current = m_next;
        m_next = nullptr;
    } else if (nextIndex(ended.index) < m_playlist.size()) {
        m_current = launch(nextIndex(ended.index), false);
    } else {
        m_current = nullptr;
        LOG_INFO("[Queue] End of playlist");
        return;
    }

    attach(*m_current, output);
    scheduleStartNext(*m_current);
}

void QueuePlayer::recordEnd(Running& running, PlaybackEntry::EndReason reason) {
    running.entry->setEndReason(reason);

    PlayerMetrics metrics = running.entry->metrics();
    LOG_INFO("[Queue] Finished " << running.entry->playable().toUri()
             << " {reason: " << endReasonName(reason)
             << ", location: " << metrics.content.location
             << ", preloaded: " << (metrics.content.preloaded ? "true" : "false")
             << ", loadTime: " << metrics.content.loadTimeMs << " ms"
             << ", decoder: " << (metrics.decoder.empty() ? "none" : metrics.decoder)
             << ", duration: " << metrics.durationMs << " ms"
             << ", fadeIn: " << metrics.fadeInDurationMs << " ms"
             << ", fadeOut: " << metrics.fadeOutDurationMs << " ms}");

    std::lock_guard<std::mutex> lock(m_stateMutex);
    m_ended.push_back(EndedItem{running.index, reason});
}

void QueuePlayer::handle(const Event& event) {
    if (event.type == Event::Type::STOP) {
        closeAll();
        m_stopped.store(true, std::memory_order_release);
        return;
    }

    if (event.type == Event::Type::SKIP) {
        if (m_current) {
            LOG_INFO("[Queue] Skipping " << m_current->entry->playable().toUri());
            m_current->entry->setEndReason(PlaybackEntry::EndReason::FORWARD_BTN);
            m_current->entry->close();
        }
        return;
    }

    Running* running = find(event.entry);
    if (!running) return;

    PlaybackEntry::EndReason requested = running->entry->endReason();

    switch (event.type) {
        case Event::Type::LOADED:
            if (running == m_current) scheduleStartNext(*running);
            break;

        case Event::Type::INSTANT:
            if (running != m_current) break;
            if (event.callbackId == PlaybackEntry::INSTANT_PRELOAD) {
                preloadNext();
            } else if (event.callbackId == PlaybackEntry::INSTANT_START_NEXT) {
                startNext();
            } else if (event.callbackId == PlaybackEntry::INSTANT_END) {
                running->entry->setEndReason(PlaybackEntry::EndReason::TRACK_DONE);
            }
            break;

        case Event::Type::ENDED:
            running->terminated = true;
            if (running == m_current) {
                advance(*running, requested == PlaybackEntry::EndReason::END_PLAY
                                      ? PlaybackEntry::EndReason::TRACK_DONE : requested);
            } else if (running == m_next) {
                m_next = nullptr;
            } else {
                recordEnd(*running, requested == PlaybackEntry::EndReason::END_PLAY
                                        ? PlaybackEntry::EndReason::TRACK_DONE : requested);
            }
            break;

        case Event::Type::FAILED:
            running->terminated = true;
            if (running == m_current) {
                advance(*running, PlaybackEntry::EndReason::TRACK_ERROR);
            } else if (running == m_next) {
                m_next = nullptr;
            } else {
                recordEnd(*running, PlaybackEntry::EndReason::TRACK_ERROR);
            }
            break;

        case Event::Type::LOAD_FAILED:
            running->terminated = true;
            if (running != m_current && running != m_next) break;

            if (requested == PlaybackEntry::EndReason::FORWARD_BTN) {
                // Skipped while loading
                if (running == m_current) advance(*running, requested);
                else m_next = nullptr;
            } else if (!event.retried) {
                Running* retry = launchRetry(*running);
                if (running == m_current) {
                    m_current = retry;
                    attach(*retry, running->output ? *running->output
                                                   : static_cast<OutputSlot&>(m_line.firstOut()));
                } else {
                    m_next = retry;
                }
            } else if (running == m_current) {
                advance(*running, PlaybackEntry::EndReason::TRACK_ERROR);
            } else {
                // The item after the current one cannot be loaded; skip it
                recordEnd(*running, PlaybackEntry::EndReason::TRACK_ERROR);
                m_failedItems.insert(running->index);
                m_next = nullptr;
                preloadNext();
            }
            break;

        default:
            break;
    }
}

void QueuePlayer::reap() {
    for (auto it = m_running.begin(); it != m_running.end();) {
        Running* running = it->get();
        if (!running->terminated || running == m_current || running == m_next) {
            ++it;
            continue;
        }

        if (running->thread.joinable()) running->thread.join();
        it = m_running.erase(it);
    }
}

void QueuePlayer::closeAll() {
    for (auto& running : m_running) {
        running->entry->close();
    }
    for (auto& running : m_running) {
        if (running->thread.joinable()) running->thread.join();
    }

    m_running.clear();
    m_current = nullptr;
    m_next = nullptr;
}

void QueuePlayer::markFinished() {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    m_finished.store(true, std::memory_order_release);
    m_finishedCond.notify_all();
}
