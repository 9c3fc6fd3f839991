/**
 * @file PlaybackEntry.cpp
 * @brief Playback entry state machine
 *
 * Key design: one thread per entry, one lock for the output.
 * - run() loads, then loops: wait for output -> apply seek -> instants and
 *   gain -> decode one block into the output stream
 * - the wait for an output is the only blocking point in the loop; it is
 *   released by setOutput() and by close(), which always notifies
 * - closed/seek/halt state is atomic and read without the lock
 * - a decode error is reported once, and only if nobody closed the entry
 *   first; that path skips playbackEnded()
 */

#include "PlaybackEntry.h"
#include "LogLevel.h"
#include "PlaybackId.h"

#include <stdexcept>

PlaybackEntry::PlaybackEntry(const PlayerContext& context, const AudioFormat& format,
                             PlayableId playable, bool preloaded, Listener& listener)
    : PlaybackEntry(context, format, std::move(playable), preloaded, false, listener)
{
}

PlaybackEntry::PlaybackEntry(const PlayerContext& context, const AudioFormat& format,
                             PlayableId playable, bool preloaded, bool retried,
                             Listener& listener)
    : m_context(context)
    , m_format(format)
    , m_playable(std::move(playable))
    , m_playbackId(generatePlaybackId())
    , m_preloaded(preloaded)
    , m_retried(retried)
    , m_listener(listener)
{
    LOG_DEBUG("[Entry] Created new " << toString() << " for " << m_playable.toUri()
              << (m_retried ? " (retry)" : ""));
}

PlaybackEntry::~PlaybackEntry() = default;

std::unique_ptr<PlaybackEntry> PlaybackEntry::retrySelf(bool preloaded) const {
    if (m_retried) {
        throw std::logic_error(toString() + " has already been retried");
    }

    return std::unique_ptr<PlaybackEntry>(
        new PlaybackEntry(m_context, m_format, m_playable, preloaded, true, m_listener));
}

// ============================================
// Loading
// ============================================

bool PlaybackEntry::load(LoadError& error) {
    LoadedStream stream;
    if (!m_context.loader.load(m_playable, m_context.config.preferredQuality, m_preloaded,
                               this, stream, error)) {
        return false;
    }
    if (!stream.in) {
        error = LoadError(LoadError::Kind::TRANSPORT, "loader returned no stream");
        return false;
    }

    m_metadata = TrackOrEpisode(stream.track, stream.episode);
    m_contentMetrics = stream.metrics;

    if (m_playable.isEpisode() && stream.episode) {
        LOG_INFO("Loaded episode. {name: '" << stream.episode->name
                 << "', uri: " << m_playable.toUri() << ", id: " << m_playbackId << "}");
    } else if (!m_playable.isEpisode() && stream.track) {
        LOG_INFO("Loaded track. {name: '" << stream.track->name
                 << "', artists: '" << m_metadata.artistsString()
                 << "', uri: " << m_playable.toUri() << ", id: " << m_playbackId << "}");
    }

    m_crossfade = std::make_unique<CrossfadeController>(
        m_playbackId, m_metadata.durationMs(), m_listener.metadataFor(m_playable),
        m_context.config);
    if (m_crossfade->hasAnyFadeOut() || m_context.config.preloadEnabled) {
        notifyInstant(INSTANT_PRELOAD, m_crossfade->fadeOutStartTimeMin() - PRELOAD_ADVANCE_MS);
    }

    Codec codec = stream.in->codec();
    std::string description = stream.in->describe();
    m_decoder = m_context.decoderFactory(codec, std::move(stream.in), m_format,
                                         stream.normalizationData, m_context.config,
                                         m_metadata.durationMs(), error);
    if (!m_decoder) {
        return false;
    }

    LOG_DEBUG("[Entry] Loaded " << codecName(codec) << " codec. {of: " << description
              << ", decoder: " << m_decoder->name() << ", playbackId: " << m_playbackId << "}");

    m_loaded.store(true, std::memory_order_release);
    return true;
}

// ============================================
// Play loop
// ============================================

void PlaybackEntry::run() {
    m_listener.startedLoading(*this);

    LoadError loadError;
    if (!load(loadError)) {
        close();
        m_listener.loadingError(*this, loadError, m_retried);
        LOG_DEBUG("[Entry] " << toString() << " terminated at loading: " << loadError.describe());
        return;
    }

    applyPendingSeek();

    m_listener.finishedLoading(*this, m_metadata);

    bool canGetTime = true;
    while (!m_closed.load(std::memory_order_acquire)) {
        OutputSlot* output = waitForOutput();
        if (!output) break;

        applyPendingSeek();

        if (canGetTime) {
            int time = 0;
            if (m_decoder->time(time)) {
                checkInstants(time);

                // A callback may have moved us off the output
                output = currentOutput();
                if (!output) continue;

                output->gain(m_crossfade->gain(time));
            } else {
                canGetTime = false;
                LOG_DEBUG("[Entry] Time unavailable for " << toString()
                          << ", instants and crossfade disabled");
            }
        }

        PlaybackError playbackError;
        int written = m_decoder->writeSomeTo(output->stream(), playbackError);
        if (written == Decoder::END_OF_STREAM) {
            int time = 0;
            if (m_decoder->time(time)) {
                LOG_DEBUG("[Entry] Player time offset is " << (m_metadata.durationMs() - time)
                          << ". {id: " << m_playbackId << "}");
            }

            close();
            break;
        }

        if (written == Decoder::WRITE_FAILED) {
            // Only the thread that flips closed reports the error
            if (!m_closed.exchange(true, std::memory_order_acq_rel)) {
                clearOutput();
                LOG_ERROR("[Entry] " << toString() << " failed: " << playbackError.describe());
                m_listener.playbackError(*this, playbackError);
                return;
            }

            break;
        }
    }

    m_listener.playbackEnded(*this);
    LOG_DEBUG("[Entry] " << toString() << " terminated.");
}

void PlaybackEntry::applyPendingSeek() {
    int pos = m_seekTime.exchange(-1, std::memory_order_acq_rel);
    if (pos != -1) {
        LOG_DEBUG("[Entry] Seeking " << toString() << " to " << pos << " ms");
        m_decoder->seek(pos);
    }
}

// ============================================
// Instants
// ============================================

void PlaybackEntry::notifyInstant(int callbackId, int whenMs) {
    if (m_loaded.load(std::memory_order_acquire)) {
        int time = 0;
        if (!m_decoder->time(time)) {
            LOG_DEBUG("[Entry] Dropping instant " << callbackId << " for " << toString()
                      << ": time unavailable");
            return;
        }

        if (time >= whenMs) {
            m_listener.instantReached(*this, callbackId, time);
            return;
        }
    }

    std::lock_guard<std::mutex> lock(m_instantsMutex);
    auto it = m_instants.find(whenMs);
    if (it != m_instants.end() && it->second != callbackId) {
        LOG_DEBUG("[Entry] Instant " << callbackId << " replaces " << it->second
                  << " at " << whenMs << " ms");
    }
    m_instants[whenMs] = callbackId;
}

void PlaybackEntry::checkInstants(int timeMs) {
    while (!m_closed.load(std::memory_order_acquire)) {
        int callbackId;
        {
            std::lock_guard<std::mutex> lock(m_instantsMutex);
            if (m_instants.empty()) return;

            auto first = m_instants.begin();
            if (timeMs < first->first) return;

            callbackId = first->second;
            m_instants.erase(first);
        }

        m_listener.instantReached(*this, callbackId, timeMs);
    }
}

size_t PlaybackEntry::pendingInstants() const {
    std::lock_guard<std::mutex> lock(m_instantsMutex);
    return m_instants.size();
}

// ============================================
// Output attachment
// ============================================

void PlaybackEntry::setOutput(OutputSlot& output) {
    {
        std::lock_guard<std::mutex> lock(m_outputMutex);
        if (!m_closed.load(std::memory_order_acquire) && m_output == nullptr) {
            m_output = &output;
            m_outputCond.notify_all();
            output.toggle(true);
            LOG_DEBUG("[Entry] " << toString() << " has been added to output.");
            return;
        }
    }

    output.clear();
    throw std::logic_error("Cannot set output for " + toString());
}

OutputSlot* PlaybackEntry::waitForOutput() {
    std::unique_lock<std::mutex> lock(m_outputMutex);
    m_outputCond.wait(lock, [this] {
        return m_output != nullptr || m_closed.load(std::memory_order_acquire);
    });

    if (m_closed.load(std::memory_order_acquire)) return nullptr;
    return m_output;
}

OutputSlot* PlaybackEntry::currentOutput() const {
    std::lock_guard<std::mutex> lock(m_outputMutex);
    return m_output;
}

bool PlaybackEntry::hasOutput() const {
    return currentOutput() != nullptr;
}

void PlaybackEntry::clearOutput() {
    std::lock_guard<std::mutex> lock(m_outputMutex);
    if (m_output) {
        OutputSlot* tmp = m_output;
        m_output = nullptr;

        tmp->toggle(false);
        tmp->clear();

        LOG_DEBUG("[Entry] " << toString() << " has been removed from output.");
    }

    // Also wakes a loop waiting for an output so it can see closed
    m_outputCond.notify_all();
}

void PlaybackEntry::seek(int positionMs) {
    m_seekTime.store(positionMs, std::memory_order_release);

    std::lock_guard<std::mutex> lock(m_outputMutex);
    if (m_output) m_output->stream().emptyBuffer();
}

void PlaybackEntry::close() {
    m_closed.store(true, std::memory_order_release);
    clearOutput();
}

bool PlaybackEntry::closeIfUseless() {
    if (hasOutput()) return false;

    close();
    return true;
}

// ============================================
// Accessors
// ============================================

int PlaybackEntry::time() const {
    if (!m_loaded.load(std::memory_order_acquire)) return -1;

    int t = 0;
    return m_decoder->time(t) ? t : -1;
}

const TrackOrEpisode* PlaybackEntry::metadata() const {
    return m_loaded.load(std::memory_order_acquire) ? &m_metadata : nullptr;
}

const CrossfadeController* PlaybackEntry::crossfade() const {
    return m_loaded.load(std::memory_order_acquire) ? m_crossfade.get() : nullptr;
}

PlayerMetrics PlaybackEntry::metrics() const {
    PlayerMetrics metrics;
    if (!m_loaded.load(std::memory_order_acquire)) return metrics;

    metrics.content = m_contentMetrics;
    metrics.decoder = m_decoder->name();
    metrics.durationMs = m_metadata.durationMs();
    metrics.fadeInDurationMs = m_crossfade->fadeInDuration();
    metrics.fadeOutDurationMs = m_crossfade->fadeOutDuration();
    return metrics;
}

std::string PlaybackEntry::toString() const {
    return "PlaybackEntry{" + m_playbackId + "}";
}

// ============================================
// Stream stalls
// ============================================

void PlaybackEntry::streamReadHalted(int chunk, int64_t timeMs) {
    m_playbackHaltedAt.store(timeMs, std::memory_order_release);
    m_listener.playbackHalted(*this, chunk);
}

void PlaybackEntry::streamReadResumed(int chunk, int64_t timeMs) {
    int64_t haltedAt = m_playbackHaltedAt.exchange(0, std::memory_order_acq_rel);
    if (haltedAt == 0) return;

    m_listener.playbackResumed(*this, chunk, static_cast<int>(timeMs - haltedAt));
}
