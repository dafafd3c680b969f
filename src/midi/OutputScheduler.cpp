#include "handdeck/midi/OutputScheduler.hpp"
#include "handdeck/control/ValueMapping.hpp"

namespace handdeck {
namespace midi {

using control::ControlId;
using control::DeckId;

OutputScheduler::OutputScheduler(std::shared_ptr<MidiPort> port,
                                 const MidiMapping& mapping,
                                 DeckArray decks,
                                 const Config& config)
    : port_(std::move(port))
    , mapping_(mapping)
    , decks_(std::move(decks))
    , config_(config) {
}

OutputScheduler::~OutputScheduler() {
    stop();
}

bool OutputScheduler::start() {
    if (running_.load()) {
        LOG_WARNING("OutputScheduler already running");
        return true;
    }
    if (!port_) {
        LOG_ERROR("OutputScheduler: no MIDI port");
        return false;
    }
    if (!config_.isValid()) {
        LOG_ERROR("OutputScheduler: invalid configuration");
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        stopped_ = false;
    }
    running_.store(true);
    thread_ = std::thread(&OutputScheduler::schedulerLoop, this);

    LOG_INFO("OutputScheduler started at " + std::to_string(config_.rateHz) + " Hz");
    return true;
}

void OutputScheduler::stop() {
    bool expected = true;
    if (!running_.compare_exchange_strong(expected, false)) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(queueMutex_);
    }
    wakeCv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }

    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        stopped_ = true;
    }
    // Toggle presses queued during shutdown are still delivered
    size_t flushed = flushToggles();

    LOG_INFO("OutputScheduler stopped (sent " + std::to_string(messagesSent_.load()) +
             " CC, " + std::to_string(togglesSent_.load()) + " toggles, flushed " +
             std::to_string(flushed) + " at shutdown)");
}

void OutputScheduler::enqueueToggle(DeckId deck, ControlId control) {
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        if (stopped_) {
            togglesDropped_++;
            LOG_WARNING("OutputScheduler stopped, dropped " + control::deck_to_string(deck) +
                        " " + control::control_to_string(control) + " toggle");
            return;
        }
        toggleQueue_.push_back(PendingToggle{deck, control});
    }
    wakeCv_.notify_one();
}

void OutputScheduler::runTick(core::Timestamp now) {
    std::lock_guard<std::mutex> lock(sendMutex_);
    ticks_++;

    if (!portAvailable_.load()) {
        tryReconnect(now);
    }

    for (int d = 0; d < control::kDeckCount; ++d) {
        const auto& deck = decks_[d];
        if (!deck) {
            continue;
        }
        deck->settle(now);
        control::UpdateBatch batch = deck->collect_updates();
        suppressed_ += static_cast<uint64_t>(batch.suppressed_by_takeover);

        for (const auto& update : batch.updates) {
            if (!portAvailable_.load()) {
                break;
            }
            sendMessage(mapping_.outbound(control::deck_from_index(d), update.control,
                                          update.midi_value), now);
        }
    }
}

size_t OutputScheduler::flushToggles() {
    std::deque<PendingToggle> pending;
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        pending.swap(toggleQueue_);
    }
    if (pending.empty()) {
        return 0;
    }

    std::lock_guard<std::mutex> lock(sendMutex_);
    const core::Timestamp now = core::Clock::now();
    size_t sent = 0;
    for (const auto& toggle : pending) {
        if (!portAvailable_.load()) {
            togglesDropped_++;
            LOG_WARNING("MIDI port unavailable, dropped " + control::deck_to_string(toggle.deck) +
                        " " + control::control_to_string(toggle.control) + " toggle");
            continue;
        }
        if (sendMessage(mapping_.outbound(toggle.deck, toggle.control, control::kMidiMax), now)) {
            togglesSent_++;
            sent++;
        } else {
            togglesDropped_++;
        }
    }
    return sent;
}

void OutputScheduler::sendDefaults() {
    std::lock_guard<std::mutex> lock(sendMutex_);
    const core::Timestamp now = core::Clock::now();
    for (int d = 0; d < control::kDeckCount; ++d) {
        for (ControlId id : control::all_controls()) {
            if (!control::is_continuous(id) || !portAvailable_.load()) {
                continue;
            }
            int value = control::quantize(id, control::control_range(id).default_value);
            sendMessage(mapping_.outbound(control::deck_from_index(d), id, value), now);
        }
    }
    LOG_INFO("Sent default values for all controls");
}

void OutputScheduler::setStatusCallback(StatusCallback callback) {
    std::lock_guard<std::mutex> lock(statusMutex_);
    statusCallback_ = std::move(callback);
}

OutputScheduler::Statistics OutputScheduler::getStatistics() const {
    Statistics stats;
    stats.ticks = ticks_.load();
    stats.messagesSent = messagesSent_.load();
    stats.suppressedByTakeover = suppressed_.load();
    stats.togglesSent = togglesSent_.load();
    stats.togglesDropped = togglesDropped_.load();
    stats.sendFailures = sendFailures_.load();
    stats.reconnects = reconnects_.load();
    stats.portAvailable = portAvailable_.load();
    return stats;
}

void OutputScheduler::schedulerLoop() {
    const auto period = std::chrono::duration_cast<core::Clock::duration>(
        std::chrono::duration<double>(1.0 / config_.rateHz));
    const auto statusInterval = std::chrono::duration_cast<core::Clock::duration>(
        std::chrono::duration<double>(config_.statusIntervalS));

    core::Timestamp nextTick = core::Clock::now();
    core::Timestamp nextStatus = nextTick + statusInterval;

    while (running_.load()) {
        flushToggles();

        core::Timestamp now = core::Clock::now();
        if (now >= nextTick) {
            runTick(now);
            nextTick += period;
            // Never catch up with a burst of ticks
            if (nextTick <= now) {
                nextTick = now + period;
            }
        }

        if (config_.statusIntervalS > 0.0 && now >= nextStatus) {
            StatusCallback callback;
            {
                std::lock_guard<std::mutex> lock(statusMutex_);
                callback = statusCallback_;
            }
            if (callback) {
                callback(getStatistics());
            }
            nextStatus = now + statusInterval;
        }

        std::unique_lock<std::mutex> lock(queueMutex_);
        wakeCv_.wait_until(lock, nextTick, [this] {
            return !running_.load() || !toggleQueue_.empty();
        });
    }
}

bool OutputScheduler::sendMessage(const MidiMessage& message, core::Timestamp now) {
    if (port_->send(message)) {
        messagesSent_++;
        LOG_TRACE("MIDI " + message.toString());
        return true;
    }

    sendFailures_++;
    if (portAvailable_.exchange(false)) {
        lastRetry_ = now;
        LOG_ERROR("MIDI send failed, port '" + port_->getName() +
                  "' marked unavailable; retrying every " +
                  std::to_string(config_.retryIntervalS) + " s");
    }
    return false;
}

void OutputScheduler::tryReconnect(core::Timestamp now) {
    if (core::seconds_between(lastRetry_, now) < config_.retryIntervalS) {
        return;
    }
    lastRetry_ = now;

    port_->close();
    if (!port_->open()) {
        if (failureThrottle_.shouldLog()) {
            LOG_WARNING("MIDI port '" + port_->getName() + "' still unavailable");
        }
        return;
    }

    portAvailable_.store(true);
    reconnects_++;
    for (const auto& deck : decks_) {
        if (deck) {
            deck->request_full_resync();
        }
    }
    LOG_INFO("MIDI port '" + port_->getName() + "' reconnected, resyncing all controls");
}

} // namespace midi
} // namespace handdeck
