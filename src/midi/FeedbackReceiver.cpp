#include "handdeck/midi/FeedbackReceiver.hpp"
#include "handdeck/core/Logger.hpp"

namespace handdeck {
namespace midi {

FeedbackReceiver::FeedbackReceiver(std::shared_ptr<MidiPort> port,
                                   const MidiMapping& mapping,
                                   DeckArray decks,
                                   const Config& config)
    : port_(std::move(port))
    , mapping_(mapping)
    , decks_(std::move(decks))
    , config_(config) {
}

FeedbackReceiver::~FeedbackReceiver() {
    stop();
}

bool FeedbackReceiver::start() {
    if (running_.load()) {
        LOG_WARNING("FeedbackReceiver already running");
        return true;
    }
    if (!port_) {
        LOG_ERROR("FeedbackReceiver: no MIDI port");
        return false;
    }

    mailbox_.reopen();
    running_.store(true);
    port_->setInboundCallback([this](const std::vector<unsigned char>& bytes) {
        handleRawMessage(bytes);
    });
    worker_ = std::thread(&FeedbackReceiver::workerLoop, this);

    LOG_INFO("FeedbackReceiver started (Deck1 ch " +
             std::to_string(mapping_.decks[0].feedbackChannel) + ", Deck2 ch " +
             std::to_string(mapping_.decks[1].feedbackChannel) + ")");
    return true;
}

void FeedbackReceiver::stop() {
    bool expected = true;
    if (!running_.compare_exchange_strong(expected, false)) {
        return;
    }

    if (port_) {
        port_->setInboundCallback(nullptr);
    }
    mailbox_.close();
    if (worker_.joinable()) {
        worker_.join();
    }

    LOG_INFO("FeedbackReceiver stopped (received " + std::to_string(received_.load()) +
             ", applied " + std::to_string(applied_.load()) +
             ", dropped " + std::to_string(dropped_.load()) + ")");
}

void FeedbackReceiver::handleRawMessage(const std::vector<unsigned char>& bytes) {
    received_++;

    std::optional<MidiMessage> msg = MidiMessage::fromBytes(bytes);
    if (!msg) {
        dropped_++;
        return;
    }

    auto target = mapping_.resolveFeedback(msg->channel, msg->ccNumber);
    if (!target) {
        dropped_++;
        return;
    }

    mailbox_.store(target->first, target->second, msg->value);
}

size_t FeedbackReceiver::processPending() {
    std::vector<LatestValueMailbox::Entry> entries = mailbox_.drain();
    const core::Timestamp now = core::Clock::now();

    for (const auto& entry : entries) {
        const auto& deck = decks_[control::index_of(entry.deck)];
        if (!deck) {
            continue;
        }
        deck->apply_feedback(entry.control, entry.value, now);
        LOG_TRACE("Feedback " + control::deck_to_string(entry.deck) + " " +
                  control::control_to_string(entry.control) + " = " + std::to_string(entry.value));
    }

    applied_ += entries.size();
    return entries.size();
}

FeedbackReceiver::Statistics FeedbackReceiver::getStatistics() const {
    Statistics stats;
    stats.messagesReceived = received_.load();
    stats.valuesApplied = applied_.load();
    stats.messagesDropped = dropped_.load();
    stats.valuesCoalesced = mailbox_.getCoalescedCount();
    return stats;
}

void FeedbackReceiver::workerLoop() {
    const auto timeout = std::chrono::milliseconds(config_.pollTimeoutMs);
    while (running_.load()) {
        if (mailbox_.waitForData(timeout)) {
            processPending();
        }
    }
    // Values that arrived during shutdown still update the table
    processPending();
}

} // namespace midi
} // namespace handdeck
