#pragma once

#include <array>
#include <atomic>
#include <cstdint>
#include <memory>
#include <thread>
#include <vector>
#include "handdeck/control/DeckController.hpp"
#include "handdeck/midi/LatestValueMailbox.hpp"
#include "handdeck/midi/MidiPort.hpp"
#include "handdeck/midi/MidiTypes.hpp"

namespace handdeck {
namespace midi {

/**
 * Host feedback receiver
 *
 * The port's input callback parses each message and coalesces it into a
 * latest-value mailbox keyed by (deck, control); a worker thread drains
 * the mailbox and hands the values to the deck controllers, which update
 * the soft-takeover baseline (or adopt the value when the control is not
 * gesture-owned).
 *
 * Malformed messages, non-CC messages and CCs that do not resolve to a
 * control on a feedback channel are dropped and counted.
 */
class FeedbackReceiver {
public:
    using DeckArray = std::array<std::shared_ptr<control::DeckController>, control::kDeckCount>;

    struct Config {
        int pollTimeoutMs;      // worker wake-up interval when idle

        Config() : pollTimeoutMs(100) {}
    };

    struct Statistics {
        uint64_t messagesReceived = 0;
        uint64_t valuesApplied = 0;
        uint64_t messagesDropped = 0;
        uint64_t valuesCoalesced = 0;
    };

    FeedbackReceiver(std::shared_ptr<MidiPort> port,
                     const MidiMapping& mapping,
                     DeckArray decks,
                     const Config& config = Config());
    ~FeedbackReceiver();

    FeedbackReceiver(const FeedbackReceiver&) = delete;
    FeedbackReceiver& operator=(const FeedbackReceiver&) = delete;

    /**
     * Install the port callback and start the worker thread
     */
    bool start();

    /**
     * Detach from the port and join the worker; idempotent
     */
    void stop();

    bool isRunning() const { return running_.load(); }

    /**
     * Parse one inbound message into the mailbox (transport thread)
     */
    void handleRawMessage(const std::vector<unsigned char>& bytes);

    /**
     * Apply every pending mailbox value to the deck controllers
     * @return number of values applied
     */
    size_t processPending();

    Statistics getStatistics() const;

private:
    void workerLoop();

    std::shared_ptr<MidiPort> port_;
    MidiMapping mapping_;
    DeckArray decks_;
    Config config_;

    LatestValueMailbox mailbox_;
    std::atomic<bool> running_{false};
    std::thread worker_;

    std::atomic<uint64_t> received_{0};
    std::atomic<uint64_t> applied_{0};
    std::atomic<uint64_t> dropped_{0};
};

} // namespace midi
} // namespace handdeck
