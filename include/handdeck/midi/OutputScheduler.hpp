#pragma once

#include <array>
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include "handdeck/control/DeckController.hpp"
#include "handdeck/core/Logger.hpp"
#include "handdeck/core/types.hpp"
#include "handdeck/midi/MidiPort.hpp"
#include "handdeck/midi/MidiTypes.hpp"

namespace handdeck {
namespace midi {

/**
 * Fixed-rate MIDI output loop
 *
 * Each tick, for both decks: advance smoothing and the hand-lost timeout,
 * then send every continuous control whose quantized value moved by at
 * least the deadband (or that was flagged for sync). At most one message
 * per control per tick, always the latest value.
 *
 * Toggle presses bypass the tick cadence: enqueueToggle() wakes the loop
 * and the press is sent immediately.
 *
 * A failed send marks the port unavailable; later sends are skipped and
 * the port is re-opened every retry interval, after which every control
 * is resynced.
 */
class OutputScheduler {
public:
    using DeckArray = std::array<std::shared_ptr<control::DeckController>, control::kDeckCount>;

    struct Config {
        double rateHz;               // batch send rate
        double retryIntervalS;       // port re-open interval while unavailable
        double statusIntervalS;      // periodic status callback interval (0 = off)

        Config() : rateHz(30.0), retryIntervalS(2.0), statusIntervalS(10.0) {}

        bool isValid() const {
            return rateHz > 0.0 && rateHz <= 1000.0 && retryIntervalS > 0.0 && statusIntervalS >= 0.0;
        }
    };

    struct Statistics {
        uint64_t ticks = 0;
        uint64_t messagesSent = 0;
        uint64_t suppressedByTakeover = 0;
        uint64_t togglesSent = 0;
        uint64_t togglesDropped = 0;
        uint64_t sendFailures = 0;
        uint64_t reconnects = 0;
        bool portAvailable = true;
    };

    using StatusCallback = std::function<void(const Statistics&)>;

    OutputScheduler(std::shared_ptr<MidiPort> port,
                    const MidiMapping& mapping,
                    DeckArray decks,
                    const Config& config = Config());
    ~OutputScheduler();

    OutputScheduler(const OutputScheduler&) = delete;
    OutputScheduler& operator=(const OutputScheduler&) = delete;

    /**
     * Start the scheduler thread
     */
    bool start();

    /**
     * Stop the thread, then send any queued toggles; idempotent
     */
    void stop();

    bool isRunning() const { return running_.load(); }

    /**
     * Queue a toggle press and wake the scheduler thread
     *
     * After stop() the press is dropped and counted in togglesDropped.
     */
    void enqueueToggle(control::DeckId deck, control::ControlId control);

    /**
     * One batch tick at the given time (the scheduler thread calls this)
     */
    void runTick(core::Timestamp now);

    /**
     * Send every queued toggle press
     * @return number of presses sent
     */
    size_t flushToggles();

    /**
     * Send each continuous control's default value on both decks
     */
    void sendDefaults();

    /**
     * Invoked from the scheduler thread every status interval
     */
    void setStatusCallback(StatusCallback callback);

    bool isPortAvailable() const { return portAvailable_.load(); }

    Statistics getStatistics() const;

private:
    struct PendingToggle {
        control::DeckId deck;
        control::ControlId control;
    };

    void schedulerLoop();
    bool sendMessage(const MidiMessage& message, core::Timestamp now);
    void tryReconnect(core::Timestamp now);

    std::shared_ptr<MidiPort> port_;
    MidiMapping mapping_;
    DeckArray decks_;
    Config config_;

    std::atomic<bool> running_{false};
    std::thread thread_;

    std::mutex queueMutex_;
    std::condition_variable wakeCv_;
    std::deque<PendingToggle> toggleQueue_;
    bool stopped_ = false;      ///< Set by stop(); later toggles are dropped

    // Send path state, touched by the scheduler thread (or the caller after stop)
    std::mutex sendMutex_;
    std::atomic<bool> portAvailable_{true};
    core::Timestamp lastRetry_{};
    core::LogThrottle failureThrottle_{std::chrono::milliseconds(5000)};

    StatusCallback statusCallback_;
    std::mutex statusMutex_;

    std::atomic<uint64_t> ticks_{0};
    std::atomic<uint64_t> messagesSent_{0};
    std::atomic<uint64_t> suppressed_{0};
    std::atomic<uint64_t> togglesSent_{0};
    std::atomic<uint64_t> togglesDropped_{0};
    std::atomic<uint64_t> sendFailures_{0};
    std::atomic<uint64_t> reconnects_{0};
};

} // namespace midi
} // namespace handdeck
