/**
 * @file GestureMidiController.cpp
 * @brief Gesture-to-MIDI pipeline wiring
 */

#include "handdeck/app/GestureMidiController.hpp"
#include "handdeck/core/Logger.hpp"
#include "handdeck/core/exception.h"
#include "handdeck/gesture/GestureClassifier.hpp"
#include "handdeck/midi/FeedbackReceiver.hpp"
#include "handdeck/midi/OutputScheduler.hpp"
#include "handdeck/midi/RtMidiPort.hpp"
#include <array>
#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>

namespace handdeck {
namespace app {

using control::DeckId;

/**
 * @brief PIMPL implementation for GestureMidiController
 */
class GestureMidiController::Impl {
public:
    Settings settings;
    std::shared_ptr<midi::MidiPort> port;

    std::unique_ptr<gesture::GestureClassifier> classifier;
    std::array<std::shared_ptr<control::DeckController>, control::kDeckCount> decks;
    std::unique_ptr<midi::OutputScheduler> scheduler;
    std::unique_ptr<midi::FeedbackReceiver> feedback;

    bool initialized = false;
    bool running = false;

    // Counters
    std::atomic<uint64_t> frames_processed{0};
    std::atomic<uint64_t> hands_classified{0};
    std::atomic<uint64_t> hands_skipped{0};
    std::atomic<uint64_t> duplicate_hands{0};
    std::atomic<uint64_t> toggles_fired{0};
    std::atomic<uint64_t> total_processing_us{0};

    mutable std::mutex error_mutex;
    std::string last_error;

    Impl(const Settings& s, std::shared_ptr<midi::MidiPort> p)
        : settings(s), port(std::move(p)) {}

    void set_error(const std::string& message) {
        std::lock_guard<std::mutex> lock(error_mutex);
        last_error = message;
    }

    void log_status(const midi::OutputScheduler::Statistics& out) const {
        midi::FeedbackReceiver::Statistics in;
        if (feedback) {
            in = feedback->getStatistics();
        }
        LOG_INFO("Status: frames=" + std::to_string(frames_processed.load()) +
                 " sent=" + std::to_string(out.messagesSent) +
                 " toggles=" + std::to_string(out.togglesSent) +
                 " suppressed=" + std::to_string(out.suppressedByTakeover) +
                 " feedback=" + std::to_string(in.messagesReceived) +
                 " port=" + (out.portAvailable ? "available" : "UNAVAILABLE"));
    }

    /**
     * @brief Per-deck hand selection: unknown handedness is skipped, duplicates keep the most confident
     */
    std::array<std::optional<gesture::HandLandmarks>, control::kDeckCount>
    assign_hands(const gesture::LandmarkFrame& frame) {
        std::array<std::optional<gesture::HandLandmarks>, control::kDeckCount> chosen;
        for (const auto& hand : frame.hands) {
            std::optional<DeckId> deck = control::deck_from_handedness(hand.handedness);
            if (!deck) {
                hands_skipped++;
                continue;
            }
            auto& slot = chosen[control::index_of(*deck)];
            if (slot) {
                duplicate_hands++;
                if (hand.confidence <= slot->confidence) {
                    continue;
                }
            }
            slot = hand;
            if (slot->image_size.width <= 0 || slot->image_size.height <= 0) {
                slot->image_size = frame.image_size;
            }
        }
        return chosen;
    }
};

GestureMidiController::GestureMidiController(const Settings& settings,
                                             std::shared_ptr<midi::MidiPort> port)
    : pImpl(std::make_unique<Impl>(settings, std::move(port))) {
}

GestureMidiController::~GestureMidiController() {
    stop();
}

bool GestureMidiController::initialize() {
    if (pImpl->initialized) {
        LOG_WARNING("GestureMidiController already initialized");
        return false;
    }

    const Settings& s = pImpl->settings;
    s.validate();

    if (!pImpl->port) {
        pImpl->port = std::make_shared<midi::RtMidiPort>(s.midi.port);
    }
    if (!pImpl->port->open()) {
        std::string message = "Cannot create virtual MIDI port '" + pImpl->port->getName() + "'";
        pImpl->set_error(message);
        HANDDECK_THROW(core::MidiException, message);
    }

    pImpl->classifier = std::make_unique<gesture::GestureClassifier>(s.classifier);
    for (int d = 0; d < control::kDeckCount; ++d) {
        pImpl->decks[d] = std::make_shared<control::DeckController>(
            control::deck_from_index(d), s.state_machine, s.output);
    }
    pImpl->scheduler = std::make_unique<midi::OutputScheduler>(
        pImpl->port, s.mapping, pImpl->decks, s.scheduler);
    pImpl->feedback = std::make_unique<midi::FeedbackReceiver>(
        pImpl->port, s.mapping, pImpl->decks, s.feedback);

    Impl* impl = pImpl.get();
    pImpl->scheduler->setStatusCallback([impl](const midi::OutputScheduler::Statistics& stats) {
        impl->log_status(stats);
    });

    LOG_INFO(s.mapping.describe(pImpl->port->getName()));
    LOG_INFO("Classifier: curvature<" + std::to_string(s.classifier.curvature_threshold_deg) +
             " deg, pinch<" + std::to_string(s.classifier.pinch_threshold_px) + " px");
    LOG_INFO("State machine: debounce=" + std::to_string(s.state_machine.debounce_frames) +
             " frames, hand-lost=" + std::to_string(s.state_machine.hand_lost_timeout_s) +
             " s, toggle cooldown=" + std::to_string(s.state_machine.toggle_cooldown_s) + " s");

    pImpl->initialized = true;
    LOG_INFO("GestureMidiController initialized");
    return true;
}

bool GestureMidiController::is_initialized() const {
    return pImpl->initialized;
}

bool GestureMidiController::start() {
    if (!pImpl->initialized) {
        pImpl->set_error("Controller not initialized");
        return false;
    }
    if (pImpl->running) {
        return true;
    }

    if (!pImpl->feedback->start()) {
        pImpl->set_error("Failed to start feedback receiver");
        return false;
    }
    if (!pImpl->scheduler->start()) {
        pImpl->feedback->stop();
        pImpl->set_error("Failed to start output scheduler");
        return false;
    }

    pImpl->running = true;
    LOG_INFO("GestureMidiController running");
    return true;
}

void GestureMidiController::stop() {
    if (!pImpl->initialized) {
        return;
    }

    if (pImpl->running) {
        pImpl->scheduler->stop();
        pImpl->feedback->stop();
        pImpl->running = false;
    }

    if (pImpl->port && pImpl->port->isOpen()) {
        if (pImpl->settings.midi.reset_on_close) {
            pImpl->scheduler->sendDefaults();
        }
        pImpl->port->close();
        ControllerStatistics stats = get_statistics();
        LOG_INFO("GestureMidiController stopped: " + std::to_string(stats.frames_processed) +
                 " frames, " + std::to_string(stats.messages_sent) + " messages sent");
    }
}

bool GestureMidiController::is_running() const {
    return pImpl->running;
}

bool GestureMidiController::process_frame(const gesture::LandmarkFrame& frame) {
    return process_frame(frame, core::Clock::now());
}

bool GestureMidiController::process_frame(const gesture::LandmarkFrame& frame, core::Timestamp t) {
    if (!pImpl->initialized) {
        pImpl->set_error("Controller not initialized");
        return false;
    }

    auto start = std::chrono::steady_clock::now();

    auto hands = pImpl->assign_hands(frame);
    for (int d = 0; d < control::kDeckCount; ++d) {
        control::DeckController& deck = *pImpl->decks[d];
        if (!hands[d]) {
            deck.on_hand_lost(t);
            continue;
        }

        gesture::ClassificationResult result =
            pImpl->classifier->classify(*hands[d], deck.pinch_anchor());
        if (!result.valid) {
            pImpl->hands_skipped++;
            deck.on_hand_lost(t);
            continue;
        }
        pImpl->hands_classified++;

        std::optional<control::ControlId> toggle = deck.on_observation(result, t);
        if (toggle) {
            pImpl->toggles_fired++;
            pImpl->scheduler->enqueueToggle(deck.deck(), *toggle);
        }
    }

    pImpl->frames_processed++;
    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start);
    pImpl->total_processing_us += static_cast<uint64_t>(elapsed.count());
    return true;
}

ControllerStatistics GestureMidiController::get_statistics() const {
    ControllerStatistics stats;
    stats.frames_processed = pImpl->frames_processed.load();
    stats.hands_classified = pImpl->hands_classified.load();
    stats.hands_skipped = pImpl->hands_skipped.load();
    stats.duplicate_hands_dropped = pImpl->duplicate_hands.load();
    stats.toggles_fired = pImpl->toggles_fired.load();
    if (stats.frames_processed > 0) {
        stats.avg_processing_time_ms =
            static_cast<double>(pImpl->total_processing_us.load()) / 1000.0 /
            static_cast<double>(stats.frames_processed);
    }

    if (pImpl->scheduler) {
        midi::OutputScheduler::Statistics out = pImpl->scheduler->getStatistics();
        stats.messages_sent = out.messagesSent;
        stats.suppressed_by_takeover = out.suppressedByTakeover;
        stats.toggles_sent = out.togglesSent;
        stats.toggles_dropped = out.togglesDropped;
        stats.send_failures = out.sendFailures;
    }
    if (pImpl->feedback) {
        midi::FeedbackReceiver::Statistics in = pImpl->feedback->getStatistics();
        stats.feedback_received = in.messagesReceived;
        stats.feedback_applied = in.valuesApplied;
        stats.feedback_dropped = in.messagesDropped;
    }
    return stats;
}

PortStatus GestureMidiController::get_port_status() const {
    PortStatus status;
    if (!pImpl->port) {
        status.name = pImpl->settings.midi.port.portName;
        return status;
    }
    status.name = pImpl->port->getName();
    status.open = pImpl->port->isOpen();
    if (pImpl->scheduler) {
        midi::OutputScheduler::Statistics out = pImpl->scheduler->getStatistics();
        status.available = status.open && out.portAvailable;
        status.reconnects = out.reconnects;
    } else {
        status.available = status.open;
    }
    return status;
}

control::DeckSnapshot GestureMidiController::get_deck_snapshot(control::DeckId deck) const {
    if (!pImpl->initialized) {
        throw core::Exception(core::ResultCode::ERROR_NOT_INITIALIZED, "Controller not initialized");
    }
    return pImpl->decks[control::index_of(deck)]->snapshot();
}

std::string GestureMidiController::get_last_error() const {
    std::lock_guard<std::mutex> lock(pImpl->error_mutex);
    return pImpl->last_error;
}

} // namespace app
} // namespace handdeck
