/**
 * @file DeckController.hpp
 * @brief Thread-safe container for one deck's phase and control table
 *
 * Three threads touch a deck: the classification path (observations),
 * the output scheduler (settle + collect updates) and the feedback
 * receiver (host values). Each deck has its own mutex; no lock spans
 * both decks.
 *
 * @copyright 2025 HandDeck Project
 * @license MIT License
 */

#ifndef HANDDECK_CONTROL_DECK_CONTROLLER_HPP
#define HANDDECK_CONTROL_DECK_CONTROLLER_HPP

#include <array>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "ControlTypes.hpp"
#include "DeckStateMachine.hpp"
#include "handdeck/core/types.hpp"
#include "handdeck/gesture/GestureTypes.hpp"

namespace handdeck {
namespace control {

/**
 * @brief Smoothing, deadband and soft-takeover settings
 */
struct ControlOutputConfig {
    double smoothing_tau_s = 0.025;       ///< Exponential smoothing time constant
    int deadband = 2;                     ///< Min MIDI delta before a resend
    float takeover_epsilon = 0.03f;       ///< Soft-takeover tolerance as fraction of range

    bool is_valid() const {
        return smoothing_tau_s >= 0.0 && deadband >= 0 && deadband <= 127 &&
               takeover_epsilon > 0.0f && takeover_epsilon < 1.0f;
    }
};

/**
 * @brief One outbound value chosen by collect_updates()
 */
struct ControlUpdate {
    ControlId control;
    int midi_value;
};

/**
 * @brief Result of collect_updates()
 */
struct UpdateBatch {
    std::vector<ControlUpdate> updates;
    int suppressed_by_takeover = 0;
};

/**
 * @brief Copy of a deck's state for status reporting and tests
 */
struct DeckSnapshot {
    DeckId deck;
    DeckPhase phase;
    std::array<ControlState, kControlCount> controls;
    std::optional<ControlId> active_control;

    const ControlState& control(ControlId id) const { return controls[index_of(id)]; }
};

/**
 * @brief Per-deck state container
 */
class DeckController {
public:
    DeckController(DeckId deck,
                   const StateMachineConfig& machine_config = StateMachineConfig(),
                   const ControlOutputConfig& output_config = ControlOutputConfig());

    // Disable copy and move (owns a mutex)
    DeckController(const DeckController&) = delete;
    DeckController& operator=(const DeckController&) = delete;

    /**
     * @brief Apply one classified hand
     * @return Toggle control that fired on this frame, if any
     */
    std::optional<ControlId> on_observation(const gesture::ClassificationResult& result,
                                            core::Timestamp t);

    /**
     * @brief Frame without a usable hand for this deck
     */
    void on_hand_lost(core::Timestamp t);

    /**
     * @brief Advance smoothing and the hand-lost timeout to now
     */
    void settle(core::Timestamp now);

    /**
     * @brief Apply a host-reported value
     * @param midi_value Raw data byte received from the host
     */
    void apply_feedback(ControlId control, int midi_value, core::Timestamp t);

    /**
     * @brief Pick the controls to send this tick and mark them sent
     *
     * A continuous control is sent when its quantized value moved by at
     * least the deadband or it is flagged for sync, unless soft takeover
     * is pending.
     */
    UpdateBatch collect_updates();

    /**
     * @brief Flag every continuous control for an unconditional send
     */
    void request_full_resync();

    /**
     * @brief Pinch anchor while VolumeActive (passed to the classifier)
     */
    std::optional<float> pinch_anchor() const;

    /**
     * @brief Control currently owned by the gesture
     */
    std::optional<ControlId> active_control() const;

    DeckSnapshot snapshot() const;

    DeckId deck() const { return deck_; }

    StateMachineConfig get_machine_config() const { return machine_config_; }
    ControlOutputConfig get_output_config() const { return output_config_; }

private:
    void apply_step(const DeckEvent& event, std::optional<ControlId>* fired_toggle);
    void advance_smoothing(core::Timestamp now);
    CommittedValues committed_values() const;
    float epsilon_for(ControlId control) const;

    const DeckId deck_;
    const StateMachineConfig machine_config_;
    const ControlOutputConfig output_config_;

    mutable std::mutex mutex_;
    DeckMachineState machine_;
    std::array<ControlState, kControlCount> controls_;
};

} // namespace control
} // namespace handdeck

#endif // HANDDECK_CONTROL_DECK_CONTROLLER_HPP
