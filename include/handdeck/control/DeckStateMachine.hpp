/**
 * @file DeckStateMachine.hpp
 * @brief Pure per-deck transition function
 *
 * Phases:
 * - Idle: no control owned by the gesture
 * - ControlActive(K): knob K follows the relative rotation of the index finger
 * - Locked(K): pointer condition broke while K's finger pattern persists; value frozen
 * - VolumeActive: volume follows the vertical pinch displacement
 *
 * step() maps (state, event, committed values) to (state, effects). It owns
 * no clock and no locks; DeckController applies the effects to the control
 * table under the deck mutex.
 *
 * @copyright 2025 HandDeck Project
 * @license MIT License
 */

#ifndef HANDDECK_CONTROL_DECK_STATE_MACHINE_HPP
#define HANDDECK_CONTROL_DECK_STATE_MACHINE_HPP

#include <array>
#include <optional>
#include <string>
#include <variant>
#include "ControlTypes.hpp"
#include "handdeck/core/types.hpp"
#include "handdeck/gesture/GestureTypes.hpp"

namespace handdeck {
namespace control {

/**
 * @brief State machine configuration
 */
struct StateMachineConfig {
    int debounce_frames = 2;                   ///< Consecutive frames before a knob switch / pinch entry commits
    double hand_lost_timeout_s = 0.5;          ///< No gesture for this long -> Idle
    double toggle_cooldown_s = 0.4;            ///< Min time since last fire and last release
    float knob_half_sweep_deg = 90.0f;         ///< Knob position range is +/- this value
    float volume_sensitivity_per_px = 0.0035f; ///< Volume change per pixel of upward pinch motion

    /**
     * @brief Validate configuration
     */
    bool is_valid() const {
        return debounce_frames >= 1 &&
               hand_lost_timeout_s > 0.0 &&
               toggle_cooldown_s >= 0.0 &&
               knob_half_sweep_deg > 0.0f && knob_half_sweep_deg <= 180.0f &&
               volume_sensitivity_per_px > 0.0f;
    }
};

namespace phase {

struct Idle {};

struct ControlActive {
    ControlId knob;
    float position_deg;     ///< Relative knob position, clamped to +/- half sweep
    float prev_angle_deg;   ///< Finger angle at the previous tracked frame
};

struct Locked {
    ControlId knob;
    float position_deg;
};

struct VolumeActive {
    float anchor_y;         ///< Pinch midpoint y (pixels) at pinch start
    float base_volume;      ///< Volume committed at pinch start
};

} // namespace phase

using DeckPhase = std::variant<phase::Idle, phase::ControlActive, phase::Locked, phase::VolumeActive>;

/**
 * @brief Consecutive-classification counter
 */
struct DebounceState {
    gesture::GestureCategory candidate = gesture::GestureCategory::NONE;
    int count = 0;
};

/**
 * @brief Edge detection and cooldown for one toggle gesture
 */
struct ToggleGate {
    bool held = false;
    bool has_fired = false;
    core::Timestamp last_fire{};
    bool has_released = false;
    core::Timestamp last_release{};
};

/**
 * @brief Everything the transition function reads and writes
 */
struct DeckMachineState {
    DeckPhase phase = phase::Idle{};
    DebounceState debounce;
    ToggleGate play_gate;
    ToggleGate effect_gate;
    bool has_gesture = false;
    core::Timestamp last_gesture{};    ///< Last observation with a non-None category
};

/**
 * @brief A classified hand for this deck
 */
struct Observation {
    gesture::ClassificationResult result;
    core::Timestamp t;
};

/**
 * @brief A frame arrived without a usable hand for this deck
 */
struct HandLost {
    core::Timestamp t;
};

/**
 * @brief Scheduler tick (drives the hand-lost timeout)
 */
struct Tick {
    core::Timestamp t;
};

using DeckEvent = std::variant<Observation, HandLost, Tick>;

/**
 * @brief Side effects requested by a transition
 */
struct StepEffects {
    std::optional<ControlId> value_control;   ///< Control whose target value changed
    float value = 0.0f;                       ///< New target value for value_control
    std::optional<ControlId> activated;       ///< Control that just became gesture-owned
    std::optional<ControlId> deactivated;     ///< Control that stopped being gesture-owned
    std::optional<ControlId> toggle;          ///< Toggle that fired
    bool entered_idle = false;
};

struct StepResult {
    DeckMachineState state;
    StepEffects effects;
};

/// Committed target value of every control, indexed by ControlId
using CommittedValues = std::array<float, kControlCount>;

/**
 * @brief Pure transition function
 */
StepResult step(const DeckMachineState& state,
                const DeckEvent& event,
                const CommittedValues& committed,
                const StateMachineConfig& config);

/**
 * @brief Control owned by the gesture in this phase, if any
 */
std::optional<ControlId> owned_control(const DeckPhase& phase);

/**
 * @brief Whether the phase is ControlActive (not Locked)
 */
bool is_tracking(const DeckPhase& phase);

/**
 * @brief Phase name for logs ("Idle", "ControlActive(Filter)", ...)
 */
std::string phase_to_string(const DeckPhase& phase);

} // namespace control
} // namespace handdeck

#endif // HANDDECK_CONTROL_DECK_STATE_MACHINE_HPP
