/**
 * @file DeckStateMachine.cpp
 * @brief Per-deck transition function
 */

#include "handdeck/control/DeckStateMachine.hpp"
#include "handdeck/control/ValueMapping.hpp"
#include <algorithm>

namespace handdeck {
namespace control {

using gesture::GestureCategory;

namespace {

void set_value(StepEffects& effects, ControlId control, float value) {
    effects.value_control = control;
    effects.value = clamp_to_range(control, value);
}

void go_idle(StepResult& out) {
    std::optional<ControlId> owned = owned_control(out.state.phase);
    if (owned) {
        out.effects.deactivated = owned;
    }
    out.state.phase = phase::Idle{};
    out.effects.entered_idle = true;
}

void activate_knob(StepResult& out, ControlId knob, float angle_deg,
                   const CommittedValues& committed, const StateMachineConfig& config) {
    float position = position_from_value(knob, committed[index_of(knob)], config.knob_half_sweep_deg);
    position = std::max(-config.knob_half_sweep_deg, std::min(config.knob_half_sweep_deg, position));
    out.state.phase = phase::ControlActive{knob, position, angle_deg};
    out.effects.activated = knob;
}

void enter_volume(StepResult& out, float midpoint_y, const CommittedValues& committed) {
    out.state.phase = phase::VolumeActive{midpoint_y, committed[index_of(ControlId::VOLUME)]};
    out.effects.activated = ControlId::VOLUME;
}

/**
 * @brief Rising-edge detection with cooldown since last fire and last release
 */
void update_toggle(ToggleGate& gate, bool held, core::Timestamp t, double cooldown_s,
                   ControlId control, StepEffects& effects) {
    if (held && !gate.held) {
        bool fire_ok = !gate.has_fired || core::seconds_between(gate.last_fire, t) >= cooldown_s;
        bool release_ok = !gate.has_released ||
                          core::seconds_between(gate.last_release, t) >= cooldown_s;
        if (fire_ok && release_ok) {
            gate.has_fired = true;
            gate.last_fire = t;
            effects.toggle = control;
        }
    } else if (!held && gate.held) {
        gate.has_released = true;
        gate.last_release = t;
    }
    gate.held = held;
}

void check_timeout(StepResult& out, core::Timestamp t, const StateMachineConfig& config) {
    if (std::holds_alternative<phase::Idle>(out.state.phase)) {
        return;
    }
    if (!out.state.has_gesture ||
        core::seconds_between(out.state.last_gesture, t) >= config.hand_lost_timeout_s) {
        go_idle(out);
    }
}

void on_hand_lost(StepResult& out, core::Timestamp t, const StateMachineConfig& config) {
    DeckMachineState& s = out.state;
    update_toggle(s.play_gate, false, t, config.toggle_cooldown_s, ControlId::PLAY, out.effects);
    update_toggle(s.effect_gate, false, t, config.toggle_cooldown_s, ControlId::EFFECT, out.effects);
    s.debounce = DebounceState{};

    if (std::holds_alternative<phase::VolumeActive>(s.phase)) {
        go_idle(out);
        return;
    }
    check_timeout(out, t, config);
}

void on_observation(StepResult& out, const Observation& obs,
                    const CommittedValues& committed, const StateMachineConfig& config) {
    const gesture::ClassificationResult& r = obs.result;
    if (!r.valid) {
        on_hand_lost(out, obs.t, config);
        return;
    }

    DeckMachineState& s = out.state;
    const GestureCategory c = r.category;

    update_toggle(s.play_gate, c == GestureCategory::PLAY_TOGGLE, obs.t,
                  config.toggle_cooldown_s, ControlId::PLAY, out.effects);
    update_toggle(s.effect_gate, c == GestureCategory::EFFECT_TOGGLE, obs.t,
                  config.toggle_cooldown_s, ControlId::EFFECT, out.effects);

    if (c != GestureCategory::NONE) {
        s.has_gesture = true;
        s.last_gesture = obs.t;
    }

    if (c == s.debounce.candidate) {
        s.debounce.count = std::min(s.debounce.count + 1, config.debounce_frames);
    } else {
        s.debounce.candidate = c;
        s.debounce.count = 1;
    }
    const bool settled = s.debounce.count >= config.debounce_frames;
    const std::optional<ControlId> knob = knob_for_category(c);
    const bool pinch = c == GestureCategory::VOLUME_PINCH;

    if (std::holds_alternative<phase::Idle>(s.phase)) {
        if (knob && r.pointer_up && settled) {
            activate_knob(out, *knob, r.angle_deg, committed, config);
        } else if (pinch && settled) {
            enter_volume(out, r.pinch_midpoint_y, committed);
        }
    } else if (auto* active = std::get_if<phase::ControlActive>(&s.phase)) {
        if (knob && *knob == active->knob) {
            if (r.pointer_up) {
                float position = active->position_deg + (r.angle_deg - active->prev_angle_deg);
                position = std::max(-config.knob_half_sweep_deg,
                                    std::min(config.knob_half_sweep_deg, position));
                active->position_deg = position;
                active->prev_angle_deg = r.angle_deg;
                set_value(out.effects, active->knob,
                          value_from_position(active->knob, position, config.knob_half_sweep_deg));
            } else {
                s.phase = phase::Locked{active->knob, active->position_deg};
            }
        } else if (knob && settled && r.pointer_up) {
            out.effects.deactivated = active->knob;
            activate_knob(out, *knob, r.angle_deg, committed, config);
        } else if (pinch && settled) {
            out.effects.deactivated = active->knob;
            enter_volume(out, r.pinch_midpoint_y, committed);
        } else {
            // Not tracking this frame: hold the value, follow the angle
            active->prev_angle_deg = r.angle_deg;
        }
    } else if (auto* locked = std::get_if<phase::Locked>(&s.phase)) {
        if (knob && *knob == locked->knob) {
            if (r.pointer_up) {
                s.phase = phase::ControlActive{locked->knob, locked->position_deg, r.angle_deg};
            }
        } else if (knob && settled && r.pointer_up) {
            out.effects.deactivated = locked->knob;
            activate_knob(out, *knob, r.angle_deg, committed, config);
        } else if (pinch && settled) {
            out.effects.deactivated = locked->knob;
            enter_volume(out, r.pinch_midpoint_y, committed);
        }
    } else if (auto* volume = std::get_if<phase::VolumeActive>(&s.phase)) {
        if (pinch) {
            float displacement = volume->anchor_y - r.pinch_midpoint_y;
            set_value(out.effects, ControlId::VOLUME,
                      volume_from_pinch(volume->base_volume, displacement,
                                        config.volume_sensitivity_per_px));
        } else {
            go_idle(out);
            return;
        }
    }

    check_timeout(out, obs.t, config);
}

} // namespace

StepResult step(const DeckMachineState& state,
                const DeckEvent& event,
                const CommittedValues& committed,
                const StateMachineConfig& config) {
    StepResult out{state, StepEffects{}};

    if (const auto* obs = std::get_if<Observation>(&event)) {
        on_observation(out, *obs, committed, config);
    } else if (const auto* lost = std::get_if<HandLost>(&event)) {
        on_hand_lost(out, lost->t, config);
    } else if (const auto* tick = std::get_if<Tick>(&event)) {
        check_timeout(out, tick->t, config);
    }
    return out;
}

std::optional<ControlId> owned_control(const DeckPhase& phase) {
    if (const auto* active = std::get_if<phase::ControlActive>(&phase)) {
        return active->knob;
    }
    if (const auto* locked = std::get_if<phase::Locked>(&phase)) {
        return locked->knob;
    }
    if (std::holds_alternative<phase::VolumeActive>(phase)) {
        return ControlId::VOLUME;
    }
    return std::nullopt;
}

bool is_tracking(const DeckPhase& phase) {
    return std::holds_alternative<phase::ControlActive>(phase);
}

std::string phase_to_string(const DeckPhase& phase) {
    if (const auto* active = std::get_if<phase::ControlActive>(&phase)) {
        return "ControlActive(" + control_to_string(active->knob) + ")";
    }
    if (const auto* locked = std::get_if<phase::Locked>(&phase)) {
        return "Locked(" + control_to_string(locked->knob) + ")";
    }
    if (std::holds_alternative<phase::VolumeActive>(phase)) {
        return "VolumeActive";
    }
    return "Idle";
}

} // namespace control
} // namespace handdeck
