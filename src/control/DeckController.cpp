/**
 * @file DeckController.cpp
 * @brief Per-deck state container: smoothing, soft takeover, output selection
 */

#include "handdeck/control/DeckController.hpp"
#include "handdeck/control/ValueMapping.hpp"
#include "handdeck/core/Logger.hpp"
#include <cmath>

namespace handdeck {
namespace control {

namespace {

core::Timestamp event_time(const DeckEvent& event) {
    if (const auto* obs = std::get_if<Observation>(&event)) {
        return obs->t;
    }
    if (const auto* lost = std::get_if<HandLost>(&event)) {
        return lost->t;
    }
    return std::get<Tick>(event).t;
}

} // namespace

DeckController::DeckController(DeckId deck,
                               const StateMachineConfig& machine_config,
                               const ControlOutputConfig& output_config)
    : deck_(deck)
    , machine_config_(machine_config)
    , output_config_(output_config) {
    for (ControlId id : all_controls()) {
        ControlState& cs = controls_[index_of(id)];
        ControlRange range = control_range(id);
        cs.raw_value = range.default_value;
        cs.smoothed_value = range.default_value;
        // Host is assumed to start at defaults; nothing is sent until something changes
        cs.last_sent_midi = is_continuous(id) ? quantize(id, range.default_value) : 0;
        cs.external_baseline = range.default_value;
    }
}

std::optional<ControlId> DeckController::on_observation(const gesture::ClassificationResult& result,
                                                        core::Timestamp t) {
    std::lock_guard<std::mutex> lock(mutex_);
    advance_smoothing(t);
    std::optional<ControlId> fired;
    apply_step(Observation{result, t}, &fired);
    return fired;
}

void DeckController::on_hand_lost(core::Timestamp t) {
    std::lock_guard<std::mutex> lock(mutex_);
    advance_smoothing(t);
    apply_step(HandLost{t}, nullptr);
}

void DeckController::settle(core::Timestamp now) {
    std::lock_guard<std::mutex> lock(mutex_);
    advance_smoothing(now);
    apply_step(Tick{now}, nullptr);
}

void DeckController::apply_feedback(ControlId control, int midi_value, core::Timestamp t) {
    std::lock_guard<std::mutex> lock(mutex_);
    ControlState& cs = controls_[index_of(control)];
    const float value = dequantize(control, midi_value);

    cs.external_baseline = value;
    cs.has_external_baseline = true;

    if (!is_continuous(control)) {
        cs.raw_value = value;
        cs.smoothed_value = value;
        return;
    }

    std::optional<ControlId> owned = owned_control(machine_.phase);
    if (owned && *owned == control) {
        // Host echo of our own output
        if (std::abs(midi_value - cs.last_sent_midi) <= output_config_.deadband) {
            return;
        }
        bool diverged = std::abs(cs.smoothed_value - value) > epsilon_for(control);
        if (diverged && !cs.takeover_pending) {
            HANDDECK_LOG_INFO("DeckController")
                << deck_to_string(deck_) << " " << control_to_string(control)
                << ": host moved to " << midi_value << ", waiting for gesture to pick up";
        }
        cs.takeover_pending = diverged;
        cs.takeover_side = 0;
        return;
    }

    // Host has authority while the user is not gesturing this control
    cs.raw_value = value;
    cs.smoothed_value = value;
    cs.last_sent_midi = midi_value;
    cs.takeover_pending = false;
    cs.takeover_side = 0;
    cs.sync_pending = false;
    cs.last_smoothed_at = t;
}

UpdateBatch DeckController::collect_updates() {
    std::lock_guard<std::mutex> lock(mutex_);
    UpdateBatch batch;

    for (ControlId id : all_controls()) {
        if (!is_continuous(id)) {
            continue;
        }
        ControlState& cs = controls_[index_of(id)];
        const int midi = quantize(id, cs.smoothed_value);
        const bool due = cs.sync_pending ||
                         std::abs(midi - cs.last_sent_midi) >= output_config_.deadband;

        if (cs.takeover_pending) {
            const float diff = cs.smoothed_value - cs.external_baseline;
            const int side = diff > 0.0f ? 1 : (diff < 0.0f ? -1 : 0);
            // A fast sweep can step over the epsilon window between two ticks
            const bool crossed = cs.takeover_side != 0 && side != 0 && side != cs.takeover_side;
            if (cs.has_external_baseline && (std::abs(diff) <= epsilon_for(id) || crossed)) {
                cs.takeover_pending = false;
                cs.takeover_side = 0;
                HANDDECK_LOG_INFO("DeckController")
                    << deck_to_string(deck_) << " " << control_to_string(id)
                    << ": gesture picked up host value";
            } else {
                if (side != 0) {
                    cs.takeover_side = side;
                }
                if (due) {
                    batch.suppressed_by_takeover++;
                }
                continue;
            }
        }

        if (due) {
            batch.updates.push_back(ControlUpdate{id, midi});
            cs.last_sent_midi = midi;
            cs.sync_pending = false;
        }
    }
    return batch;
}

void DeckController::request_full_resync() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (ControlId id : all_controls()) {
        if (is_continuous(id)) {
            controls_[index_of(id)].sync_pending = true;
        }
    }
}

std::optional<float> DeckController::pinch_anchor() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (const auto* volume = std::get_if<phase::VolumeActive>(&machine_.phase)) {
        return volume->anchor_y;
    }
    return std::nullopt;
}

std::optional<ControlId> DeckController::active_control() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return owned_control(machine_.phase);
}

DeckSnapshot DeckController::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    DeckSnapshot snap{deck_, machine_.phase, controls_, owned_control(machine_.phase)};
    return snap;
}

void DeckController::apply_step(const DeckEvent& event, std::optional<ControlId>* fired_toggle) {
    const core::Timestamp t = event_time(event);
    const std::string before = phase_to_string(machine_.phase);

    StepResult result = step(machine_, event, committed_values(), machine_config_);
    machine_ = result.state;
    const StepEffects& fx = result.effects;

    if (fx.activated) {
        ControlState& cs = controls_[index_of(*fx.activated)];
        cs.sync_pending = true;
        cs.last_seen_timestamp = t;
    }

    if (fx.value_control) {
        ControlState& cs = controls_[index_of(*fx.value_control)];
        cs.raw_value = fx.value;
        cs.last_seen_timestamp = t;
    }

    if (fx.toggle) {
        ControlState& cs = controls_[index_of(*fx.toggle)];
        cs.raw_value = cs.raw_value >= 0.5f ? 0.0f : 1.0f;
        cs.smoothed_value = cs.raw_value;
        cs.last_sent_midi = kMidiMax;
        cs.last_seen_timestamp = t;
        if (fired_toggle) {
            *fired_toggle = fx.toggle;
        }
        HANDDECK_LOG_INFO("DeckController")
            << deck_to_string(deck_) << " " << control_to_string(*fx.toggle) << " toggled";
    }

    if (fx.deactivated && is_continuous(*fx.deactivated)) {
        ControlState& cs = controls_[index_of(*fx.deactivated)];
        // Released before the gesture met the host: the host value stands
        if (cs.takeover_pending && cs.has_external_baseline) {
            cs.raw_value = cs.external_baseline;
            cs.smoothed_value = cs.external_baseline;
            cs.last_sent_midi = quantize(*fx.deactivated, cs.external_baseline);
            cs.takeover_pending = false;
            cs.takeover_side = 0;
            cs.sync_pending = false;
            cs.last_smoothed_at = t;
            HANDDECK_LOG_INFO("DeckController")
                << deck_to_string(deck_) << " " << control_to_string(*fx.deactivated)
                << ": released during takeover, keeping host value";
        }
    }

    const std::optional<ControlId> owned = owned_control(machine_.phase);
    const bool locked = std::holds_alternative<phase::Locked>(machine_.phase);
    for (ControlId id : all_controls()) {
        controls_[index_of(id)].locked = locked && owned && *owned == id;
    }

    if (core::Logger::getInstance().isEnabled(core::LogLevel::DEBUG)) {
        const std::string after = phase_to_string(machine_.phase);
        if (after != before) {
            LOG_DEBUG(deck_to_string(deck_) + ": " + before + " -> " + after);
        }
    }
}

void DeckController::advance_smoothing(core::Timestamp now) {
    for (ControlId id : all_controls()) {
        if (!is_continuous(id)) {
            continue;
        }
        ControlState& cs = controls_[index_of(id)];
        if (!cs.smoothing_started) {
            cs.smoothing_started = true;
            cs.last_smoothed_at = now;
            continue;
        }
        double dt = core::seconds_between(cs.last_smoothed_at, now);
        if (dt <= 0.0) {
            continue;
        }
        float alpha = smoothing_alpha(dt, output_config_.smoothing_tau_s);
        cs.smoothed_value += alpha * (cs.raw_value - cs.smoothed_value);
        if (std::abs(cs.raw_value - cs.smoothed_value) < 1e-5f) {
            cs.smoothed_value = cs.raw_value;
        }
        cs.smoothed_value = clamp_to_range(id, cs.smoothed_value);
        cs.last_smoothed_at = now;
    }
}

CommittedValues DeckController::committed_values() const {
    CommittedValues values{};
    for (ControlId id : all_controls()) {
        values[index_of(id)] = controls_[index_of(id)].raw_value;
    }
    return values;
}

float DeckController::epsilon_for(ControlId control) const {
    return output_config_.takeover_epsilon * control_range(control).span();
}

} // namespace control
} // namespace handdeck
