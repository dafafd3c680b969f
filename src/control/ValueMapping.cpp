/**
 * @file ValueMapping.cpp
 * @brief Implementation of knob curves and MIDI quantization
 */

#include "handdeck/control/ValueMapping.hpp"
#include <algorithm>
#include <cmath>

namespace handdeck {
namespace control {

namespace {

constexpr float kEqMaxGain = 4.0f;

// EQ MIDI layout: 0..63 covers [0,1), 64..127 covers [1,4]
constexpr int kEqUnityMidi = 64;
constexpr int kEqCutSteps = 63;
constexpr int kEqBoostSteps = 63;

float clampf(float v, float lo, float hi) {
    return std::max(lo, std::min(hi, v));
}

} // namespace

float clamp_to_range(ControlId control, float value) {
    ControlRange range = control_range(control);
    if (!std::isfinite(value)) {
        return range.default_value;
    }
    return clampf(value, range.min_value, range.max_value);
}

float eq_gain_from_position(float position_deg, float half_sweep_deg) {
    float p = clampf(position_deg, -half_sweep_deg, half_sweep_deg) / half_sweep_deg;
    if (p <= 0.0f) {
        return 1.0f + p;
    }
    return std::pow(kEqMaxGain, p);
}

float eq_position_from_gain(float gain, float half_sweep_deg) {
    float g = clampf(gain, 0.0f, kEqMaxGain);
    if (g <= 1.0f) {
        return (g - 1.0f) * half_sweep_deg;
    }
    return half_sweep_deg * std::log(g) / std::log(kEqMaxGain);
}

float value_from_position(ControlId control, float position_deg, float half_sweep_deg) {
    float p = clampf(position_deg, -half_sweep_deg, half_sweep_deg);
    switch (control_kind(control)) {
        case ControlKind::EQ:
            return eq_gain_from_position(p, half_sweep_deg);
        case ControlKind::LINEAR:
            return (p + half_sweep_deg) / (2.0f * half_sweep_deg);
        default:
            return control_range(control).default_value;
    }
}

float position_from_value(ControlId control, float value, float half_sweep_deg) {
    switch (control_kind(control)) {
        case ControlKind::EQ:
            return eq_position_from_gain(value, half_sweep_deg);
        case ControlKind::LINEAR:
            return clampf(value, 0.0f, 1.0f) * 2.0f * half_sweep_deg - half_sweep_deg;
        default:
            return 0.0f;
    }
}

float volume_from_pinch(float base_volume, float displacement_px, float sensitivity_per_px) {
    return clampf(base_volume + displacement_px * sensitivity_per_px, 0.0f, 1.0f);
}

int quantize(ControlId control, float value) {
    float v = clamp_to_range(control, value);
    switch (control_kind(control)) {
        case ControlKind::EQ:
            if (v < 1.0f) {
                return std::min(kEqCutSteps, static_cast<int>(std::lround(v * kEqCutSteps)));
            }
            return kEqUnityMidi +
                   static_cast<int>(std::lround((v - 1.0f) / (kEqMaxGain - 1.0f) * kEqBoostSteps));
        case ControlKind::TOGGLE:
            return v >= 0.5f ? kMidiMax : 0;
        default:
            return static_cast<int>(std::lround(v * kMidiMax));
    }
}

float dequantize(ControlId control, int midi_value) {
    int m = std::max(0, std::min(kMidiMax, midi_value));
    switch (control_kind(control)) {
        case ControlKind::EQ:
            if (m < kEqUnityMidi) {
                return static_cast<float>(m) / kEqCutSteps;
            }
            return 1.0f + static_cast<float>(m - kEqUnityMidi) * (kEqMaxGain - 1.0f) / kEqBoostSteps;
        case ControlKind::TOGGLE:
            return m >= 64 ? 1.0f : 0.0f;
        default:
            return static_cast<float>(m) / kMidiMax;
    }
}

float smoothing_alpha(double dt_s, double tau_s) {
    if (dt_s <= 0.0) {
        return 0.0f;
    }
    if (tau_s <= 0.0) {
        return 1.0f;
    }
    return static_cast<float>(1.0 - std::exp(-dt_s / tau_s));
}

} // namespace control
} // namespace handdeck
