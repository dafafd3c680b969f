/**
 * @file ValueMapping.hpp
 * @brief Knob position, smoothing and MIDI quantization curves
 *
 * Knob positions are degrees in [-half_sweep, +half_sweep]:
 * - Filter / Volume: linear, -90 -> 0.0, 0 -> 0.5, +90 -> 1.0
 * - EQ: f(p) = 1 + p/90 for p <= 0 (linear cut to kill),
 *       f(p) = 4^(p/90) for p > 0 (boost, linear in dB); f(0) = 1.0
 *
 * MIDI quantization:
 * - linear controls: round(v * 127)
 * - EQ: v < 1 -> min(63, round(v * 63)); v >= 1 -> 64 + round((v - 1) / 3 * 63)
 *
 * @copyright 2025 HandDeck Project
 * @license MIT License
 */

#ifndef HANDDECK_CONTROL_VALUE_MAPPING_HPP
#define HANDDECK_CONTROL_VALUE_MAPPING_HPP

#include "ControlTypes.hpp"

namespace handdeck {
namespace control {

/// Highest MIDI data byte value
constexpr int kMidiMax = 127;

/**
 * @brief Clamp a value into a control's declared range
 */
float clamp_to_range(ControlId control, float value);

/**
 * @brief EQ gain for a knob position (monotonic, 1.0 at 0 degrees)
 */
float eq_gain_from_position(float position_deg, float half_sweep_deg = 90.0f);

/**
 * @brief Knob position for an EQ gain (inverse of eq_gain_from_position)
 */
float eq_position_from_gain(float gain, float half_sweep_deg = 90.0f);

/**
 * @brief Control value for a knob position
 */
float value_from_position(ControlId control, float position_deg, float half_sweep_deg = 90.0f);

/**
 * @brief Knob position for a control value (used when a knob becomes active)
 */
float position_from_value(ControlId control, float value, float half_sweep_deg = 90.0f);

/**
 * @brief Volume after a vertical pinch displacement
 * @param base_volume Volume committed when the pinch started
 * @param displacement_px Upward displacement of the pinch midpoint in pixels
 * @param sensitivity_per_px Volume change per pixel
 */
float volume_from_pinch(float base_volume, float displacement_px, float sensitivity_per_px);

/**
 * @brief Quantize a control value to a MIDI data byte
 */
int quantize(ControlId control, float value);

/**
 * @brief Control value for a MIDI data byte (inverse quantization)
 */
float dequantize(ControlId control, int midi_value);

/**
 * @brief Time-based smoothing factor, alpha = 1 - exp(-dt / tau)
 */
float smoothing_alpha(double dt_s, double tau_s);

} // namespace control
} // namespace handdeck

#endif // HANDDECK_CONTROL_VALUE_MAPPING_HPP
