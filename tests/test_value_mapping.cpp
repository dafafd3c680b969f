/**
 * @file test_value_mapping.cpp
 * @brief Unit tests for knob curves and MIDI quantization
 */

#include <gtest/gtest.h>
#include <handdeck/control/ValueMapping.hpp>

#include <cmath>

using namespace handdeck::control;

/**
 * Test 1: Linear knob curve
 */
TEST(ValueMappingTest, LinearKnobCurve) {
    EXPECT_FLOAT_EQ(value_from_position(ControlId::FILTER, -90.0f), 0.0f);
    EXPECT_FLOAT_EQ(value_from_position(ControlId::FILTER, 0.0f), 0.5f);
    EXPECT_FLOAT_EQ(value_from_position(ControlId::FILTER, 90.0f), 1.0f);
    EXPECT_FLOAT_EQ(value_from_position(ControlId::FILTER, 45.0f), 0.75f);

    // Positions beyond the sweep clamp
    EXPECT_FLOAT_EQ(value_from_position(ControlId::FILTER, 130.0f), 1.0f);
    EXPECT_FLOAT_EQ(value_from_position(ControlId::FILTER, -130.0f), 0.0f);
}

/**
 * Test 2: EQ curve is unity at 0 degrees and monotonic over the sweep
 */
TEST(ValueMappingTest, EqCurveMonotonicWithUnityCenter) {
    EXPECT_FLOAT_EQ(eq_gain_from_position(0.0f), 1.0f);
    EXPECT_FLOAT_EQ(eq_gain_from_position(-90.0f), 0.0f);
    EXPECT_FLOAT_EQ(eq_gain_from_position(90.0f), 4.0f);
    EXPECT_NEAR(eq_gain_from_position(45.0f), 2.0f, 1e-5f);

    float previous = eq_gain_from_position(-90.0f);
    for (int deg = -89; deg <= 90; ++deg) {
        float gain = eq_gain_from_position(static_cast<float>(deg));
        EXPECT_GT(gain, previous) << "at " << deg << " deg";
        previous = gain;
    }
}

/**
 * Test 3: EQ position is the inverse of the gain curve
 */
TEST(ValueMappingTest, EqPositionInvertsGain) {
    for (float deg : {-90.0f, -60.0f, -10.0f, 0.0f, 10.0f, 45.0f, 89.0f}) {
        float gain = eq_gain_from_position(deg);
        EXPECT_NEAR(eq_position_from_gain(gain), deg, 1e-3f);
    }
    EXPECT_NEAR(position_from_value(ControlId::FILTER, 0.25f), -45.0f, 1e-4f);
    EXPECT_NEAR(position_from_value(ControlId::MID_EQ, 1.0f), 0.0f, 1e-4f);
}

/**
 * Test 4: Linear quantization
 */
TEST(ValueMappingTest, LinearQuantization) {
    EXPECT_EQ(quantize(ControlId::FILTER, 0.0f), 0);
    EXPECT_EQ(quantize(ControlId::FILTER, 0.5f), 64);
    EXPECT_EQ(quantize(ControlId::FILTER, 1.0f), 127);
    EXPECT_EQ(quantize(ControlId::VOLUME, 2.0f), 127);
    EXPECT_EQ(quantize(ControlId::VOLUME, -1.0f), 0);
    EXPECT_EQ(quantize(ControlId::VOLUME, std::nanf("")), 127);   // default volume
}

/**
 * Test 5: EQ quantization splits cut and boost around 63/64
 */
TEST(ValueMappingTest, EqQuantization) {
    EXPECT_EQ(quantize(ControlId::LOW_EQ, 0.0f), 0);
    EXPECT_EQ(quantize(ControlId::LOW_EQ, 0.5f), 32);
    EXPECT_EQ(quantize(ControlId::LOW_EQ, 0.999f), 63);
    EXPECT_EQ(quantize(ControlId::LOW_EQ, 1.0f), 64);
    EXPECT_EQ(quantize(ControlId::LOW_EQ, 4.0f), 127);
    EXPECT_EQ(quantize(ControlId::HIGH_EQ, 2.5f), 64 + 32);

    int previous = -1;
    for (float v = 0.0f; v <= 4.0f; v += 0.01f) {
        int q = quantize(ControlId::MID_EQ, v);
        EXPECT_GE(q, previous);
        previous = q;
    }
}

/**
 * Test 6: Dequantized values re-quantize within one step
 */
TEST(ValueMappingTest, DequantizeIsNearInverse) {
    for (int m = 0; m <= 127; ++m) {
        EXPECT_EQ(quantize(ControlId::FILTER, dequantize(ControlId::FILTER, m)), m);
        int eq = quantize(ControlId::LOW_EQ, dequantize(ControlId::LOW_EQ, m));
        EXPECT_LE(std::abs(eq - m), 1) << "midi " << m;
    }
    EXPECT_FLOAT_EQ(dequantize(ControlId::LOW_EQ, 64), 1.0f);
    EXPECT_FLOAT_EQ(dequantize(ControlId::LOW_EQ, 127), 4.0f);
}

/**
 * Test 7: Pinch volume ramp
 */
TEST(ValueMappingTest, VolumeFromPinch) {
    EXPECT_NEAR(volume_from_pinch(0.5f, 100.0f, 0.0035f), 0.85f, 1e-5f);
    EXPECT_NEAR(volume_from_pinch(0.5f, -100.0f, 0.0035f), 0.15f, 1e-5f);
    EXPECT_FLOAT_EQ(volume_from_pinch(0.9f, 100.0f, 0.0035f), 1.0f);
    EXPECT_FLOAT_EQ(volume_from_pinch(0.1f, -100.0f, 0.0035f), 0.0f);
}

/**
 * Test 8: Smoothing factor
 */
TEST(ValueMappingTest, SmoothingAlpha) {
    EXPECT_FLOAT_EQ(smoothing_alpha(0.0, 0.025), 0.0f);
    EXPECT_FLOAT_EQ(smoothing_alpha(0.01, 0.0), 1.0f);
    EXPECT_NEAR(smoothing_alpha(0.025, 0.025), 1.0f - std::exp(-1.0f), 1e-6f);

    // Longer gaps always move further toward the target
    EXPECT_LT(smoothing_alpha(0.010, 0.025), smoothing_alpha(0.033, 0.025));
}

/**
 * Test 9: Declared ranges and defaults
 */
TEST(ValueMappingTest, ControlRanges) {
    EXPECT_FLOAT_EQ(control_range(ControlId::FILTER).default_value, 0.5f);
    EXPECT_FLOAT_EQ(control_range(ControlId::VOLUME).default_value, 1.0f);
    EXPECT_FLOAT_EQ(control_range(ControlId::LOW_EQ).max_value, 4.0f);
    EXPECT_FLOAT_EQ(control_range(ControlId::HIGH_EQ).default_value, 1.0f);
    EXPECT_FALSE(is_continuous(ControlId::PLAY));
    EXPECT_TRUE(is_continuous(ControlId::MID_EQ));
    EXPECT_FLOAT_EQ(clamp_to_range(ControlId::MID_EQ, 7.0f), 4.0f);
}
