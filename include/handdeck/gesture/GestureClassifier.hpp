/**
 * @file GestureClassifier.hpp
 * @brief Geometric hand-pose classifier for deck control gestures
 *
 * Turns one hand's 21 landmarks into a discrete gesture category plus the
 * continuous parameter that drives the selected control (wrist-to-index
 * rotation angle, or vertical pinch displacement). Purely geometric, no
 * ML models and no state carried between calls.
 *
 * @copyright 2025 HandDeck Project
 * @license MIT License
 */

#ifndef HANDDECK_GESTURE_CLASSIFIER_HPP
#define HANDDECK_GESTURE_CLASSIFIER_HPP

#include <memory>
#include <optional>
#include <opencv2/core.hpp>
#include "GestureTypes.hpp"

namespace handdeck {
namespace gesture {

/**
 * @brief Classifier configuration
 */
struct ClassifierConfig {
    // Finger extension test
    float curvature_threshold_deg = 35.0f;   ///< Max summed bend angle (MCP-PIP-DIP-TIP) for a straight finger
    float radial_margin_ratio = 0.03f;       ///< Radial monotonicity margin as fraction of palm scale
    float min_palm_scale = 0.01f;            ///< Wrist to index MCP (normalized); below = no finger extended

    // Pointer condition
    float pointer_extension_ratio = 1.15f;   ///< tip-to-wrist must exceed mcp-to-wrist by this factor

    // Pinch
    float pinch_threshold_px = 40.0f;        ///< Thumb tip to index tip distance for a pinch

    // Rotation
    float angle_limit_deg = 135.0f;          ///< Rotation angle is clamped to +/- this value

    // Input validation
    float min_confidence = 0.5f;             ///< Hands below this detection confidence are skipped
    float max_out_of_frame = 0.5f;           ///< Normalized x/y allowed outside [0,1] before a hand is malformed
    cv::Size default_frame_size{1280, 720};  ///< Used when a hand carries no image size

    /**
     * @brief Validate configuration
     */
    bool is_valid() const {
        return curvature_threshold_deg > 0.0f && curvature_threshold_deg < 360.0f &&
               radial_margin_ratio >= 0.0f && radial_margin_ratio < 1.0f &&
               min_palm_scale > 0.0f &&
               pointer_extension_ratio > 1.0f &&
               pinch_threshold_px > 0.0f &&
               angle_limit_deg > 0.0f && angle_limit_deg <= 180.0f &&
               min_confidence >= 0.0f && min_confidence <= 1.0f &&
               max_out_of_frame >= 0.0f &&
               default_frame_size.width > 0 && default_frame_size.height > 0;
    }
};

/**
 * @brief Stateless gesture classifier
 *
 * Category precedence: PlayToggle, VolumePinch, EffectToggle, knob selection.
 * Knob selection requires the exact extended-finger set:
 * - {index}                      -> FilterSelect
 * - {index, middle}              -> LowEQSelect
 * - {index, middle, ring}        -> MidEQSelect
 * - {index, middle, ring, pinky} -> HighEQSelect
 *
 * A finger counts as extended only when it is both straight (summed joint
 * bend below threshold) and radially monotonic from the wrist, which rejects
 * a finger pointing at the camera.
 *
 * Identical input always yields identical output. The pinch anchor is an
 * explicit argument so the call stays free of hidden memory.
 */
class GestureClassifier {
public:
    /**
     * @brief Constructor with default configuration
     */
    GestureClassifier();

    /**
     * @brief Constructor with custom configuration
     */
    explicit GestureClassifier(const ClassifierConfig& config);

    /**
     * @brief Destructor
     */
    ~GestureClassifier();

    // Disable copy and move
    GestureClassifier(const GestureClassifier&) = delete;
    GestureClassifier& operator=(const GestureClassifier&) = delete;
    GestureClassifier(GestureClassifier&&) = delete;
    GestureClassifier& operator=(GestureClassifier&&) = delete;

    /**
     * @brief Classify one hand
     *
     * @param hand Landmark set with handedness, confidence and image size
     * @param pinch_anchor_y Pinch midpoint y (pixels) recorded when the pinch
     *        started; without it the reported displacement is 0
     * @return Classification result; valid == false for malformed input
     */
    ClassificationResult classify(const HandLandmarks& hand,
                                  std::optional<float> pinch_anchor_y = std::nullopt) const;

    /**
     * @brief Check whether the hand record can be classified
     */
    bool is_well_formed(const HandLandmarks& hand) const;

    /**
     * @brief Extended-finger flags (curvature + radial monotonicity)
     */
    FingerFlags extended_fingers(const HandLandmarks& hand) const;

    /**
     * @brief Index fingertip clearly beyond the index knuckle
     */
    bool is_pointer_up(const HandLandmarks& hand) const;

    /**
     * @brief Wrist to index-tip rotation in degrees, 0 = upright, clamped
     */
    float rotation_angle_deg(const HandLandmarks& hand) const;

    /**
     * @brief Thumbs-up shape (thumb chain rising and outside the other fingers)
     */
    bool is_thumbs_up(const HandLandmarks& hand) const;

    /**
     * @brief Get current configuration
     */
    ClassifierConfig get_config() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;  ///< PIMPL idiom for implementation hiding
};

} // namespace gesture
} // namespace handdeck

#endif // HANDDECK_GESTURE_CLASSIFIER_HPP
