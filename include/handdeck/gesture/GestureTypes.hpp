/**
 * @file GestureTypes.hpp
 * @brief Core data types for the gesture classification stage
 *
 * Defines the hand landmark set delivered by the landmark provider, the
 * gesture categories that select deck controls, and the classification
 * result consumed by the per-deck state machines.
 *
 * @copyright 2025 HandDeck Project
 * @license MIT License
 */

#ifndef HANDDECK_GESTURE_TYPES_HPP
#define HANDDECK_GESTURE_TYPES_HPP

#include <array>
#include <cmath>
#include <cstdint>
#include <string>
#include <vector>
#include <opencv2/core.hpp>

namespace handdeck {
namespace gesture {

/// Number of landmarks per hand (MediaPipe hand topology)
constexpr int kLandmarkCount = 21;

/**
 * @brief Landmark indices used by the classifier
 */
namespace landmark {
constexpr int WRIST = 0;
constexpr int THUMB_CMC = 1;
constexpr int THUMB_MCP = 2;
constexpr int THUMB_IP = 3;
constexpr int THUMB_TIP = 4;
constexpr int INDEX_MCP = 5;
constexpr int INDEX_PIP = 6;
constexpr int INDEX_DIP = 7;
constexpr int INDEX_TIP = 8;
constexpr int MIDDLE_MCP = 9;
constexpr int RING_MCP = 13;
constexpr int PINKY_MCP = 17;
constexpr int PINKY_TIP = 20;
} // namespace landmark

/**
 * @brief Handedness label as reported by the detector
 *
 * The detector sees a mirrored image: raw LEFT is the performer's right
 * hand and drives Deck 1, raw RIGHT drives Deck 2.
 */
enum class RawHandedness {
    UNKNOWN = 0,
    LEFT,
    RIGHT
};

/**
 * @brief Discrete gesture categories
 */
enum class GestureCategory {
    NONE = 0,           ///< No control gesture
    FILTER_SELECT,      ///< {index} extended
    LOW_EQ_SELECT,      ///< {index, middle} extended
    MID_EQ_SELECT,      ///< {index, middle, ring} extended
    HIGH_EQ_SELECT,     ///< {index, middle, ring, pinky} extended
    VOLUME_PINCH,       ///< thumb-index pinch with middle, ring, pinky extended
    EFFECT_TOGGLE,      ///< "rockstar": index and pinky only
    PLAY_TOGGLE         ///< thumbs up, other fingers curled
};

/**
 * @brief Hand landmark set (21 points)
 *
 * x/y are normalized to [0, 1] relative to image dimensions, z is the
 * detector's relative depth.
 */
struct HandLandmarks {
    /// 21 landmark points (x, y, z coordinates)
    std::array<cv::Point3f, kLandmarkCount> points;

    /// Detection confidence [0, 1]
    float confidence = 0.0f;

    /// Raw (mirrored) handedness label
    RawHandedness handedness = RawHandedness::UNKNOWN;

    /// Image dimensions for denormalization
    cv::Size image_size;

    /**
     * @brief Check that every coordinate is a finite number
     */
    bool has_finite_points() const {
        for (const auto& p : points) {
            if (!std::isfinite(p.x) || !std::isfinite(p.y) || !std::isfinite(p.z)) {
                return false;
            }
        }
        return true;
    }

    /**
     * @brief Get denormalized landmark position
     * @param index Landmark index [0-20]
     * @return Pixel coordinates in image space
     */
    cv::Point2f get_pixel_position(int index) const {
        if (index < 0 || index >= kLandmarkCount) {
            return cv::Point2f(-1, -1);
        }
        return cv::Point2f(
            points[index].x * image_size.width,
            points[index].y * image_size.height
        );
    }
};

/**
 * @brief One frame of landmark provider output (zero to two hands)
 */
struct LandmarkFrame {
    /// Provider timestamp in milliseconds (informational)
    int64_t timestamp_ms = 0;

    /// Image dimensions the landmarks were normalized against
    cv::Size image_size;

    /// Detected hands
    std::vector<HandLandmarks> hands;
};

/**
 * @brief Extended-finger flags for the four long fingers
 */
struct FingerFlags {
    bool index = false;
    bool middle = false;
    bool ring = false;
    bool pinky = false;

    int count() const {
        return static_cast<int>(index) + static_cast<int>(middle) +
               static_cast<int>(ring) + static_cast<int>(pinky);
    }

    bool operator==(const FingerFlags& other) const {
        return index == other.index && middle == other.middle &&
               ring == other.ring && pinky == other.pinky;
    }

    bool operator!=(const FingerFlags& other) const { return !(*this == other); }
};

/**
 * @brief Output of a single classification call
 */
struct ClassificationResult {
    /// false when the hand record was malformed and must be skipped
    bool valid = false;

    /// Detected category
    GestureCategory category = GestureCategory::NONE;

    /// Wrist to index-tip rotation in degrees, 0 = upright, clamped to the angle limit
    float angle_deg = 0.0f;

    /// Index fingertip clearly beyond its knuckle (knob tracking allowed)
    bool pointer_up = false;

    /// Thumb-index pinch midpoint, pixel y
    float pinch_midpoint_y = 0.0f;

    /// Upward pinch displacement since the supplied anchor (pixels)
    float pinch_displacement_px = 0.0f;

    /// Thumb tip to index tip distance (pixels)
    float pinch_distance_px = 0.0f;

    /// Finger flags the category was derived from
    FingerFlags fingers;

    /// Handedness copied from the input
    RawHandedness handedness = RawHandedness::UNKNOWN;

    bool operator==(const ClassificationResult& other) const {
        return valid == other.valid && category == other.category &&
               angle_deg == other.angle_deg && pointer_up == other.pointer_up &&
               pinch_midpoint_y == other.pinch_midpoint_y &&
               pinch_displacement_px == other.pinch_displacement_px &&
               pinch_distance_px == other.pinch_distance_px &&
               fingers == other.fingers && handedness == other.handedness;
    }
};

/**
 * @brief Check whether a category selects a continuous knob
 */
inline bool is_knob_category(GestureCategory category) {
    return category == GestureCategory::FILTER_SELECT ||
           category == GestureCategory::LOW_EQ_SELECT ||
           category == GestureCategory::MID_EQ_SELECT ||
           category == GestureCategory::HIGH_EQ_SELECT;
}

/**
 * @brief Check whether a category fires a toggle
 */
inline bool is_toggle_category(GestureCategory category) {
    return category == GestureCategory::EFFECT_TOGGLE ||
           category == GestureCategory::PLAY_TOGGLE;
}

/**
 * @brief Convert GestureCategory enum to string
 */
inline std::string gesture_category_to_string(GestureCategory category) {
    switch (category) {
        case GestureCategory::NONE: return "None";
        case GestureCategory::FILTER_SELECT: return "FilterSelect";
        case GestureCategory::LOW_EQ_SELECT: return "LowEQSelect";
        case GestureCategory::MID_EQ_SELECT: return "MidEQSelect";
        case GestureCategory::HIGH_EQ_SELECT: return "HighEQSelect";
        case GestureCategory::VOLUME_PINCH: return "VolumePinch";
        case GestureCategory::EFFECT_TOGGLE: return "EffectToggle";
        case GestureCategory::PLAY_TOGGLE: return "PlayToggle";
        default: return "Invalid";
    }
}

/**
 * @brief Convert RawHandedness to the detector's label
 */
inline std::string handedness_to_string(RawHandedness handedness) {
    switch (handedness) {
        case RawHandedness::LEFT: return "Left";
        case RawHandedness::RIGHT: return "Right";
        default: return "Unknown";
    }
}

/**
 * @brief Parse the detector's handedness label ("Left" / "Right")
 */
inline RawHandedness handedness_from_string(const std::string& label) {
    if (label == "Left" || label == "left") {
        return RawHandedness::LEFT;
    }
    if (label == "Right" || label == "right") {
        return RawHandedness::RIGHT;
    }
    return RawHandedness::UNKNOWN;
}

} // namespace gesture
} // namespace handdeck

#endif // HANDDECK_GESTURE_TYPES_HPP
