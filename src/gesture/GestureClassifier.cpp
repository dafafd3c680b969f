/**
 * @file GestureClassifier.cpp
 * @brief Implementation of the geometric gesture classifier
 */

#include "handdeck/gesture/GestureClassifier.hpp"
#include "handdeck/core/Logger.hpp"
#include <algorithm>
#include <cmath>

namespace handdeck {
namespace gesture {

namespace {

constexpr float kRadToDeg = 57.29577951308232f;

float length3(const cv::Point3f& v) {
    return std::sqrt(v.x * v.x + v.y * v.y + v.z * v.z);
}

float length2(const cv::Point2f& v) {
    return std::sqrt(v.x * v.x + v.y * v.y);
}

/**
 * @brief Angle between two segments in degrees; degenerate segments count as straight
 */
float bend_angle_deg(const cv::Point3f& a, const cv::Point3f& b) {
    float na = length3(a);
    float nb = length3(b);
    if (na < 1e-8f || nb < 1e-8f) {
        return 0.0f;
    }
    float cosine = a.dot(b) / (na * nb);
    cosine = std::max(-1.0f, std::min(1.0f, cosine));
    return std::acos(cosine) * kRadToDeg;
}

} // namespace

/**
 * @brief PIMPL implementation for GestureClassifier
 */
class GestureClassifier::Impl {
public:
    ClassifierConfig config;

    explicit Impl(const ClassifierConfig& cfg) : config(cfg) {}

    cv::Size frame_size(const HandLandmarks& hand) const {
        if (hand.image_size.width > 0 && hand.image_size.height > 0) {
            return hand.image_size;
        }
        return config.default_frame_size;
    }

    cv::Point2f pixel(const HandLandmarks& hand, int index) const {
        cv::Size size = frame_size(hand);
        const cv::Point3f& p = hand.points[index];
        return cv::Point2f(p.x * size.width, p.y * size.height);
    }

    bool is_well_formed(const HandLandmarks& hand) const {
        if (hand.handedness == RawHandedness::UNKNOWN) {
            return false;
        }
        if (!std::isfinite(hand.confidence) || hand.confidence < config.min_confidence) {
            return false;
        }
        if (!hand.has_finite_points()) {
            return false;
        }
        const float lo = -config.max_out_of_frame;
        const float hi = 1.0f + config.max_out_of_frame;
        for (const auto& p : hand.points) {
            if (p.x < lo || p.x > hi || p.y < lo || p.y > hi) {
                return false;
            }
        }
        return true;
    }

    /**
     * @brief Straight and radially monotonic test for one finger chain
     */
    bool finger_extended(const HandLandmarks& hand, int mcp_index, float palm_scale) const {
        const cv::Point3f& wrist = hand.points[landmark::WRIST];
        const cv::Point3f& mcp = hand.points[mcp_index];
        const cv::Point3f& pip = hand.points[mcp_index + 1];
        const cv::Point3f& dip = hand.points[mcp_index + 2];
        const cv::Point3f& tip = hand.points[mcp_index + 3];

        float curvature = bend_angle_deg(pip - mcp, dip - pip) +
                          bend_angle_deg(dip - pip, tip - dip);
        if (curvature >= config.curvature_threshold_deg) {
            return false;
        }

        float r_mcp = length3(mcp - wrist);
        float r_pip = length3(pip - wrist);
        float r_dip = length3(dip - wrist);
        float r_tip = length3(tip - wrist);
        float margin = config.radial_margin_ratio * palm_scale;

        return r_mcp + margin < r_pip && r_pip < r_dip && r_dip < r_tip - margin / 2.0f;
    }

    FingerFlags extended_fingers(const HandLandmarks& hand) const {
        FingerFlags flags;
        float palm_scale = length3(hand.points[landmark::INDEX_MCP] - hand.points[landmark::WRIST]);
        if (palm_scale < config.min_palm_scale) {
            return flags;
        }
        flags.index = finger_extended(hand, landmark::INDEX_MCP, palm_scale);
        flags.middle = finger_extended(hand, landmark::MIDDLE_MCP, palm_scale);
        flags.ring = finger_extended(hand, landmark::RING_MCP, palm_scale);
        flags.pinky = finger_extended(hand, landmark::PINKY_MCP, palm_scale);
        return flags;
    }

    bool is_pointer_up(const HandLandmarks& hand) const {
        cv::Point2f wrist = pixel(hand, landmark::WRIST);
        float tip_to_wrist = length2(pixel(hand, landmark::INDEX_TIP) - wrist);
        float mcp_to_wrist = length2(pixel(hand, landmark::INDEX_MCP) - wrist);
        return tip_to_wrist > mcp_to_wrist * config.pointer_extension_ratio;
    }

    float rotation_angle_deg(const HandLandmarks& hand) const {
        cv::Point2f wrist = pixel(hand, landmark::WRIST);
        cv::Point2f tip = pixel(hand, landmark::INDEX_TIP);
        float dx = tip.x - wrist.x;
        float dy_up = wrist.y - tip.y;
        if (std::abs(dx) < 1e-6f && std::abs(dy_up) < 1e-6f) {
            return 0.0f;
        }
        // Leaning left (toward smaller x) is positive; clamped, never wrapped
        float angle = std::atan2(-dx, dy_up) * kRadToDeg;
        return std::max(-config.angle_limit_deg, std::min(config.angle_limit_deg, angle));
    }

    bool is_thumbs_up(const HandLandmarks& hand) const {
        float thumb_min_x = hand.points[0].x;
        float thumb_max_x = hand.points[0].x;
        for (int i = landmark::WRIST; i <= landmark::THUMB_TIP; ++i) {
            thumb_min_x = std::min(thumb_min_x, hand.points[i].x);
            thumb_max_x = std::max(thumb_max_x, hand.points[i].x);
        }

        float other_min_x = hand.points[landmark::INDEX_MCP].x;
        float other_max_x = hand.points[landmark::INDEX_MCP].x;
        for (int i = landmark::INDEX_MCP; i <= landmark::PINKY_TIP; ++i) {
            other_min_x = std::min(other_min_x, hand.points[i].x);
            other_max_x = std::max(other_max_x, hand.points[i].x);
        }

        bool outside = false;
        if (hand.handedness == RawHandedness::LEFT) {
            outside = thumb_max_x < other_min_x;
        } else if (hand.handedness == RawHandedness::RIGHT) {
            outside = thumb_min_x > other_max_x;
        }
        if (!outside) {
            return false;
        }

        // Image y grows downward: the chain must rise from wrist to tip
        for (int i = landmark::WRIST; i < landmark::THUMB_TIP; ++i) {
            if (!(hand.points[i].y > hand.points[i + 1].y)) {
                return false;
            }
        }
        return true;
    }

    ClassificationResult classify(const HandLandmarks& hand,
                                  std::optional<float> pinch_anchor_y) const {
        ClassificationResult result;
        result.handedness = hand.handedness;

        if (!is_well_formed(hand)) {
            LOG_DEBUG("GestureClassifier: skipping malformed hand (" +
                      handedness_to_string(hand.handedness) + ")");
            return result;
        }
        result.valid = true;

        result.fingers = extended_fingers(hand);
        result.pointer_up = is_pointer_up(hand);
        result.angle_deg = rotation_angle_deg(hand);

        cv::Point2f thumb_tip = pixel(hand, landmark::THUMB_TIP);
        cv::Point2f index_tip = pixel(hand, landmark::INDEX_TIP);
        result.pinch_distance_px = length2(thumb_tip - index_tip);
        result.pinch_midpoint_y = (thumb_tip.y + index_tip.y) / 2.0f;
        if (pinch_anchor_y) {
            result.pinch_displacement_px = *pinch_anchor_y - result.pinch_midpoint_y;
        }

        const FingerFlags& f = result.fingers;

        if (f.count() == 0 && is_thumbs_up(hand)) {
            result.category = GestureCategory::PLAY_TOGGLE;
        } else if (result.pinch_distance_px < config.pinch_threshold_px &&
                   f.middle && f.ring && f.pinky) {
            result.category = GestureCategory::VOLUME_PINCH;
        } else if (f.index && f.pinky && !f.middle && !f.ring) {
            result.category = GestureCategory::EFFECT_TOGGLE;
        } else if (f.index && !f.middle && !f.ring && !f.pinky) {
            result.category = GestureCategory::FILTER_SELECT;
        } else if (f.index && f.middle && !f.ring && !f.pinky) {
            result.category = GestureCategory::LOW_EQ_SELECT;
        } else if (f.index && f.middle && f.ring && !f.pinky) {
            result.category = GestureCategory::MID_EQ_SELECT;
        } else if (f.index && f.middle && f.ring && f.pinky) {
            result.category = GestureCategory::HIGH_EQ_SELECT;
        } else {
            result.category = GestureCategory::NONE;
        }

        return result;
    }
};

GestureClassifier::GestureClassifier()
    : pImpl(std::make_unique<Impl>(ClassifierConfig())) {
}

GestureClassifier::GestureClassifier(const ClassifierConfig& config)
    : pImpl(std::make_unique<Impl>(config)) {
}

GestureClassifier::~GestureClassifier() = default;

ClassificationResult GestureClassifier::classify(const HandLandmarks& hand,
                                                 std::optional<float> pinch_anchor_y) const {
    return pImpl->classify(hand, pinch_anchor_y);
}

bool GestureClassifier::is_well_formed(const HandLandmarks& hand) const {
    return pImpl->is_well_formed(hand);
}

FingerFlags GestureClassifier::extended_fingers(const HandLandmarks& hand) const {
    return pImpl->extended_fingers(hand);
}

bool GestureClassifier::is_pointer_up(const HandLandmarks& hand) const {
    return pImpl->is_pointer_up(hand);
}

float GestureClassifier::rotation_angle_deg(const HandLandmarks& hand) const {
    return pImpl->rotation_angle_deg(hand);
}

bool GestureClassifier::is_thumbs_up(const HandLandmarks& hand) const {
    return pImpl->is_thumbs_up(hand);
}

ClassifierConfig GestureClassifier::get_config() const {
    return pImpl->config;
}

} // namespace gesture
} // namespace handdeck
