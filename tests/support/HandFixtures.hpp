/**
 * @file HandFixtures.hpp
 * @brief Synthetic hand poses for classifier and pipeline tests
 *
 * Hands are built in a local frame: origin at the wrist, "up" along the
 * finger direction, "side" across the knuckles. The frame is rotated by
 * the requested angle (positive leans left, toward smaller image x) and
 * placed in a square 1000x1000 image so pixel distances equal normalized
 * distances times 1000.
 *
 * Raw LEFT hands have the thumb on the small-x side; RIGHT hands mirror it.
 */

#pragma once

#include <handdeck/gesture/GestureTypes.hpp>

#include <cmath>
#include <vector>

namespace handdeck_test {

using handdeck::gesture::FingerFlags;
using handdeck::gesture::HandLandmarks;
using handdeck::gesture::LandmarkFrame;
using handdeck::gesture::RawHandedness;

constexpr int kFixtureImageSize = 1000;

/**
 * @brief Pose description for makeHand()
 */
struct HandPose {
    FingerFlags extended;
    float angle_deg = 0.0f;
    RawHandedness handedness = RawHandedness::LEFT;
    cv::Point2f wrist{0.5f, 0.75f};
    float confidence = 0.95f;
    bool pinch = false;     ///< Thumb tip touching the index tip
};

namespace detail {

struct LocalFrame {
    cv::Point2f wrist;
    cv::Point2f up;
    cv::Point2f side;
    float mirror;

    cv::Point3f at(float a, float b) const {
        cv::Point2f p = wrist + side * (a * mirror) + up * b;
        return cv::Point3f(p.x, p.y, 0.0f);
    }
};

inline LocalFrame makeFrame(const HandPose& pose) {
    const float theta = pose.angle_deg * 3.14159265358979f / 180.0f;
    LocalFrame f;
    f.wrist = pose.wrist;
    f.up = cv::Point2f(-std::sin(theta), -std::cos(theta));
    f.side = cv::Point2f(std::cos(theta), -std::sin(theta));
    f.mirror = pose.handedness == RawHandedness::RIGHT ? -1.0f : 1.0f;
    return f;
}

inline void placeFinger(HandLandmarks& hand, const LocalFrame& f, int mcp, float a, bool extended) {
    hand.points[mcp] = f.at(a, 0.10f);
    if (extended) {
        hand.points[mcp + 1] = f.at(a, 0.14f);
        hand.points[mcp + 2] = f.at(a, 0.17f);
        hand.points[mcp + 3] = f.at(a, 0.20f);
    } else {
        // Folded back toward the palm
        hand.points[mcp + 1] = f.at(a, 0.13f);
        hand.points[mcp + 2] = f.at(a, 0.11f);
        hand.points[mcp + 3] = f.at(a, 0.09f);
    }
}

} // namespace detail

/**
 * @brief Hand with the given long fingers extended and the thumb tucked
 */
inline HandLandmarks makeHand(const HandPose& pose) {
    namespace lm = handdeck::gesture::landmark;
    const detail::LocalFrame f = detail::makeFrame(pose);

    HandLandmarks hand;
    hand.handedness = pose.handedness;
    hand.confidence = pose.confidence;
    hand.image_size = cv::Size(kFixtureImageSize, kFixtureImageSize);

    hand.points[lm::WRIST] = f.at(0.0f, 0.0f);

    detail::placeFinger(hand, f, lm::INDEX_MCP, 0.00f, pose.extended.index);
    detail::placeFinger(hand, f, lm::MIDDLE_MCP, 0.02f, pose.extended.middle);
    detail::placeFinger(hand, f, lm::RING_MCP, 0.04f, pose.extended.ring);
    detail::placeFinger(hand, f, lm::PINKY_MCP, 0.06f, pose.extended.pinky);

    if (pose.pinch) {
        const cv::Point3f& indexTip = hand.points[lm::INDEX_TIP];
        hand.points[lm::THUMB_CMC] = f.at(-0.03f, 0.02f);
        hand.points[lm::THUMB_MCP] = f.at(-0.04f, 0.08f);
        hand.points[lm::THUMB_IP] = f.at(-0.03f, 0.14f);
        cv::Point3f tip = f.at(-0.015f, 0.0f) - f.at(0.0f, 0.0f);
        hand.points[lm::THUMB_TIP] = indexTip + tip;
    } else {
        hand.points[lm::THUMB_CMC] = f.at(-0.03f, 0.02f);
        hand.points[lm::THUMB_MCP] = f.at(-0.05f, 0.04f);
        hand.points[lm::THUMB_IP] = f.at(-0.06f, 0.05f);
        hand.points[lm::THUMB_TIP] = f.at(-0.03f, 0.04f);
    }
    return hand;
}

inline FingerFlags fingers(bool index, bool middle, bool ring, bool pinky) {
    FingerFlags flags;
    flags.index = index;
    flags.middle = middle;
    flags.ring = ring;
    flags.pinky = pinky;
    return flags;
}

/**
 * @brief Index finger only (FilterSelect) at the given rotation
 */
inline HandLandmarks makePointer(float angle_deg, RawHandedness handedness = RawHandedness::LEFT) {
    HandPose pose;
    pose.extended = fingers(true, false, false, false);
    pose.angle_deg = angle_deg;
    pose.handedness = handedness;
    return makeHand(pose);
}

/**
 * @brief Knob selection hand: the first `count` fingers extended
 */
inline HandLandmarks makeKnobHand(int count, float angle_deg = 0.0f,
                                  RawHandedness handedness = RawHandedness::LEFT) {
    HandPose pose;
    pose.extended = fingers(count >= 1, count >= 2, count >= 3, count >= 4);
    pose.angle_deg = angle_deg;
    pose.handedness = handedness;
    return makeHand(pose);
}

/**
 * @brief Thumb-index pinch with middle, ring and pinky extended
 * @param wrist_y Normalized wrist height (smaller = higher in the image)
 */
inline HandLandmarks makePinch(float wrist_y = 0.75f, RawHandedness handedness = RawHandedness::LEFT) {
    HandPose pose;
    pose.extended = fingers(true, true, true, true);
    pose.handedness = handedness;
    pose.wrist = cv::Point2f(0.5f, wrist_y);
    pose.pinch = true;
    return makeHand(pose);
}

/**
 * @brief Index and pinky extended ("rockstar")
 */
inline HandLandmarks makeRockstar(RawHandedness handedness = RawHandedness::LEFT) {
    HandPose pose;
    pose.extended = fingers(true, false, false, true);
    pose.handedness = handedness;
    return makeHand(pose);
}

/**
 * @brief Closed fist, thumb tucked (no gesture)
 */
inline HandLandmarks makeFist(RawHandedness handedness = RawHandedness::LEFT) {
    HandPose pose;
    pose.extended = fingers(false, false, false, false);
    pose.handedness = handedness;
    return makeHand(pose);
}

/**
 * @brief Sideways fist with the thumb pointing up, outside the other fingers
 */
inline HandLandmarks makeThumbsUp(RawHandedness handedness = RawHandedness::LEFT) {
    namespace lm = handdeck::gesture::landmark;
    HandLandmarks hand;
    hand.handedness = handedness;
    hand.confidence = 0.95f;
    hand.image_size = cv::Size(kFixtureImageSize, kFixtureImageSize);

    // Raw LEFT: thumb on the small-x side of the fist
    const float mirror = handedness == RawHandedness::RIGHT ? -1.0f : 1.0f;
    auto at = [mirror](float x, float y) {
        return cv::Point3f(0.5f + (x - 0.5f) * mirror, y, 0.0f);
    };

    hand.points[lm::WRIST] = at(0.50f, 0.70f);
    hand.points[lm::THUMB_CMC] = at(0.47f, 0.66f);
    hand.points[lm::THUMB_MCP] = at(0.45f, 0.62f);
    hand.points[lm::THUMB_IP] = at(0.44f, 0.58f);
    hand.points[lm::THUMB_TIP] = at(0.44f, 0.54f);

    for (int k = 0; k < 4; ++k) {
        const int mcp = lm::INDEX_MCP + 4 * k;
        const float y = 0.62f + 0.03f * k;
        hand.points[mcp] = at(0.53f, y);
        hand.points[mcp + 1] = at(0.58f, y);
        hand.points[mcp + 2] = at(0.58f, y + 0.02f);
        hand.points[mcp + 3] = at(0.55f, y + 0.02f);
    }
    return hand;
}

/**
 * @brief Copy of a hand moved by (dx, dy) in normalized coordinates
 */
inline HandLandmarks translated(const HandLandmarks& hand, float dx, float dy) {
    HandLandmarks out = hand;
    for (auto& p : out.points) {
        p.x += dx;
        p.y += dy;
    }
    return out;
}

/**
 * @brief Frame carrying the given hands
 */
inline LandmarkFrame makeFrameOf(const std::vector<HandLandmarks>& hands) {
    LandmarkFrame frame;
    frame.image_size = cv::Size(kFixtureImageSize, kFixtureImageSize);
    frame.hands = hands;
    return frame;
}

} // namespace handdeck_test
