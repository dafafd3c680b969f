/**
 * @file test_landmark_stream_reader.cpp
 * @brief Unit tests for the line-delimited landmark reader
 */

#include <gtest/gtest.h>
#include <handdeck/gesture/LandmarkStreamReader.hpp>
#include <handdeck/core/Logger.hpp>

#include <sstream>
#include <string>

using namespace handdeck::gesture;

namespace {

std::string landmarkArray(int count, bool with_z = true) {
    std::ostringstream oss;
    oss << "[";
    for (int i = 0; i < count; ++i) {
        if (i > 0) {
            oss << ", ";
        }
        oss << "[" << 0.4 + i * 0.01 << ", " << 0.7 - i * 0.02;
        if (with_z) {
            oss << ", " << -0.01 * i;
        }
        oss << "]";
    }
    oss << "]";
    return oss.str();
}

std::string handJson(const std::string& handedness, double confidence, int count = 21) {
    std::ostringstream oss;
    oss << "{\"handedness\": \"" << handedness << "\", \"confidence\": " << confidence
        << ", \"landmarks\": " << landmarkArray(count) << "}";
    return oss.str();
}

std::string frameJson(const std::string& hands, int64_t ts = 1000) {
    std::ostringstream oss;
    oss << "{\"type\": \"landmarks\", \"timestamp_ms\": " << ts
        << ", \"image_width\": 1280, \"image_height\": 720, \"hands\": [" << hands << "]}";
    return oss.str();
}

} // namespace

class LandmarkStreamReaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        handdeck::core::Logger::getInstance().setLevel(handdeck::core::LogLevel::WARNING);
    }
};

/**
 * Test 1: A frame with two hands
 */
TEST_F(LandmarkStreamReaderTest, ParsesTwoHands) {
    std::istringstream input;
    LandmarkStreamReader reader(input);

    auto frame = reader.parse_line(frameJson(handJson("Left", 0.93) + ", " + handJson("Right", 0.8), 4242));
    ASSERT_TRUE(frame.has_value());
    EXPECT_EQ(frame->timestamp_ms, 4242);
    EXPECT_EQ(frame->image_size, cv::Size(1280, 720));
    ASSERT_EQ(frame->hands.size(), 2u);

    const HandLandmarks& left = frame->hands[0];
    EXPECT_EQ(left.handedness, RawHandedness::LEFT);
    EXPECT_NEAR(left.confidence, 0.93f, 1e-6f);
    EXPECT_EQ(left.image_size, cv::Size(1280, 720));
    EXPECT_NEAR(left.points[0].x, 0.4f, 1e-6f);
    EXPECT_NEAR(left.points[0].y, 0.7f, 1e-6f);
    EXPECT_NEAR(left.points[20].x, 0.6f, 1e-6f);
    EXPECT_NEAR(left.points[20].z, -0.2f, 1e-6f);

    EXPECT_EQ(frame->hands[1].handedness, RawHandedness::RIGHT);
    EXPECT_EQ(reader.get_stats().frames_parsed, 1u);
}

/**
 * Test 2: A frame without hands is still a frame
 */
TEST_F(LandmarkStreamReaderTest, EmptyHandList) {
    std::istringstream input;
    LandmarkStreamReader reader(input);

    auto frame = reader.parse_line(frameJson(""));
    ASSERT_TRUE(frame.has_value());
    EXPECT_TRUE(frame->hands.empty());
}

/**
 * Test 3: Other message types are ignored, not errors
 */
TEST_F(LandmarkStreamReaderTest, IgnoresOtherTypes) {
    std::istringstream input;
    LandmarkStreamReader reader(input);

    EXPECT_FALSE(reader.parse_line("{\"type\": \"status\", \"fps\": 29.7}").has_value());
    EXPECT_FALSE(reader.parse_line("{\"fps\": 29.7}").has_value());

    StreamReaderStats stats = reader.get_stats();
    EXPECT_EQ(stats.lines_read, 2u);
    EXPECT_EQ(stats.lines_ignored, 2u);
    EXPECT_EQ(stats.lines_malformed, 0u);
}

/**
 * Test 4: Unparsable lines are counted and skipped
 */
TEST_F(LandmarkStreamReaderTest, MalformedLines) {
    std::istringstream input;
    LandmarkStreamReader reader(input);

    EXPECT_FALSE(reader.parse_line("{\"type\": \"landmarks\", \"hands\": [").has_value());
    EXPECT_FALSE(reader.parse_line("just some text").has_value());
    EXPECT_FALSE(reader.parse_line("[1, 2, 3]").has_value());

    EXPECT_EQ(reader.get_stats().lines_malformed, 3u);
    EXPECT_EQ(reader.get_stats().frames_parsed, 0u);
}

/**
 * Test 5: Hands with the wrong landmark count are dropped, the frame survives
 */
TEST_F(LandmarkStreamReaderTest, DropsIncompleteHands) {
    std::istringstream input;
    LandmarkStreamReader reader(input);

    auto frame = reader.parse_line(frameJson(handJson("Left", 0.9, 20) + ", " + handJson("Right", 0.9)));
    ASSERT_TRUE(frame.has_value());
    ASSERT_EQ(frame->hands.size(), 1u);
    EXPECT_EQ(frame->hands[0].handedness, RawHandedness::RIGHT);
    EXPECT_EQ(reader.get_stats().hands_malformed, 1u);
}

/**
 * Test 6: Two-coordinate landmarks default z to zero; one-coordinate ones are rejected
 */
TEST_F(LandmarkStreamReaderTest, LandmarkCoordinates) {
    std::istringstream input;
    LandmarkStreamReader reader(input);

    std::string hand2d = "{\"handedness\": \"Left\", \"confidence\": 0.9, \"landmarks\": " +
                         landmarkArray(21, false) + "}";
    auto frame = reader.parse_line(frameJson(hand2d));
    ASSERT_TRUE(frame.has_value());
    ASSERT_EQ(frame->hands.size(), 1u);
    EXPECT_FLOAT_EQ(frame->hands[0].points[5].z, 0.0f);

    std::string bad = "{\"handedness\": \"Left\", \"confidence\": 0.9, \"landmarks\": [[0.5]";
    for (int i = 1; i < 21; ++i) {
        bad += ", [0.5, 0.5]";
    }
    bad += "]}";
    frame = reader.parse_line(frameJson(bad));
    ASSERT_TRUE(frame.has_value());
    EXPECT_TRUE(frame->hands.empty());
    EXPECT_EQ(reader.get_stats().hands_malformed, 1u);
}

/**
 * Test 7: Unknown handedness labels are carried through for the caller to skip
 */
TEST_F(LandmarkStreamReaderTest, UnknownHandedness) {
    std::istringstream input;
    LandmarkStreamReader reader(input);

    auto frame = reader.parse_line(frameJson(handJson("Ambidextrous", 0.9)));
    ASSERT_TRUE(frame.has_value());
    ASSERT_EQ(frame->hands.size(), 1u);
    EXPECT_EQ(frame->hands[0].handedness, RawHandedness::UNKNOWN);
}

/**
 * Test 8: Stream reading skips blank, foreign and broken lines
 */
TEST_F(LandmarkStreamReaderTest, ReadsStream) {
    std::ostringstream text;
    text << frameJson(handJson("Left", 0.9), 1) << "\n"
         << "\n"
         << "   \r\n"
         << "{\"type\": \"status\"}\n"
         << "{broken\n"
         << frameJson("", 2) << "\n"
         << frameJson(handJson("Right", 0.7), 3);    // no trailing newline

    std::istringstream input(text.str());
    LandmarkStreamReader reader(input);

    LandmarkFrame frame;
    ASSERT_TRUE(reader.next_frame(frame));
    EXPECT_EQ(frame.timestamp_ms, 1);
    EXPECT_EQ(frame.hands.size(), 1u);

    ASSERT_TRUE(reader.next_frame(frame));
    EXPECT_EQ(frame.timestamp_ms, 2);
    EXPECT_TRUE(frame.hands.empty());

    ASSERT_TRUE(reader.next_frame(frame));
    EXPECT_EQ(frame.timestamp_ms, 3);
    EXPECT_EQ(frame.hands[0].handedness, RawHandedness::RIGHT);

    EXPECT_FALSE(reader.next_frame(frame));

    StreamReaderStats stats = reader.get_stats();
    EXPECT_EQ(stats.lines_read, 5u);
    EXPECT_EQ(stats.frames_parsed, 3u);
    EXPECT_EQ(stats.lines_ignored, 1u);
    EXPECT_EQ(stats.lines_malformed, 1u);
}
