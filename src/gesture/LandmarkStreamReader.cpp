/**
 * @file LandmarkStreamReader.cpp
 * @brief JSON landmark line parsing (yaml-cpp reads the JSON subset)
 */

#include "handdeck/gesture/LandmarkStreamReader.hpp"
#include "handdeck/core/Logger.hpp"
#include "handdeck/core/exception.h"
#include <yaml-cpp/yaml.h>

namespace handdeck {
namespace gesture {

namespace {

HandLandmarks build_hand(const YAML::Node& node, const cv::Size& image_size) {
    if (!node.IsMap()) {
        HANDDECK_THROW(core::LandmarkException, "hand entry is not an object");
    }

    const YAML::Node points = node["landmarks"];
    if (!points || !points.IsSequence() ||
        points.size() != static_cast<size_t>(kLandmarkCount)) {
        HANDDECK_THROW(core::LandmarkException, "hand must carry exactly 21 landmarks");
    }

    HandLandmarks hand;
    hand.image_size = image_size;
    hand.handedness = handedness_from_string(node["handedness"].as<std::string>(""));
    hand.confidence = node["confidence"].as<float>(0.0f);

    for (int i = 0; i < kLandmarkCount; ++i) {
        const YAML::Node p = points[i];
        if (!p.IsSequence() || p.size() < 2) {
            HANDDECK_THROW(core::LandmarkException,
                           "landmark " + std::to_string(i) + " needs at least x and y");
        }
        hand.points[i].x = p[0].as<float>();
        hand.points[i].y = p[1].as<float>();
        hand.points[i].z = p.size() > 2 ? p[2].as<float>() : 0.0f;
    }
    return hand;
}

} // namespace

LandmarkStreamReader::LandmarkStreamReader(std::istream& input)
    : input_(input) {
}

bool LandmarkStreamReader::next_frame(LandmarkFrame& frame) {
    std::string line;
    while (std::getline(input_, line)) {
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }
        std::optional<LandmarkFrame> parsed = parse_line(line);
        if (parsed) {
            frame = std::move(*parsed);
            return true;
        }
    }
    return false;
}

std::optional<LandmarkFrame> LandmarkStreamReader::parse_line(const std::string& line) {
    stats_.lines_read++;

    YAML::Node doc;
    try {
        doc = YAML::Load(line);
    } catch (const YAML::Exception& e) {
        stats_.lines_malformed++;
        LOG_DEBUG(std::string("LandmarkStreamReader: unparsable line: ") + e.what());
        return std::nullopt;
    }

    if (!doc.IsMap()) {
        stats_.lines_malformed++;
        return std::nullopt;
    }

    const std::string type = doc["type"].as<std::string>("");
    if (type != "landmarks") {
        stats_.lines_ignored++;
        return std::nullopt;
    }

    LandmarkFrame frame;
    try {
        frame.timestamp_ms = doc["timestamp_ms"].as<int64_t>(0);
        frame.image_size = cv::Size(doc["image_width"].as<int>(0),
                                    doc["image_height"].as<int>(0));
    } catch (const YAML::Exception& e) {
        stats_.lines_malformed++;
        LOG_DEBUG(std::string("LandmarkStreamReader: bad frame header: ") + e.what());
        return std::nullopt;
    }

    const YAML::Node hands = doc["hands"];
    if (hands && hands.IsSequence()) {
        for (const auto& entry : hands) {
            try {
                frame.hands.push_back(build_hand(entry, frame.image_size));
            } catch (const core::LandmarkException& e) {
                stats_.hands_malformed++;
                LOG_DEBUG(std::string("LandmarkStreamReader: ") + e.what());
            } catch (const YAML::Exception& e) {
                stats_.hands_malformed++;
                LOG_DEBUG(std::string("LandmarkStreamReader: bad landmark value: ") + e.what());
            }
        }
    }

    stats_.frames_parsed++;
    return frame;
}

} // namespace gesture
} // namespace handdeck
