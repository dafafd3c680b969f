/**
 * @file LandmarkStreamReader.hpp
 * @brief Line-delimited JSON adapter for the external landmark provider
 *
 * The hand detector runs as a separate process and writes one JSON object
 * per processed camera frame:
 *
 *   {"type":"landmarks","timestamp_ms":1234,"image_width":1280,"image_height":720,
 *    "hands":[{"handedness":"Left","confidence":0.93,"landmarks":[[x,y,z], ...]}]}
 *
 * Lines of another type are ignored; malformed lines and hands are skipped
 * and counted.
 *
 * @copyright 2025 HandDeck Project
 * @license MIT License
 */

#ifndef HANDDECK_GESTURE_LANDMARK_STREAM_READER_HPP
#define HANDDECK_GESTURE_LANDMARK_STREAM_READER_HPP

#include <cstddef>
#include <istream>
#include <optional>
#include <string>
#include "GestureTypes.hpp"

namespace handdeck {
namespace gesture {

/**
 * @brief Reader counters
 */
struct StreamReaderStats {
    size_t lines_read = 0;        ///< Non-empty lines consumed
    size_t frames_parsed = 0;     ///< Landmark frames produced
    size_t lines_ignored = 0;     ///< Valid JSON of another message type
    size_t lines_malformed = 0;   ///< Unparsable lines
    size_t hands_malformed = 0;   ///< Hands dropped from otherwise valid frames
};

/**
 * @brief Pulls landmark frames from a text stream (stdin in production)
 */
class LandmarkStreamReader {
public:
    /**
     * @brief Constructor
     * @param input Stream to read from; must outlive the reader
     */
    explicit LandmarkStreamReader(std::istream& input);

    /**
     * @brief Read until the next landmark frame
     * @param frame Output frame
     * @return false at end of stream
     */
    bool next_frame(LandmarkFrame& frame);

    /**
     * @brief Parse one line
     * @return Frame, or std::nullopt for ignored / malformed lines
     */
    std::optional<LandmarkFrame> parse_line(const std::string& line);

    /**
     * @brief Get reader counters
     */
    StreamReaderStats get_stats() const { return stats_; }

private:
    std::istream& input_;
    StreamReaderStats stats_;
};

} // namespace gesture
} // namespace handdeck

#endif // HANDDECK_GESTURE_LANDMARK_STREAM_READER_HPP
