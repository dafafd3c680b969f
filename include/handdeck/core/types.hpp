/**
 * @file types.hpp
 * @brief Common type definitions for HandDeck
 *
 * Fundamental result codes and clock aliases used throughout the library.
 */

#ifndef HANDDECK_CORE_TYPES_HPP
#define HANDDECK_CORE_TYPES_HPP

#include <chrono>

namespace handdeck {
namespace core {

/**
 * @brief Result codes reported by setup operations and carried by exceptions
 */
enum class ResultCode {
    SUCCESS = 0,
    ERROR_GENERIC,
    ERROR_INVALID_PARAMETER,
    ERROR_NOT_INITIALIZED,
    ERROR_ALREADY_INITIALIZED,
    ERROR_CONFIG_INVALID,
    ERROR_FILE_NOT_FOUND,
    ERROR_MIDI_PORT_UNAVAILABLE,
    ERROR_MIDI_SEND_FAILED,
    ERROR_MALFORMED_LANDMARKS,
    ERROR_FEEDBACK_PARSE,
    ERROR_THREAD_FAILURE
};

/**
 * @brief Monotonic clock used for every timestamp in the pipeline
 */
using Clock = std::chrono::steady_clock;
using Timestamp = Clock::time_point;

/**
 * @brief Seconds between two timestamps as double
 */
inline double seconds_between(Timestamp from, Timestamp to) {
    return std::chrono::duration<double>(to - from).count();
}

} // namespace core
} // namespace handdeck

#endif // HANDDECK_CORE_TYPES_HPP
