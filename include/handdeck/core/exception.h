#pragma once

#include "handdeck/core/types.hpp"
#include <stdexcept>
#include <string>

/**
 * @file exception.h
 * @brief Exception types for HandDeck setup failures
 *
 * Exceptions are raised while building the pipeline (configuration,
 * port creation). The running pipeline reports problems through status
 * flags and the logger instead.
 */

namespace handdeck {
namespace core {

/**
 * @brief Base exception class for all HandDeck exceptions
 */
class Exception : public std::runtime_error {
public:
    /**
     * @brief Construct exception with result code and message
     * @param code Result code indicating error type
     * @param message Detailed error description
     * @param context Additional context information
     */
    Exception(ResultCode code,
              const std::string& message,
              const std::string& context = "")
        : std::runtime_error(formatMessage(code, message, context))
        , result_code_(code)
        , message_(message)
        , context_(context) {}

    ResultCode getResultCode() const noexcept { return result_code_; }

    const std::string& getMessage() const noexcept { return message_; }

    const std::string& getContext() const noexcept { return context_; }

private:
    ResultCode result_code_;
    std::string message_;
    std::string context_;

    static std::string formatMessage(ResultCode code,
                                     const std::string& message,
                                     const std::string& context);
};

/**
 * @brief Virtual MIDI port could not be created or used
 */
class MidiException : public Exception {
public:
    MidiException(const std::string& message,
                  const std::string& context = "")
        : Exception(ResultCode::ERROR_MIDI_PORT_UNAVAILABLE, message, context) {}
};

/**
 * @brief Configuration file missing, unparsable or out of range
 */
class ConfigException : public Exception {
public:
    ConfigException(const std::string& message,
                    const std::string& context = "")
        : Exception(ResultCode::ERROR_CONFIG_INVALID, message, context) {}
};

/**
 * @brief Landmark record that cannot be turned into a hand
 */
class LandmarkException : public Exception {
public:
    LandmarkException(const std::string& message,
                      const std::string& context = "")
        : Exception(ResultCode::ERROR_MALFORMED_LANDMARKS, message, context) {}
};

/**
 * @brief Convert result code to string representation
 */
std::string resultCodeToString(ResultCode code);

/**
 * @brief Macro for throwing exceptions with automatic context
 */
#define HANDDECK_THROW(ExceptionType, message) \
    throw ExceptionType(message, std::string(__FILE__) + ":" + std::to_string(__LINE__))

} // namespace core
} // namespace handdeck
