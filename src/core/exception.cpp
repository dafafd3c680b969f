#include "handdeck/core/exception.h"
#include <sstream>

namespace handdeck {
namespace core {

std::string Exception::formatMessage(ResultCode code,
                                     const std::string& message,
                                     const std::string& context) {
    std::ostringstream oss;
    oss << "[" << resultCodeToString(code) << "] " << message;
    if (!context.empty()) {
        oss << " (Context: " << context << ")";
    }
    return oss.str();
}

std::string resultCodeToString(ResultCode code) {
    switch (code) {
        case ResultCode::SUCCESS:
            return "SUCCESS";
        case ResultCode::ERROR_GENERIC:
            return "ERROR_GENERIC";
        case ResultCode::ERROR_INVALID_PARAMETER:
            return "ERROR_INVALID_PARAMETER";
        case ResultCode::ERROR_NOT_INITIALIZED:
            return "ERROR_NOT_INITIALIZED";
        case ResultCode::ERROR_ALREADY_INITIALIZED:
            return "ERROR_ALREADY_INITIALIZED";
        case ResultCode::ERROR_CONFIG_INVALID:
            return "ERROR_CONFIG_INVALID";
        case ResultCode::ERROR_FILE_NOT_FOUND:
            return "ERROR_FILE_NOT_FOUND";
        case ResultCode::ERROR_MIDI_PORT_UNAVAILABLE:
            return "ERROR_MIDI_PORT_UNAVAILABLE";
        case ResultCode::ERROR_MIDI_SEND_FAILED:
            return "ERROR_MIDI_SEND_FAILED";
        case ResultCode::ERROR_MALFORMED_LANDMARKS:
            return "ERROR_MALFORMED_LANDMARKS";
        case ResultCode::ERROR_FEEDBACK_PARSE:
            return "ERROR_FEEDBACK_PARSE";
        case ResultCode::ERROR_THREAD_FAILURE:
            return "ERROR_THREAD_FAILURE";
        default:
            return "UNKNOWN_ERROR";
    }
}

} // namespace core
} // namespace handdeck
