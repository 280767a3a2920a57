#include "error.hpp"

#include <utility>

#include "logging/logger.hpp"

namespace hearth {

const char *error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::DISCOVERY:
            return "Discovery";
        case ErrorKind::REQUEST:
            return "Request";
        case ErrorKind::INVALID_PARAMETER:
            return "Invalid Parameter";
        case ErrorKind::JSON_RESPONSE:
            return "Json Response";
        case ErrorKind::STREAM_RESPONSE:
            return "Stream Response";
        case ErrorKind::SENDER:
            return "Response Sender";
        case ErrorKind::EVENTS:
            return "Events";
        default:
            return "Unknown";
    }
}

Error::Error(ErrorKind kind, std::string description)
    : kind_(kind), description_(std::move(description)), set_(true) {
    LOG_ERROR(to_string());
}

std::string Error::to_string() const { return std::string(error_kind_to_string(kind_)) + ": " + description_; }

std::ostream &operator<<(std::ostream &os, const Error &error) { return os << error.to_string(); }

}  // namespace hearth
