#pragma once

#include <ostream>
#include <string>

namespace hearth {

/**
 * @brief Categories of controller failures.
 *
 * Each kind has a fixed display name used when the error is formatted:
 * - DISCOVERY -> "Discovery"
 * - REQUEST -> "Request"
 * - INVALID_PARAMETER -> "Invalid Parameter"
 * - JSON_RESPONSE -> "Json Response"
 * - STREAM_RESPONSE -> "Stream Response"
 * - SENDER -> "Response Sender"
 * - EVENTS -> "Events"
 */
enum class ErrorKind { DISCOVERY, REQUEST, INVALID_PARAMETER, JSON_RESPONSE, STREAM_RESPONSE, SENDER, EVENTS };

const char *error_kind_to_string(ErrorKind kind);

/**
 * @brief Typed controller error.
 *
 * Constructing an error with a kind logs "{kind}: {description}" at ERROR
 * level, so failures stay visible even when the caller drops the value.
 * A default-constructed Error means "no error" and is used as an out-param.
 */
class Error {
public:
    Error() = default;
    Error(ErrorKind kind, std::string description);

    ErrorKind kind() const { return kind_; }
    const std::string &description() const { return description_; }
    bool is_set() const { return set_; }

    std::string to_string() const;

private:
    ErrorKind kind_ = ErrorKind::REQUEST;
    std::string description_;
    bool set_ = false;
};

std::ostream &operator<<(std::ostream &os, const Error &error);

}  // namespace hearth
