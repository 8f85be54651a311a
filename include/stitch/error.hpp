// include/stitch/error.hpp
// Single exception class with a kind enum.

#pragma once

#include "types.hpp"

#include <memory>
#include <stdexcept>
#include <string>

namespace stitch {

enum class ErrorKind {
    Configuration,  // Invalid config at construction
    Validation,     // Message lacks a resolvable table name or key names
    Serialization,  // Unencodable value or corrupted buffer
    Transport,      // Connect failure, timeout, malformed response
    Rejected,       // Gateway refused the batch
    Closed          // Push after close
};

class StitchError : public std::exception {
public:
    StitchError(ErrorKind kind, std::string message)
        : kind_(kind), message_(std::move(message)) {}

    StitchError(ErrorKind kind, const std::string& field, const std::string& reason)
        : kind_(kind), message_("validation error: " + field + " " + reason),
          field_(field), reason_(reason) {}

    const char* what() const noexcept override { return message_.c_str(); }
    ErrorKind kind() const noexcept { return kind_; }
    const std::string& message() const noexcept { return message_; }
    const std::string& field() const noexcept { return field_; }
    const std::string& reason() const noexcept { return reason_; }

    // Set only for ErrorKind::Rejected.
    const Response* response() const noexcept { return response_.get(); }

    // Caller may retry the same batch.
    bool retryable() const noexcept {
        return kind_ == ErrorKind::Transport || kind_ == ErrorKind::Rejected;
    }

    static StitchError configuration(std::string msg) {
        return StitchError(ErrorKind::Configuration, "configuration error: " + msg);
    }

    static StitchError validation(std::string field, std::string reason) {
        return StitchError(ErrorKind::Validation, field, reason);
    }

    static StitchError serialization(std::string msg) {
        return StitchError(ErrorKind::Serialization, "serialization error: " + msg);
    }

    static StitchError transport(std::string msg) {
        return StitchError(ErrorKind::Transport, "transport error: " + msg);
    }

    static StitchError rejected(Response response) {
        StitchError err(ErrorKind::Rejected,
            "batch rejected: " + std::to_string(response.status) + " " + response.reason +
            " " + response.body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
        err.response_ = std::make_shared<const Response>(std::move(response));
        return err;
    }

    static StitchError closed() {
        return StitchError(ErrorKind::Closed, "client is closed");
    }

private:
    ErrorKind kind_;
    std::string message_;
    std::string field_;
    std::string reason_;
    std::shared_ptr<const Response> response_;
};

} // namespace stitch
