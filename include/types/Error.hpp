#pragma once

#include <string>
#include <string_view>

namespace mg::types {

enum class ErrorKind {
    NotAuthenticated,
    AuthExpired,
    NotFound,
    AlreadyExists,
    UnsupportedCombination,
    Cancelled,
    ThrottledTimeout,
    Transport,
    InvalidArgument,
    Configuration
};

struct Error {
    ErrorKind kind{ErrorKind::Transport};
    std::string message{};
    std::string cause{};
    bool reauthAttempted{false};   // the client already refreshed its session for this request

    Error() = default;
    Error(ErrorKind kind, std::string message, std::string cause = {})
        : kind(kind), message(std::move(message)), cause(std::move(cause)) {}

    [[nodiscard]] Error& markReauthAttempted() { reauthAttempted = true; return *this; }

    [[nodiscard]] bool isAuthError() const;
    [[nodiscard]] bool isTransient() const;
    [[nodiscard]] std::string describe() const;
};

std::string to_string(ErrorKind kind);

// Maps free-form client messages ("Not authenticated", "HTTP 401", ...) onto a kind.
// Only for collaborators that cannot report a structured kind.
ErrorKind classifyLegacyMessage(std::string_view message, ErrorKind fallback = ErrorKind::Transport);

}
