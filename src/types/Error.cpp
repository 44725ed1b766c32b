#include "types/Error.hpp"

#include <algorithm>
#include <cctype>

namespace mg::types {

bool Error::isAuthError() const {
    return kind == ErrorKind::AuthExpired || kind == ErrorKind::NotAuthenticated;
}

bool Error::isTransient() const {
    return kind == ErrorKind::Transport || kind == ErrorKind::ThrottledTimeout;
}

std::string Error::describe() const {
    if (cause.empty()) return to_string(kind) + ": " + message;
    return to_string(kind) + ": " + message + " (" + cause + ")";
}

std::string to_string(const ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NotAuthenticated: return "NotAuthenticated";
        case ErrorKind::AuthExpired: return "AuthExpired";
        case ErrorKind::NotFound: return "NotFound";
        case ErrorKind::AlreadyExists: return "AlreadyExists";
        case ErrorKind::UnsupportedCombination: return "UnsupportedCombination";
        case ErrorKind::Cancelled: return "Cancelled";
        case ErrorKind::ThrottledTimeout: return "ThrottledTimeout";
        case ErrorKind::Transport: return "Transport";
        case ErrorKind::InvalidArgument: return "InvalidArgument";
        case ErrorKind::Configuration: return "Configuration";
    }
    return "Unknown";
}

static std::string lower(std::string_view s) {
    std::string out(s);
    std::ranges::transform(out, out.begin(), [](const unsigned char c) { return std::tolower(c); });
    return out;
}

ErrorKind classifyLegacyMessage(const std::string_view message, const ErrorKind fallback) {
    const auto msg = lower(message);
    if (msg.find("not authenticated") != std::string::npos) return ErrorKind::AuthExpired;
    if (msg.find("401") != std::string::npos) return ErrorKind::AuthExpired;
    if (msg.find("token expired") != std::string::npos) return ErrorKind::AuthExpired;
    if (msg.find("unauthorized") != std::string::npos) return ErrorKind::AuthExpired;
    if (msg.find("not found") != std::string::npos) return ErrorKind::NotFound;
    if (msg.find("already exists") != std::string::npos) return ErrorKind::AlreadyExists;
    return fallback;
}

}
