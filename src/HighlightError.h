#pragma once

#include <string>
#include <expected>
#include <optional>

enum class HighlightErrorKind {
    Cancelled,
    ProviderUnavailable,
    ProviderFailure,
    StaleVersion,
    WaitTimeout
};

struct HighlightError {
    HighlightErrorKind kind;
    std::string message;
};

inline const char* to_string(HighlightErrorKind kind) {
    switch (kind) {
        case HighlightErrorKind::Cancelled: return "cancelled";
        case HighlightErrorKind::ProviderUnavailable: return "provider unavailable";
        case HighlightErrorKind::ProviderFailure: return "provider failure";
        case HighlightErrorKind::StaleVersion: return "stale version";
        case HighlightErrorKind::WaitTimeout: return "wait timeout";
    }
    return "unknown";
}

struct ProviderError {
    bool cancelled = false;
    std::string message;
};

// An empty optional is "no result", which callers treat as a no-op.
template <typename T>
using ProviderResult = std::expected<std::optional<T>, ProviderError>;
