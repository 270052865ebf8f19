#pragma once
#include <stdexcept>
#include <string>

namespace promptguard {

// ---------------------------------------------------------------------------
// Failure signals raised by calls to the model backend.
//
// UpstreamTimeout    : caller deadline expired before the backend answered.
// UpstreamUnavailable: circuit breaker is OPEN, no call was attempted.
// UpstreamError      : everything else the backend or transport reports.
//
// ResilientBackend rethrows these unchanged. The only substitution it makes is
// UpstreamUnavailable when the breaker is already open.
// ---------------------------------------------------------------------------
class UpstreamError : public std::runtime_error {
public:
    enum class Kind {
        TRANSPORT,
        AUTHENTICATION,
        QUOTA,
        MALFORMED_RESPONSE,
        BACKEND,
        TIMEOUT,
        UNAVAILABLE
    };

    UpstreamError(Kind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    Kind kind() const { return kind_; }

private:
    Kind kind_;
};

class UpstreamTimeout : public UpstreamError {
public:
    explicit UpstreamTimeout(const std::string& what)
        : UpstreamError(Kind::TIMEOUT, what) {}
};

class UpstreamUnavailable : public UpstreamError {
public:
    explicit UpstreamUnavailable(const std::string& what)
        : UpstreamError(Kind::UNAVAILABLE, what) {}
};

inline const char* to_string(UpstreamError::Kind kind) {
    switch (kind) {
        case UpstreamError::Kind::TRANSPORT:          return "TRANSPORT";
        case UpstreamError::Kind::AUTHENTICATION:     return "AUTHENTICATION";
        case UpstreamError::Kind::QUOTA:              return "QUOTA";
        case UpstreamError::Kind::MALFORMED_RESPONSE: return "MALFORMED_RESPONSE";
        case UpstreamError::Kind::BACKEND:            return "BACKEND";
        case UpstreamError::Kind::TIMEOUT:            return "TIMEOUT";
        case UpstreamError::Kind::UNAVAILABLE:        return "UNAVAILABLE";
    }
    return "UNKNOWN";
}

} // namespace promptguard
