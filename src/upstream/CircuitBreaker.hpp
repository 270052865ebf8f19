#pragma once
#include <string>
#include <mutex>

namespace promptguard {

enum class BreakerState { CLOSED, OPEN };

inline const char* to_string(BreakerState s) {
    return s == BreakerState::OPEN ? "OPEN" : "CLOSED";
}

// ---------------------------------------------------------------------------
// Consecutive-failure circuit breaker for backend calls.
//
// CLOSED → OPEN when consecutive failures reach max_failures.
// OPEN   → CLOSED only on reset() or a success that was already in flight.
// There is no half-open probe: once tripped, an operator resets it.
//
// One instance is shared by every backend call in the process. All transitions
// happen under mtx_.
// ---------------------------------------------------------------------------
class CircuitBreaker {
public:
    static constexpr int DEFAULT_MAX_FAILURES = 3;

    struct Snapshot {
        BreakerState state;
        int          consecutive_failures;
        int          max_failures;
        std::string  last_failure;
    };

    explicit CircuitBreaker(int max_failures = DEFAULT_MAX_FAILURES);

    // False while OPEN. Callers must not contact the backend when false.
    bool allow() const;

    void record_success();
    void record_failure(const std::string& cause);

    // Manual operator reset.
    void reset();

    BreakerState state() const;
    int consecutive_failures() const;
    int max_failures() const { return max_failures_; }
    Snapshot snapshot() const;

private:
    const int    max_failures_;
    BreakerState state_{BreakerState::CLOSED};
    int          failures_{0};
    std::string  last_failure_;

    mutable std::mutex mtx_;
};

} // namespace promptguard
