#include "upstream/CircuitBreaker.hpp"
#include <iostream>
#include <stdexcept>

using namespace promptguard;

CircuitBreaker::CircuitBreaker(int max_failures)
    : max_failures_(max_failures) {
    if (max_failures_ < 1)
        throw std::invalid_argument("[BREAKER] max_failures must be >= 1");
}

bool CircuitBreaker::allow() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return state_ == BreakerState::CLOSED;
}

void CircuitBreaker::record_success() {
    std::lock_guard<std::mutex> lock(mtx_);
    if (state_ == BreakerState::OPEN) {
        // A call admitted before the trip came back healthy.
        std::cout << "[BREAKER] Late success while OPEN: closing\n";
    }
    failures_ = 0;
    state_    = BreakerState::CLOSED;
}

void CircuitBreaker::record_failure(const std::string& cause) {
    std::lock_guard<std::mutex> lock(mtx_);
    failures_++;
    last_failure_ = cause;

    std::cerr << "[BREAKER] Failure " << failures_ << "/" << max_failures_
              << " (" << cause << ")\n";

    if (state_ == BreakerState::CLOSED && failures_ >= max_failures_) {
        state_ = BreakerState::OPEN;
        std::cerr << "[BREAKER] TRIPPED: " << failures_
                  << " consecutive failures, backend calls halted until reset\n";
    }
}

void CircuitBreaker::reset() {
    std::lock_guard<std::mutex> lock(mtx_);
    failures_ = 0;
    state_    = BreakerState::CLOSED;
    last_failure_.clear();
    std::cout << "[BREAKER] Reset by operator\n";
}

BreakerState CircuitBreaker::state() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return state_;
}

int CircuitBreaker::consecutive_failures() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return failures_;
}

CircuitBreaker::Snapshot CircuitBreaker::snapshot() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return Snapshot{state_, failures_, max_failures_, last_failure_};
}
