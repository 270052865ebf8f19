#pragma once
#include <string>
#include <vector>
#include <chrono>
#include <functional>
#include <boost/asio/thread_pool.hpp>

#include "upstream/ModelBackend.hpp"
#include "upstream/CircuitBreaker.hpp"
#include "upstream/UpstreamError.hpp"

namespace promptguard {

// ---------------------------------------------------------------------------
// Timeout + circuit breaker around every call to the model backend.
//
// The backend is blocking, so each call is posted to a worker pool and the
// caller waits on the result with its own deadline. On expiry the caller gets
// UpstreamTimeout immediately; the worker finishes (or times out inside the
// transport) on its own and its result is dropped.
//
// Failure accounting (see CircuitBreaker):
//   timeout / backend exception → record_failure, failure propagated unchanged
//   success                     → record_success
//   breaker OPEN                → UpstreamUnavailable, backend never touched
//
// No retries. Backend and breaker are non-owning and must outlive this object;
// the destructor joins the pool so abandoned calls drain before they go away.
// ---------------------------------------------------------------------------
class ResilientBackend {
public:
    ResilientBackend(ModelBackend& backend, CircuitBreaker& breaker,
                     std::size_t worker_threads);
    ~ResilientBackend();

    ResilientBackend(const ResilientBackend&) = delete;
    ResilientBackend& operator=(const ResilientBackend&) = delete;

    std::string classify(const std::string& instruction,
                         const std::string& credential,
                         const SamplingParams& params,
                         std::chrono::milliseconds timeout);

    std::string generate(const std::string& prompt,
                         const std::string& model,
                         const std::string& credential,
                         const SamplingParams& params,
                         std::chrono::milliseconds timeout);

    std::string generate_chat(const std::vector<ConversationTurn>& history,
                              const std::string& message,
                              const std::string& model,
                              const std::string& credential,
                              const SamplingParams& params,
                              std::chrono::milliseconds timeout);

private:
    std::string invoke(const char* op,
                       std::function<std::string()> call,
                       std::chrono::milliseconds timeout);

    ModelBackend&           backend_;
    CircuitBreaker&         breaker_;
    boost::asio::thread_pool pool_;
};

} // namespace promptguard
