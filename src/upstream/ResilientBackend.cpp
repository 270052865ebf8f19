#include "upstream/ResilientBackend.hpp"
#include <future>
#include <memory>
#include <iostream>
#include <boost/asio/post.hpp>

using namespace promptguard;

ResilientBackend::ResilientBackend(ModelBackend& backend, CircuitBreaker& breaker,
                                   std::size_t worker_threads)
    : backend_(backend)
    , breaker_(breaker)
    , pool_(worker_threads == 0 ? 1 : worker_threads) {
    std::cout << "[RESILIENT] Worker pool: " << (worker_threads == 0 ? 1 : worker_threads)
              << " threads, breaker threshold=" << breaker_.max_failures() << "\n";
}

ResilientBackend::~ResilientBackend() {
    // Abandoned (timed-out) calls may still be running: let them drain so
    // nothing touches backend_ after we return.
    pool_.join();
}

std::string ResilientBackend::classify(const std::string& instruction,
                                       const std::string& credential,
                                       const SamplingParams& params,
                                       std::chrono::milliseconds timeout) {
    ModelBackend* be = &backend_;
    return invoke("classify",
                  [be, instruction, credential, params]() {
                      return be->classify(instruction, credential, params);
                  },
                  timeout);
}

std::string ResilientBackend::generate(const std::string& prompt,
                                       const std::string& model,
                                       const std::string& credential,
                                       const SamplingParams& params,
                                       std::chrono::milliseconds timeout) {
    ModelBackend* be = &backend_;
    return invoke("generate",
                  [be, prompt, model, credential, params]() {
                      return be->generate(prompt, model, credential, params);
                  },
                  timeout);
}

std::string ResilientBackend::generate_chat(const std::vector<ConversationTurn>& history,
                                            const std::string& message,
                                            const std::string& model,
                                            const std::string& credential,
                                            const SamplingParams& params,
                                            std::chrono::milliseconds timeout) {
    ModelBackend* be = &backend_;
    return invoke("generate_chat",
                  [be, history, message, model, credential, params]() {
                      return be->generate_chat(history, message, model, credential, params);
                  },
                  timeout);
}

std::string ResilientBackend::invoke(const char* op,
                                     std::function<std::string()> call,
                                     std::chrono::milliseconds timeout) {
    if (!breaker_.allow()) {
        std::cerr << "[RESILIENT] " << op << " rejected: circuit OPEN\n";
        throw UpstreamUnavailable("backend temporarily unavailable (circuit open)");
    }

    const auto start = std::chrono::steady_clock::now();

    // Shared with the worker: if we stop waiting, the task still owns its
    // state until it completes.
    auto task = std::make_shared<std::packaged_task<std::string()>>(std::move(call));
    std::future<std::string> result = task->get_future();
    boost::asio::post(pool_, [task]() { (*task)(); });

    if (result.wait_for(timeout) != std::future_status::ready) {
        breaker_.record_failure(std::string(op) + " timeout");
        std::cerr << "[RESILIENT] " << op << " timed out after "
                  << timeout.count() << "ms\n";
        throw UpstreamTimeout(std::string(op) + " timed out after " +
                              std::to_string(timeout.count()) + "ms");
    }

    try {
        std::string text = result.get();
        breaker_.record_success();

        auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
        std::cout << "[RESILIENT] " << op << " ok in " << elapsed_ms << "ms\n";
        return text;
    } catch (const std::exception& e) {
        breaker_.record_failure(std::string(op) + ": " + e.what());
        throw;
    } catch (...) {
        breaker_.record_failure(std::string(op) + ": unknown error");
        throw;
    }
}
