#pragma once
#include <string>
#include <vector>
#include <chrono>
#include <nlohmann/json.hpp>

#include "upstream/ModelBackend.hpp"

namespace promptguard {

// ---------------------------------------------------------------------------
// ModelBackend over the Gemini REST API.
//
//   POST {base}/models/{model}:generateContent
//   x-goog-api-key: <credential>
//
// Credential travels in the request header of each call; the client holds no
// per-caller state. A fresh CURL handle is used per call so concurrent calls
// from the worker pool never share a handle.
//
// curl_global_init() must have been called once by main() before use.
// ---------------------------------------------------------------------------
class GeminiRestClient : public ModelBackend {
public:
    GeminiRestClient(const std::string& base_url,
                     const std::string& judge_model,
                     std::chrono::milliseconds request_timeout);

    std::string classify(const std::string& instruction,
                         const std::string& credential,
                         const SamplingParams& params) override;

    std::string generate(const std::string& prompt,
                         const std::string& model,
                         const std::string& credential,
                         const SamplingParams& params) override;

    std::string generate_chat(const std::vector<ConversationTurn>& history,
                              const std::string& message,
                              const std::string& model,
                              const std::string& credential,
                              const SamplingParams& params) override;

    // Request/response shaping, exposed for tests.
    static nlohmann::json build_body(const std::vector<ConversationTurn>& history,
                                     const std::string& message,
                                     const SamplingParams& params);
    static std::string extract_text(const std::string& response_body);

private:
    static size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata);

    std::string perform(const std::string& model,
                        const nlohmann::json& body,
                        const std::string& credential);

    std::string               base_;
    std::string               judge_model_;
    std::chrono::milliseconds request_timeout_;
};

} // namespace promptguard
