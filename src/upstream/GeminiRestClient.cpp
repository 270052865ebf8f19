#include "upstream/GeminiRestClient.hpp"
#include "upstream/UpstreamError.hpp"
#include <curl/curl.h>
#include <memory>
#include <iostream>

using namespace promptguard;
using json = nlohmann::json;

namespace {

struct CurlDeleter {
    void operator()(CURL* c) const { curl_easy_cleanup(c); }
};
struct SlistDeleter {
    void operator()(curl_slist* l) const { curl_slist_free_all(l); }
};

// Gemini error bodies: {"error": {"code": 400, "message": "...", "status": "..."}}
std::string backend_message(const std::string& body) {
    json j = json::parse(body, nullptr, false);
    if (!j.is_discarded() && j.is_object() && j.contains("error") && j["error"].is_object()) {
        const json& err = j["error"];
        if (err.contains("message") && err["message"].is_string())
            return err["message"].get<std::string>();
    }
    return body.size() > 200 ? body.substr(0, 200) : body;
}

const char* wire_role(TurnRole role) {
    return role == TurnRole::MODEL_REPLY ? "model" : "user";
}

} // namespace

GeminiRestClient::GeminiRestClient(const std::string& base_url,
                                   const std::string& judge_model,
                                   std::chrono::milliseconds request_timeout)
    : base_(base_url), judge_model_(judge_model), request_timeout_(request_timeout) {
    while (!base_.empty() && base_.back() == '/') base_.pop_back();
    std::cout << "[GEMINI] base=" << base_ << " judge_model=" << judge_model_
              << " transfer_timeout=" << request_timeout_.count() << "ms\n";
}

size_t GeminiRestClient::write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    std::string* out = reinterpret_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

std::string GeminiRestClient::classify(const std::string& instruction,
                                       const std::string& credential,
                                       const SamplingParams& params) {
    return extract_text(perform(judge_model_, build_body({}, instruction, params), credential));
}

std::string GeminiRestClient::generate(const std::string& prompt,
                                       const std::string& model,
                                       const std::string& credential,
                                       const SamplingParams& params) {
    return extract_text(perform(model, build_body({}, prompt, params), credential));
}

std::string GeminiRestClient::generate_chat(const std::vector<ConversationTurn>& history,
                                            const std::string& message,
                                            const std::string& model,
                                            const std::string& credential,
                                            const SamplingParams& params) {
    return extract_text(perform(model, build_body(history, message, params), credential));
}

json GeminiRestClient::build_body(const std::vector<ConversationTurn>& history,
                                  const std::string& message,
                                  const SamplingParams& params) {
    json contents = json::array();
    for (const auto& turn : history) {
        contents.push_back({
            {"role",  wire_role(turn.role)},
            {"parts", json::array({ {{"text", turn.content}} })}
        });
    }
    contents.push_back({
        {"role",  "user"},
        {"parts", json::array({ {{"text", message}} })}
    });

    json gen_cfg = {{"temperature", params.temperature}};
    if (params.max_output_tokens > 0)
        gen_cfg["maxOutputTokens"] = params.max_output_tokens;

    json body = {
        {"contents",         contents},
        {"generationConfig", gen_cfg}
    };

    if (params.relax_safety_filters) {
        json safety = json::array();
        for (const char* category : {"HARM_CATEGORY_HARASSMENT",
                                     "HARM_CATEGORY_HATE_SPEECH",
                                     "HARM_CATEGORY_SEXUALLY_EXPLICIT",
                                     "HARM_CATEGORY_DANGEROUS_CONTENT"}) {
            safety.push_back({{"category", category}, {"threshold", "BLOCK_NONE"}});
        }
        body["safetySettings"] = safety;
    }
    return body;
}

std::string GeminiRestClient::extract_text(const std::string& response_body) {
    json j = json::parse(response_body, nullptr, false);
    if (j.is_discarded() || !j.is_object())
        throw UpstreamError(UpstreamError::Kind::MALFORMED_RESPONSE,
                            "[GEMINI] response is not a JSON object");

    if (!j.contains("candidates") || !j["candidates"].is_array() || j["candidates"].empty()) {
        // No candidates: the backend refused the prompt outright.
        if (j.contains("promptFeedback") && j["promptFeedback"].is_object() &&
            j["promptFeedback"].contains("blockReason")) {
            throw UpstreamError(UpstreamError::Kind::BACKEND,
                                "[GEMINI] prompt blocked by backend: " +
                                j["promptFeedback"]["blockReason"].dump());
        }
        throw UpstreamError(UpstreamError::Kind::MALFORMED_RESPONSE,
                            "[GEMINI] response has no candidates");
    }

    // Multi-part answers are concatenated in order.
    const json& cand = j["candidates"][0];
    std::string text;
    bool found = false;
    if (cand.contains("content") && cand["content"].is_object() &&
        cand["content"].contains("parts") && cand["content"]["parts"].is_array()) {
        for (const auto& part : cand["content"]["parts"]) {
            if (part.is_object() && part.contains("text") && part["text"].is_string()) {
                text += part["text"].get<std::string>();
                found = true;
            }
        }
    }
    if (!found)
        throw UpstreamError(UpstreamError::Kind::MALFORMED_RESPONSE,
                            "[GEMINI] candidate carries no text parts");
    return text;
}

std::string GeminiRestClient::perform(const std::string& model,
                                      const json& body,
                                      const std::string& credential) {
    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl)
        throw UpstreamError(UpstreamError::Kind::TRANSPORT, "[GEMINI] curl_easy_init failed");

    const std::string url     = base_ + "/models/" + model + ":generateContent";
    const std::string payload = body.dump();
    std::string response;

    std::string key_hdr = "x-goog-api-key: " + credential;
    curl_slist* raw = nullptr;
    raw = curl_slist_append(raw, "Content-Type: application/json");
    raw = curl_slist_append(raw, key_hdr.c_str());
    std::unique_ptr<curl_slist, SlistDeleter> headers(raw);

    curl_easy_setopt(curl.get(), CURLOPT_URL,            url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER,     headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_POST,           1L);
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS,     payload.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE,  static_cast<long>(payload.size()));
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION,  write_cb);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA,      &response);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS,     static_cast<long>(request_timeout_.count()));
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, 5L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL,       1L);  // worker threads

    CURLcode res = curl_easy_perform(curl.get());
    if (res == CURLE_OPERATION_TIMEDOUT) {
        std::cerr << "[GEMINI] " << model << " transfer timeout\n";
        throw UpstreamTimeout("[GEMINI] transfer timeout");
    }
    if (res != CURLE_OK) {
        std::cerr << "[GEMINI] " << model << " transport error: " << curl_easy_strerror(res) << "\n";
        throw UpstreamError(UpstreamError::Kind::TRANSPORT,
                            std::string("[GEMINI] transport error: ") + curl_easy_strerror(res));
    }

    long http_code = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_code);

    if (http_code >= 200 && http_code < 300) return response;

    const std::string msg = backend_message(response);
    std::cerr << "[GEMINI] " << model << " HTTP " << http_code << ": " << msg << "\n";

    if (http_code == 400 || http_code == 401 || http_code == 403)
        throw UpstreamError(UpstreamError::Kind::AUTHENTICATION,
                            "[GEMINI] invalid api key or bad request: " + msg);
    if (http_code == 429)
        throw UpstreamError(UpstreamError::Kind::QUOTA, "[GEMINI] quota exhausted: " + msg);

    throw UpstreamError(UpstreamError::Kind::BACKEND,
                        "[GEMINI] HTTP " + std::to_string(http_code) + ": " + msg);
}
