#include "service/PromptService.hpp"
#include "guard/GuardrailOrchestrator.hpp"
#include "upstream/ResilientBackend.hpp"
#include "upstream/UpstreamError.hpp"
#include <algorithm>
#include <array>
#include <chrono>
#include <iostream>
#include <stdexcept>

using namespace promptguard;

namespace {

const std::array<const char*, 9> SUPPORTED_MODELS = {
    "gemini-3-pro-preview",
    "gemini-3-flash-preview",
    "gemini-2.5-pro",
    "gemini-2.5-flash",
    "gemini-2.5-flash-lite",
    "gemini-2.0-flash",
    "gemini-2.0-flash-lite",
    "gemini-flash-latest",
    "gemini-pro-latest",
};

} // namespace

const char* promptguard::to_string(Outcome o) {
    switch (o) {
        case Outcome::OK:                   return "OK";
        case Outcome::VALIDATION_FAILURE:   return "VALIDATION_FAILURE";
        case Outcome::POLICY_REJECTION:     return "POLICY_REJECTION";
        case Outcome::UPSTREAM_UNAVAILABLE: return "UPSTREAM_UNAVAILABLE";
        case Outcome::UPSTREAM_TIMEOUT:     return "UPSTREAM_TIMEOUT";
        case Outcome::UPSTREAM_ERROR:       return "UPSTREAM_ERROR";
        case Outcome::INTERNAL_ERROR:       return "INTERNAL_ERROR";
    }
    return "UNKNOWN";
}

std::vector<ConversationTurn> promptguard::parse_history(const nlohmann::json& j) {
    if (!j.is_array())
        throw std::invalid_argument("[SERVICE] conversation history must be a JSON array");

    std::vector<ConversationTurn> turns;
    for (const auto& item : j) {
        if (!item.is_object() || !item.contains("role") || !item["role"].is_string() ||
            !item.contains("content") || !item["content"].is_string()) {
            std::cerr << "[SERVICE] skipping malformed history entry\n";
            continue;
        }
        const std::string role = item["role"].get<std::string>();
        if (role == "user") {
            turns.push_back({TurnRole::USER, item["content"].get<std::string>()});
        } else if (role == "assistant" || role == "model") {
            turns.push_back({TurnRole::MODEL_REPLY, item["content"].get<std::string>()});
        } else {
            std::cerr << "[SERVICE] skipping history entry with invalid role: " << role << "\n";
        }
    }
    return turns;
}

int PromptResponse::http_status() const {
    switch (outcome) {
        case Outcome::OK:                   return 200;
        case Outcome::VALIDATION_FAILURE:   return 422;
        case Outcome::POLICY_REJECTION:     return 400;
        case Outcome::UPSTREAM_UNAVAILABLE: return 503;
        case Outcome::UPSTREAM_TIMEOUT:     return 504;
        case Outcome::UPSTREAM_ERROR:       return 502;
        case Outcome::INTERNAL_ERROR:       return 500;
    }
    return 500;
}

nlohmann::json PromptResponse::to_json() const {
    nlohmann::json j;
    j["success"]   = success();
    j["response"]  = response ? nlohmann::json(*response) : nlohmann::json(nullptr);
    j["guardrail"] = guardrail.to_json();
    j["error"]     = error ? nlohmann::json(*error) : nlohmann::json(nullptr);
    return j;
}

PromptService::PromptService(const Settings& settings,
                             GuardrailOrchestrator& guardrail,
                             ResilientBackend& backend)
    : settings_(settings), guardrail_(guardrail), backend_(backend) {}

bool PromptService::is_supported_model(const std::string& model) {
    return std::find(SUPPORTED_MODELS.begin(), SUPPORTED_MODELS.end(), model) !=
           SUPPORTED_MODELS.end();
}

std::size_t PromptService::count_code_points(const std::string& utf8) {
    std::size_t n = 0;
    for (unsigned char c : utf8) {
        if ((c & 0xC0) != 0x80) n++;   // skip continuation bytes
    }
    return n;
}

std::optional<PromptResponse> PromptService::screen(const std::string& text,
                                                    const std::string& credential,
                                                    Verdict& verdict) {
    const std::size_t length = count_code_points(text);
    if (length > settings_.max_prompt_length) {
        std::cerr << "[SERVICE] prompt too long: " << length
                  << " > " << settings_.max_prompt_length << "\n";
        PromptResponse r;
        r.outcome   = Outcome::VALIDATION_FAILURE;
        r.guardrail = Verdict::reject(VerdictTier::NONE, "prompt exceeds maximum length");
        r.error     = "prompt too long";
        return r;
    }

    try {
        verdict = guardrail_.check(text, credential, settings_.guardrail_timeout);
    } catch (const std::exception& e) {
        std::cerr << "[SERVICE] guardrail check failed: " << e.what() << "\n";
        PromptResponse r;
        r.outcome   = Outcome::INTERNAL_ERROR;
        r.guardrail = Verdict::reject(VerdictTier::NONE, "unexpected error");
        r.error     = std::string("internal error: ") + e.what();
        return r;
    }

    if (!verdict.safe) {
        std::cerr << "[SERVICE] blocked: " << verdict.reason << "\n";
        PromptResponse r;
        r.outcome   = Outcome::POLICY_REJECTION;
        r.guardrail = verdict;
        r.error     = "prompt blocked by security guardrails";
        return r;
    }
    return std::nullopt;
}

template <typename Generate>
PromptResponse PromptService::run_generation(const Verdict& verdict, Generate&& generate) {
    PromptResponse r;
    r.guardrail = verdict;

    try {
        r.response = generate();
        r.outcome  = Outcome::OK;
        std::cout << "[SERVICE] request processed successfully\n";
    } catch (const UpstreamUnavailable& e) {
        std::cerr << "[SERVICE] backend unavailable: " << e.what() << "\n";
        r.outcome = Outcome::UPSTREAM_UNAVAILABLE;
        r.error   = "backend service temporarily unavailable";
    } catch (const UpstreamTimeout& e) {
        std::cerr << "[SERVICE] backend timeout: " << e.what() << "\n";
        r.outcome = Outcome::UPSTREAM_TIMEOUT;
        r.error   = "backend request timed out";
    } catch (const UpstreamError& e) {
        std::cerr << "[SERVICE] backend error (" << to_string(e.kind()) << "): "
                  << e.what() << "\n";
        r.outcome = Outcome::UPSTREAM_ERROR;
        r.error   = std::string("failed to generate response: ") + e.what();
    } catch (const std::exception& e) {
        std::cerr << "[SERVICE] unexpected error: " << e.what() << "\n";
        r.outcome = Outcome::INTERNAL_ERROR;
        r.error   = std::string("internal error: ") + e.what();
    }
    return r;
}

PromptResponse PromptService::process_prompt(const PromptRequest& req) {
    Verdict verdict;
    if (auto early = screen(req.prompt, req.credential, verdict)) return *early;

    const std::string model = settings_.generation_model;
    return run_generation(verdict, [&]() {
        return backend_.generate(req.prompt, model, req.credential,
                                 generation_sampling(), settings_.generation_timeout);
    });
}

PromptResponse PromptService::process_chat(const ChatRequest& req) {
    std::string model = req.model;
    if (!is_supported_model(model)) {
        std::cerr << "[SERVICE] unsupported model '" << model << "': using "
                  << settings_.default_chat_model << "\n";
        model = settings_.default_chat_model;
    }

    Verdict verdict;
    if (auto early = screen(req.message, req.credential, verdict)) return *early;

    return run_generation(verdict, [&]() {
        return backend_.generate_chat(req.history, req.message, model, req.credential,
                                      generation_sampling(), settings_.generation_timeout);
    });
}

Verdict PromptService::check_only(const std::string& text, const std::string& credential) {
    Verdict verdict;
    if (auto early = screen(text, credential, verdict)) return early->guardrail;
    return verdict;
}
