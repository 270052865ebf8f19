#pragma once
#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

#include "config/Settings.hpp"
#include "guard/Verdict.hpp"
#include "upstream/ModelBackend.hpp"

namespace promptguard {

class GuardrailOrchestrator;
class ResilientBackend;

struct PromptRequest {
    std::string prompt;
    std::string credential;
};

struct ChatRequest {
    std::string                   message;
    std::string                   credential;
    std::string                   model;
    std::vector<ConversationTurn> history;
};

enum class Outcome {
    OK,
    VALIDATION_FAILURE,
    POLICY_REJECTION,
    UPSTREAM_UNAVAILABLE,
    UPSTREAM_TIMEOUT,
    UPSTREAM_ERROR,
    INTERNAL_ERROR
};

const char* to_string(Outcome o);

// Conversation history from its JSON form: [{"role": "user"|"assistant"|"model",
// "content": "..."}]. Entries with unknown roles or missing content are
// skipped with a warning. Throws std::invalid_argument if j is not an array.
std::vector<ConversationTurn> parse_history(const nlohmann::json& j);

struct PromptResponse {
    Outcome                    outcome{Outcome::INTERNAL_ERROR};
    std::optional<std::string> response;
    Verdict                    guardrail;
    std::optional<std::string> error;

    bool success() const { return outcome == Outcome::OK; }
    int  http_status() const;

    // {"success", "response", "guardrail", "error"}
    nlohmann::json to_json() const;
};

// ---------------------------------------------------------------------------
// Request pipeline behind the prompt and chat front ends:
//   validate → guardrail check → generation → outcome.
//
// Every failure is reported through PromptResponse::outcome; nothing thrown
// from the guardrail or the backend escapes.
// ---------------------------------------------------------------------------
class PromptService {
public:
    PromptService(const Settings& settings,
                  GuardrailOrchestrator& guardrail,
                  ResilientBackend& backend);

    PromptResponse process_prompt(const PromptRequest& req);
    PromptResponse process_chat(const ChatRequest& req);

    // Guardrail verdict only, no generation.
    Verdict check_only(const std::string& text, const std::string& credential);

    static bool is_supported_model(const std::string& model);
    static std::size_t count_code_points(const std::string& utf8);

private:
    // Shared validate + guardrail step. Returns a finished response when the
    // request must stop here.
    std::optional<PromptResponse> screen(const std::string& text,
                                         const std::string& credential,
                                         Verdict& verdict);

    template <typename Generate>
    PromptResponse run_generation(const Verdict& verdict, Generate&& generate);

    const Settings&        settings_;
    GuardrailOrchestrator& guardrail_;
    ResilientBackend&      backend_;
};

} // namespace promptguard
