#pragma once
#include <string>
#include <vector>

namespace promptguard {

enum class TurnRole { USER, MODEL_REPLY };

struct ConversationTurn {
    TurnRole    role;
    std::string content;
};

struct SamplingParams {
    double temperature{0.7};
    int    max_output_tokens{0};        // 0 = backend default
    bool   relax_safety_filters{false}; // judge needs to see harmful text verbatim
};

// Judge calls: low temperature for consistent verdicts, enough tokens for the
// full JSON object.
inline SamplingParams judge_sampling() {
    SamplingParams p;
    p.temperature          = 0.1;
    p.max_output_tokens    = 500;
    p.relax_safety_filters = true;
    return p;
}

inline SamplingParams generation_sampling() {
    return SamplingParams{};
}

// ---------------------------------------------------------------------------
// Opaque generative backend. Every call takes the credential explicitly;
// implementations must not keep per-caller state between calls, so concurrent
// callers with different keys never interfere.
//
// All methods block and may throw UpstreamError (see UpstreamError.hpp).
// ---------------------------------------------------------------------------
class ModelBackend {
public:
    virtual ~ModelBackend() = default;

    virtual std::string classify(const std::string& instruction,
                                 const std::string& credential,
                                 const SamplingParams& params) = 0;

    virtual std::string generate(const std::string& prompt,
                                 const std::string& model,
                                 const std::string& credential,
                                 const SamplingParams& params) = 0;

    virtual std::string generate_chat(const std::vector<ConversationTurn>& history,
                                      const std::string& message,
                                      const std::string& model,
                                      const std::string& credential,
                                      const SamplingParams& params) = 0;
};

} // namespace promptguard
