#pragma once
#include <string>
#include <chrono>

#include "guard/Verdict.hpp"

namespace promptguard {

class ResilientBackend;

// ---------------------------------------------------------------------------
// Tier 2: semantic judge. Asks the external model to classify the raw prompt
// for injection, jailbreak and PII, and turns the answer into a Verdict.
//
// Fails closed everywhere: unparsable answer, missing "safe" field, timeout,
// open breaker or any backend error all yield an unsafe tier-2 verdict.
// evaluate() never throws.
// ---------------------------------------------------------------------------
class JudgeClient {
public:
    explicit JudgeClient(ResilientBackend& backend);

    Verdict evaluate(const std::string& raw_text,
                     const std::string& credential,
                     std::chrono::milliseconds timeout);

    static std::string build_request(const std::string& raw_text);

    // Removes ```json ... ``` or ``` ... ``` wrapping and surrounding blanks.
    static std::string strip_code_fence(const std::string& response);

    static Verdict parse_verdict(const std::string& response);

private:
    ResilientBackend& backend_;
};

} // namespace promptguard
