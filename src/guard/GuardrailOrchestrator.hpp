#pragma once
#include <string>
#include <chrono>

#include "guard/Verdict.hpp"

namespace promptguard {

class Normalizer;
class HeuristicDetector;
class JudgeClient;

// ---------------------------------------------------------------------------
// Runs a prompt through normalize → tier 1 → tier 2 and stops at the first
// unsafe verdict, so tier 2 is never paid for prompts tier 1 already rejects.
//
// Tier 2 runs only when a credential is supplied. Without one the tier-1
// verdict is final; every such skip is logged.
//
// Non-owning: all three collaborators must outlive the orchestrator.
// ---------------------------------------------------------------------------
class GuardrailOrchestrator {
public:
    GuardrailOrchestrator(const Normalizer& normalizer,
                          const HeuristicDetector& heuristics,
                          JudgeClient& judge);

    Verdict check(const std::string& raw_text,
                  const std::string& credential,
                  std::chrono::milliseconds tier2_timeout);

private:
    const Normalizer&        normalizer_;
    const HeuristicDetector& heuristics_;
    JudgeClient&             judge_;
};

} // namespace promptguard
