#include "guard/GuardrailOrchestrator.hpp"
#include "guard/Normalizer.hpp"
#include "guard/HeuristicDetector.hpp"
#include "guard/JudgeClient.hpp"
#include <iostream>

using namespace promptguard;

GuardrailOrchestrator::GuardrailOrchestrator(const Normalizer& normalizer,
                                             const HeuristicDetector& heuristics,
                                             JudgeClient& judge)
    : normalizer_(normalizer), heuristics_(heuristics), judge_(judge) {}

Verdict GuardrailOrchestrator::check(const std::string& raw_text,
                                     const std::string& credential,
                                     std::chrono::milliseconds tier2_timeout) {
    const std::string normalized = normalizer_.normalize(raw_text);

    Verdict tier1 = heuristics_.evaluate(raw_text, normalized);
    if (!tier1.safe) {
        std::cerr << "[GUARDRAIL] tier 1 triggered: " << tier1.reason << "\n";
        return tier1;
    }

    if (credential.empty()) {
        // Tier 2 needs a backend credential. Tier 1 alone decides here.
        std::cerr << "[GUARDRAIL] WARNING: no credential: tier 2 skipped\n";
        return tier1;
    }

    Verdict tier2 = judge_.evaluate(raw_text, credential, tier2_timeout);
    if (!tier2.safe) {
        std::cerr << "[GUARDRAIL] tier 2 triggered: " << tier2.reason << "\n";
        return tier2;
    }

    std::cout << "[GUARDRAIL] prompt passed all guardrails\n";
    return Verdict::pass(VerdictTier::ALL, "passed all security checks");
}
