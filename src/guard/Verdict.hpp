#pragma once
#include <string>
#include <optional>
#include <nlohmann/json.hpp>

namespace promptguard {

// Which stage produced a verdict. ALL = every configured stage passed.
enum class VerdictTier { NONE, HEURISTIC, SEMANTIC, ALL };

// ---------------------------------------------------------------------------
// Outcome of a guardrail check. Produced once and passed around by value.
// An unsafe verdict always has a non-empty reason (reject() enforces it).
// ---------------------------------------------------------------------------
struct Verdict {
    bool                       safe{false};
    std::string                reason;
    VerdictTier                tier{VerdictTier::NONE};
    std::optional<std::string> matched_pattern;

    static Verdict pass(VerdictTier tier, const std::string& reason) {
        return Verdict{true, reason, tier, std::nullopt};
    }

    static Verdict reject(VerdictTier tier, const std::string& reason,
                          std::optional<std::string> pattern = std::nullopt) {
        return Verdict{false, reason.empty() ? std::string("rejected") : reason,
                       tier, std::move(pattern)};
    }

    // {"safe": b, "reason": s, "tier": 1 | 2 | "all" | null, "pattern": s}
    nlohmann::json to_json() const {
        nlohmann::json j = {{"safe", safe}, {"reason", reason}};
        switch (tier) {
            case VerdictTier::HEURISTIC: j["tier"] = 1;       break;
            case VerdictTier::SEMANTIC:  j["tier"] = 2;       break;
            case VerdictTier::ALL:       j["tier"] = "all";   break;
            case VerdictTier::NONE:      j["tier"] = nullptr; break;
        }
        if (matched_pattern) j["pattern"] = *matched_pattern;
        return j;
    }
};

} // namespace promptguard
