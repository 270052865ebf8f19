#pragma once
#include <string>
#include <vector>
#include <regex>

#include "guard/Verdict.hpp"

namespace promptguard {

enum class RuleTarget { RAW_TEXT, NORMALIZED_TEXT };

struct PatternRule {
    std::string name;
    std::regex  matcher;
    RuleTarget  applies_to;
    // Cheap substring gate: when set and absent from the target, the regex
    // is skipped.
    std::string required_literal;
};

// ---------------------------------------------------------------------------
// Tier 1: literal pattern table, evaluated in-process with no I/O.
//
// PII rules look at the raw text (folding would mangle digits and '@');
// adversarial-intent rules look at the normalized text so obfuscated phrasing
// still matches. All RAW_TEXT rules run before any NORMALIZED_TEXT rule;
// first match wins.
//
// The rule table is fixed at construction and only read afterwards, so one
// detector is shared by all concurrent checks without locking.
// ---------------------------------------------------------------------------
class HeuristicDetector {
public:
    static constexpr long LATENCY_BUDGET_US = 50000;

    HeuristicDetector();
    explicit HeuristicDetector(std::vector<PatternRule> rules);

    Verdict evaluate(const std::string& raw_text,
                     const std::string& normalized_text) const;

    const std::vector<PatternRule>& rules() const { return rules_; }

    static std::vector<PatternRule> default_rules();

private:
    const PatternRule* first_match(RuleTarget target, const std::string& text) const;

    const std::vector<PatternRule> rules_;
};

} // namespace promptguard
