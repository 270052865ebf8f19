#include "guard/HeuristicDetector.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>

using namespace promptguard;

namespace {

PatternRule make_rule(const char* name, const char* pattern, RuleTarget target,
                      std::regex::flag_type extra = std::regex::flag_type{},
                      const char* literal = "") {
    return PatternRule{name,
                       std::regex(pattern, std::regex::ECMAScript | std::regex::optimize | extra),
                       target,
                       literal};
}

std::string reason_for(const std::string& rule_name) {
    std::string words = rule_name;
    std::replace(words.begin(), words.end(), '_', ' ');
    return "detected: " + words;
}

} // namespace

std::vector<PatternRule> HeuristicDetector::default_rules() {
    std::vector<PatternRule> rules;

    // ---- PII: raw text only ----
    // Every quantifier here is bounded: the regex engine recurses per
    // repeated character and raw text has no length cap at this layer.
    rules.push_back(make_rule("ssn_pattern",
                              R"(\b\d{3}-\d{2}-\d{4}\b)",
                              RuleTarget::RAW_TEXT));
    rules.push_back(make_rule("credit_card",
                              R"(\b\d{4}[\s-]?\d{4}[\s-]?\d{4}[\s-]?\d{4}\b)",
                              RuleTarget::RAW_TEXT));
    rules.push_back(make_rule("email_pattern",
                              R"(\b[A-Za-z0-9._%+-]{1,64}@[A-Za-z0-9.-]{1,253}\.[A-Za-z]{2,63}\b)",
                              RuleTarget::RAW_TEXT, std::regex::flag_type{}, "@"));

    // ---- Adversarial intent: normalized text ----
    rules.push_back(make_rule("ignore_instructions",
                              R"(ignore\s+.{0,30}?(previous|all|above|prior).{0,30}?instructions?)",
                              RuleTarget::NORMALIZED_TEXT, std::regex::icase, "ignore"));
    rules.push_back(make_rule("roleplay_jailbreak",
                              R"((you\s+are\s+now|act\s+as|pretend\s+to\s+be).{0,50}(dan|jailbreak|evil))",
                              RuleTarget::NORMALIZED_TEXT, std::regex::icase));
    rules.push_back(make_rule("system_prompt_reveal",
                              R"((system\s+prompt|reveal\s+your\s+instructions?|show\s+me\s+your\s+(prompt|instructions?)))",
                              RuleTarget::NORMALIZED_TEXT, std::regex::icase));

    return rules;
}

HeuristicDetector::HeuristicDetector()
    : rules_(default_rules()) {}

HeuristicDetector::HeuristicDetector(std::vector<PatternRule> rules)
    : rules_(std::move(rules)) {}

const PatternRule* HeuristicDetector::first_match(RuleTarget target,
                                                  const std::string& text) const {
    for (const auto& rule : rules_) {
        if (rule.applies_to != target) continue;
        if (!rule.required_literal.empty() &&
            text.find(rule.required_literal) == std::string::npos) continue;
        if (std::regex_search(text, rule.matcher)) return &rule;
    }
    return nullptr;
}

Verdict HeuristicDetector::evaluate(const std::string& raw_text,
                                    const std::string& normalized_text) const {
    const auto start = std::chrono::steady_clock::now();

    const PatternRule* hit = first_match(RuleTarget::RAW_TEXT, raw_text);
    if (!hit) hit = first_match(RuleTarget::NORMALIZED_TEXT, normalized_text);

    const long elapsed_us = static_cast<long>(
        std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - start).count());
    if (elapsed_us > LATENCY_BUDGET_US) {
        std::cerr << "[TIER1] WARNING: evaluation took " << elapsed_us / 1000
                  << "ms (budget " << LATENCY_BUDGET_US / 1000 << "ms)\n";
    }

    if (hit) {
        std::cout << "[TIER1] match: " << hit->name << " (" << elapsed_us << "us)\n";
        return Verdict::reject(VerdictTier::HEURISTIC, reason_for(hit->name), hit->name);
    }

    std::cout << "[TIER1] passed (" << elapsed_us << "us)\n";
    return Verdict::pass(VerdictTier::HEURISTIC, "tier 1 checks passed");
}
