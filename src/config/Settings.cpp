#include "config/Settings.hpp"
#include <cmath>
#include <cstdlib>
#include <limits>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace promptguard {

namespace {

const char* env(const char* key) {
    const char* v = std::getenv(key);
    return (v && *v) ? v : nullptr;
}

std::string env_string(const char* key, const std::string& fallback) {
    const char* v = env(key);
    return v ? std::string(v) : fallback;
}

double parse_positive(const char* key, const std::string& raw) {
    std::size_t used = 0;
    double value = 0.0;
    try {
        value = std::stod(raw, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument(std::string("[CONFIG] ") + key +
                                    " is not a number: '" + raw + "'");
    }
    if (used != raw.size() || !std::isfinite(value) || !(value > 0.0))
        throw std::invalid_argument(std::string("[CONFIG] ") + key +
                                    " must be a finite positive number, got '" + raw + "'");
    return value;
}

// Timeouts: at least 1ms, at most INT_MAX ms (about 24 days).
std::chrono::milliseconds env_seconds(const char* key, std::chrono::milliseconds fallback) {
    const char* v = env(key);
    if (!v) return fallback;
    const double ms = parse_positive(key, v) * 1000.0;
    if (ms < 1.0 || ms > static_cast<double>(std::numeric_limits<int>::max()))
        throw std::invalid_argument(std::string("[CONFIG] ") + key +
                                    " out of range: '" + v + "'");
    return std::chrono::milliseconds(static_cast<long long>(ms));
}

// Counts: whole numbers in [1, INT_MAX], so every target type holds them.
int env_count(const char* key, int fallback) {
    const char* v = env(key);
    if (!v) return fallback;
    const double n = parse_positive(key, v);
    if (n > static_cast<double>(std::numeric_limits<int>::max()))
        throw std::invalid_argument(std::string("[CONFIG] ") + key +
                                    " out of range: '" + v + "'");
    if (n != std::floor(n) || n < 1.0)
        throw std::invalid_argument(std::string("[CONFIG] ") + key +
                                    " must be a whole number, got '" + v + "'");
    return static_cast<int>(n);
}

std::string trim_spaces(const std::string& s) {
    std::size_t b = 0, e = s.size();
    while (b < e && (s[b] == ' ' || s[b] == '\t')) b++;
    while (e > b && (s[e - 1] == ' ' || s[e - 1] == '\t')) e--;
    return s.substr(b, e - b);
}

std::string unquote(const std::string& s) {
    if (s.size() < 2) return s;
    const char q = s.front();
    if ((q == '"' || q == '\'') && s.back() == q) return s.substr(1, s.size() - 2);
    return s;
}

} // namespace

Settings Settings::from_env() {
    Settings s;
    s.gemini_api_key       = env_string("GEMINI_API_KEY", "");
    s.gemini_base_url      = env_string("GEMINI_BASE_URL", s.gemini_base_url);
    s.guardrail_timeout    = env_seconds("GUARDRAIL_TIMEOUT_SECONDS", s.guardrail_timeout);
    s.generation_timeout   = env_seconds("GEMINI_TIMEOUT_SECONDS", s.generation_timeout);
    s.max_prompt_length    = static_cast<std::size_t>(
        env_count("MAX_PROMPT_LENGTH", static_cast<int>(s.max_prompt_length)));
    s.judge_model          = env_string("JUDGE_MODEL", s.judge_model);
    s.generation_model     = env_string("GENERATION_MODEL", s.generation_model);
    s.default_chat_model   = env_string("DEFAULT_CHAT_MODEL", s.default_chat_model);
    s.breaker_max_failures = env_count("BREAKER_MAX_FAILURES", s.breaker_max_failures);
    s.backend_workers      = static_cast<std::size_t>(
        env_count("BACKEND_WORKERS", static_cast<int>(s.backend_workers)));
    s.environment          = env_string("ENVIRONMENT", s.environment);

    std::cout << "[CONFIG] environment=" << s.environment
              << " guardrail_timeout=" << s.guardrail_timeout.count() << "ms"
              << " generation_timeout=" << s.generation_timeout.count() << "ms"
              << " max_prompt_length=" << s.max_prompt_length
              << " api_key=" << (s.gemini_api_key.empty() ? "unset" : "set") << "\n";
    return s;
}

// Applies KEY=VALUE lines from a dotenv file without overriding variables
// already present in the process environment.
bool load_dotenv(const std::string& path) {
    std::ifstream in(path);
    if (!in) return false;

    int entries = 0;
    for (std::string line; std::getline(in, line);) {
        const std::string entry = trim_spaces(
            (!line.empty() && line.back() == '\r') ? line.substr(0, line.size() - 1) : line);
        if (entry.empty() || entry[0] == '#') continue;

        const std::size_t eq = entry.find('=');
        if (eq == std::string::npos) continue;

        std::string name = trim_spaces(entry.substr(0, eq));
        static const std::string EXPORT_PREFIX = "export ";
        if (name.compare(0, EXPORT_PREFIX.size(), EXPORT_PREFIX) == 0)
            name = trim_spaces(name.substr(EXPORT_PREFIX.size()));
        if (name.empty()) continue;

        const std::string value = unquote(trim_spaces(entry.substr(eq + 1)));
        if (setenv(name.c_str(), value.c_str(), /*overwrite=*/0) != 0) {
            std::cerr << "[CONFIG] cannot set " << name << " from " << path << "\n";
            continue;
        }
        entries++;
    }

    std::cout << "[CONFIG] " << path << ": " << entries << " entries read\n";
    return true;
}

} // namespace promptguard
