#pragma once
#include <string>
#include <chrono>
#include <cstddef>

namespace promptguard {

// ---------------------------------------------------------------------------
// Process configuration, read once at startup from the environment.
// Call load_dotenv() first to pull a .env file into the environment; values
// already present in the real environment win.
//
// Invalid values throw std::invalid_argument naming the variable.
// ---------------------------------------------------------------------------
struct Settings {
    std::string gemini_api_key;     // empty = not configured
    std::string gemini_base_url{"https://generativelanguage.googleapis.com/v1beta"};

    std::chrono::milliseconds guardrail_timeout{2000};
    std::chrono::milliseconds generation_timeout{30000};

    std::size_t max_prompt_length{10000};

    std::string judge_model{"gemini-flash-latest"};
    std::string generation_model{"gemini-flash-latest"};
    std::string default_chat_model{"gemini-2.0-flash"};

    int         breaker_max_failures{3};
    std::size_t backend_workers{4};

    std::string environment{"development"};

    static Settings from_env();
};

// Reads KEY=VALUE lines into the environment without overriding existing
// variables. Returns false when the file cannot be opened.
bool load_dotenv(const std::string& path);

} // namespace promptguard
