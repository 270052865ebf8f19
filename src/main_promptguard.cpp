// ---------------------------------------------------------------------------
// promptguard: line-oriented front end for the guardrail + generation path.
//
// Usage:
//   promptguard [options] [prompt words...]
//
// With prompt words: processes that one prompt and exits (0 on success).
// Without: reads one prompt per line from stdin until EOF or ":quit".
//
// Options:
//   --api-key <key>          backend credential (default: $GEMINI_API_KEY)
//   --chat-history <file>    JSON history; switches to chat mode
//   --model <name>           chat model (must be in the allow-list)
//   --check-only             print the guardrail verdict, skip generation
//
// Operator lines (interactive mode):
//   :status   breaker state + version
//   :reset    manual circuit breaker reset
//   :quit     exit
// ---------------------------------------------------------------------------
#include <curl/curl.h>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "config/Settings.hpp"
#include "guard/Normalizer.hpp"
#include "guard/HeuristicDetector.hpp"
#include "guard/JudgeClient.hpp"
#include "guard/GuardrailOrchestrator.hpp"
#include "upstream/CircuitBreaker.hpp"
#include "upstream/GeminiRestClient.hpp"
#include "upstream/ResilientBackend.hpp"
#include "service/PromptService.hpp"

using namespace promptguard;

static const char* const VERSION = "1.0.0";

struct CliOptions {
    std::string api_key;
    std::string history_path;
    std::string model;
    bool        chat{false};
    bool        check_only{false};
    std::string prompt;   // empty = interactive
};

static void usage(const char* argv0) {
    std::cerr << "Usage: " << argv0
              << " [--api-key KEY] [--chat-history FILE] [--model NAME] [--check-only]"
                 " [prompt...]\n";
}

static bool parse_args(int argc, char** argv, CliOptions& opt) {
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        auto next = [&](std::string& dst) {
            if (i + 1 >= argc) return false;
            dst = argv[++i];
            return true;
        };

        if (a == "--api-key") {
            if (!next(opt.api_key)) return false;
        } else if (a == "--chat-history") {
            if (!next(opt.history_path)) return false;
            opt.chat = true;
        } else if (a == "--model") {
            if (!next(opt.model)) return false;
            opt.chat = true;
        } else if (a == "--check-only") {
            opt.check_only = true;
        } else if (a == "-h" || a == "--help") {
            return false;
        } else {
            if (!opt.prompt.empty()) opt.prompt += " ";
            opt.prompt += a;
        }
    }
    return true;
}

static void print_status(CircuitBreaker& breaker) {
    CircuitBreaker::Snapshot s = breaker.snapshot();
    nlohmann::json j = {
        {"status",  s.state == BreakerState::CLOSED ? "healthy" : "degraded"},
        {"version", VERSION},
        {"breaker", {
            {"state",                to_string(s.state)},
            {"consecutive_failures", s.consecutive_failures},
            {"max_failures",         s.max_failures},
            {"last_failure",         s.last_failure}
        }}
    };
    std::cout << j.dump(2) << "\n";
}

int main(int argc, char** argv) {
    CliOptions opt;
    if (!parse_args(argc, argv, opt)) {
        usage(argv[0]);
        return 2;
    }

    // .env before anything reads the environment; ../.env covers build/ runs.
    load_dotenv(".env");
    load_dotenv("../.env");

    Settings settings;
    try {
        settings = Settings::from_env();
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n";
        return 2;
    }

    const std::string credential = opt.api_key.empty() ? settings.gemini_api_key : opt.api_key;
    if (credential.empty())
        std::cerr << "[PROMPTGUARD] WARNING: no api key: tier 2 disabled, generation will fail\n";

    std::vector<ConversationTurn> history;
    if (!opt.history_path.empty()) {
        std::ifstream f(opt.history_path);
        if (!f.is_open()) {
            std::cerr << "[PROMPTGUARD] cannot open history file " << opt.history_path << "\n";
            return 2;
        }
        nlohmann::json j = nlohmann::json::parse(f, nullptr, false);
        if (j.is_discarded()) {
            std::cerr << "[PROMPTGUARD] history file is not valid JSON\n";
            return 2;
        }
        try {
            history = parse_history(j);
        } catch (const std::invalid_argument& e) {
            std::cerr << e.what() << "\n";
            return 2;
        }
        std::cout << "[PROMPTGUARD] loaded " << history.size() << " history turns\n";
    }

    // Process-wide curl init, exactly once, before any request.
    curl_global_init(CURL_GLOBAL_ALL);

    int exit_code = 0;
    try {
        GeminiRestClient      gemini(settings.gemini_base_url, settings.judge_model,
                                     settings.generation_timeout);
        CircuitBreaker        breaker(settings.breaker_max_failures);
        ResilientBackend      backend(gemini, breaker, settings.backend_workers);

        Normalizer            normalizer;
        HeuristicDetector     heuristics;
        JudgeClient           judge(backend);
        GuardrailOrchestrator guardrail(normalizer, heuristics, judge);
        PromptService         service(settings, guardrail, backend);

        std::cout << "[PROMPTGUARD] v" << VERSION << " ready ("
                  << (opt.chat ? "chat" : "prompt") << " mode"
                  << (opt.check_only ? ", check-only" : "") << ")\n";

        auto handle = [&](const std::string& text) -> bool {
            if (opt.check_only) {
                Verdict v = service.check_only(text, credential);
                std::cout << v.to_json().dump(2) << "\n";
                return v.safe;
            }

            PromptResponse r;
            if (opt.chat) {
                r = service.process_chat(ChatRequest{text, credential, opt.model, history});
                if (r.success()) {
                    history.push_back({TurnRole::USER, text});
                    history.push_back({TurnRole::MODEL_REPLY, *r.response});
                }
            } else {
                r = service.process_prompt(PromptRequest{text, credential});
            }
            std::cout << "[PROMPTGUARD] status=" << r.http_status()
                      << " outcome=" << to_string(r.outcome) << "\n"
                      << r.to_json().dump(2) << "\n";
            return r.success();
        };

        if (!opt.prompt.empty()) {
            exit_code = handle(opt.prompt) ? 0 : 1;
        } else {
            std::string line;
            while (std::getline(std::cin, line)) {
                if (!line.empty() && line.back() == '\r') line.pop_back();
                if (line.empty()) continue;
                if (line == ":quit") break;
                if (line == ":status") { print_status(breaker); continue; }
                if (line == ":reset")  { breaker.reset(); print_status(breaker); continue; }
                handle(line);
            }
        }
    } catch (const std::exception& e) {
        // Construction rejects settings a component cannot honour.
        std::cerr << "[PROMPTGUARD] fatal: " << e.what() << "\n";
        exit_code = 2;
    }

    curl_global_cleanup();
    return exit_code;
}
