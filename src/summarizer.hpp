#pragma once
#include <string>
#include <vector>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include "config.hpp"
#include "session_store.hpp"

namespace rekal {

class Logger;

class SummarizerError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct TurnSummary {
    std::string title;
    std::string description;
    std::string tags;         // comma-joined
};

struct SessionRecap {
    std::string title;
    std::string summary;
};

// Turns a system prompt plus user input into a JSON object.
// Implementations throw SummarizerError on any failure.
class Summarizer {
public:
    virtual ~Summarizer() = default;
    virtual nlohmann::json complete(const std::string& system, const std::string& user) = 0;
};

// Runs the local `claude` or `codex` CLI, bounded by config.timeout.
class CliSummarizer : public Summarizer {
public:
    explicit CliSummarizer(const Config& config) : config_(config) {}

    nlohmann::json complete(const std::string& system, const std::string& user) override;

    std::string build_command(const std::string& system, const std::string& user) const;

private:
    Config config_;
};

std::string shell_quote(const std::string& s);

// Parses a model reply as a JSON object, tolerating a ```json fence.
nlohmann::json parse_model_json(const std::string& text);

// Unwraps `claude --output-format json` ({"result": "..."}).
nlohmann::json parse_claude_output(const std::string& out);

// Picks the last assistant text from `codex exec --json` JSONL events,
// falling back to the whole output.
nlohmann::json parse_codex_output(const std::string& out);

// The three calls below never throw; failures yield deterministic fallbacks.
TurnSummary summarize_turn(Summarizer& summarizer, const std::string& prompt,
                           const std::string& response, const std::string& edits,
                           const Config& config, Logger& log);

SessionRecap summarize_session(Summarizer& summarizer, const std::vector<TurnRecord>& turns,
                               Logger& log);

std::string generate_title(Summarizer& summarizer, const std::string& opening_prompt,
                           Logger& log);

TurnSummary fallback_turn_summary(const std::string& prompt);
SessionRecap fallback_session_recap(const std::vector<TurnRecord>& turns);

} // namespace rekal
