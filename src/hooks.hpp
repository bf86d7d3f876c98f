#pragma once
#include <string>
#include <optional>
#include <nlohmann/json.hpp>
#include "config.hpp"

namespace rekal {

class Logger;
class Summarizer;

enum class HookType {
    stop,          // assistant turn complete: store the latest turn
    prompt,        // prompt submitted: early session title
    session_end,   // session closed: session recap
    codex,         // codex notify: agent-turn-complete
};

enum class HookOutcome {
    stored,
    skipped,
};

struct HookContext {
    const Config& config;
    Summarizer& summarizer;
    Logger& log;
};

std::optional<HookType> parse_hook_type(const std::string& s);
const char* hook_name(HookType type);

// Each hook takes the JSON object the host tool sends on stdin. Missing
// fields and disabled configs skip quietly; store errors propagate.
HookOutcome on_turn_complete(const nlohmann::json& input, const HookContext& ctx);
HookOutcome on_prompt(const nlohmann::json& input, const HookContext& ctx);
HookOutcome on_session_end(const nlohmann::json& input, const HookContext& ctx);
HookOutcome on_codex_turn(const nlohmann::json& input, const HookContext& ctx);

HookOutcome run_hook(HookType type, const nlohmann::json& input, const HookContext& ctx);

} // namespace rekal
