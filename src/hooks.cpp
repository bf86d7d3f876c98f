#include "hooks.hpp"
#include "logger.hpp"
#include "session_store.hpp"
#include "summarizer.hpp"
#include "transcript.hpp"
#include "utils.hpp"

namespace rekal {

std::optional<HookType> parse_hook_type(const std::string& s) {
    if (s == "stop")        return HookType::stop;
    if (s == "prompt")      return HookType::prompt;
    if (s == "session-end") return HookType::session_end;
    if (s == "codex")       return HookType::codex;
    return std::nullopt;
}

const char* hook_name(HookType type) {
    switch (type) {
        case HookType::stop:        return "stop";
        case HookType::prompt:      return "prompt";
        case HookType::session_end: return "session-end";
        case HookType::codex:       return "codex";
    }
    return "unknown";
}

static std::string str_field(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return "";
    return it->get<std::string>();
}

static std::string short_id(const std::string& id) {
    return id.substr(0, 8);
}

// Text of a codex message content: a string, or the text blocks joined.
static std::string codex_text(const nlohmann::json& content) {
    if (content.is_string()) return content.get<std::string>();
    if (!content.is_array()) return "";
    std::vector<std::string> parts;
    for (auto& block : content) {
        if (block.is_object() && str_field(block, "type") == "text") {
            parts.push_back(str_field(block, "text"));
        }
    }
    return join(parts, " ");
}

HookOutcome on_turn_complete(const nlohmann::json& input, const HookContext& ctx) {
    if (!ctx.config.enabled) return HookOutcome::skipped;

    std::string session_id = str_field(input, "session_id");
    std::string transcript_path = str_field(input, "transcript_path");
    std::string cwd = str_field(input, "cwd");
    if (session_id.empty() || transcript_path.empty()) {
        ctx.log.warn("hook:stop", "Missing session_id or transcript_path in hook input");
        return HookOutcome::skipped;
    }

    // A stop triggered by another stop hook would loop
    auto active = input.find("stop_hook_active");
    if (active != input.end() && active->is_boolean() && active->get<bool>()) {
        return HookOutcome::skipped;
    }

    LatestTurn turn = extract_latest_turn(transcript_path);
    if (turn.prompt.empty()) {
        ctx.log.info("hook:stop", "No user prompt found in latest turn, skipping");
        return HookOutcome::skipped;
    }

    TurnSummary summary = summarize_turn(ctx.summarizer, turn.prompt, turn.response,
                                         turn.edits, ctx.config, ctx.log);

    SessionStore store(ctx.config.db_path_resolved(), ctx.log);
    store.ensure_session(session_id, "claude", cwd);
    store.store_turn(session_id, turn.turn_number,
                     truncate_utf8(turn.prompt, static_cast<size_t>(ctx.config.max_prompt_chars)),
                     truncate_utf8(turn.response, static_cast<size_t>(ctx.config.max_response_chars)),
                     summary.title, summary.description, summary.tags, ctx.config.model);
    ctx.log.info("hook:stop", "Stored turn " + std::to_string(turn.turn_number) +
                 " for session " + short_id(session_id) + ": " + summary.title);
    return HookOutcome::stored;
}

HookOutcome on_prompt(const nlohmann::json& input, const HookContext& ctx) {
    if (!ctx.config.enabled) return HookOutcome::skipped;

    std::string session_id = str_field(input, "session_id");
    std::string prompt = str_field(input, "prompt");
    std::string cwd = str_field(input, "cwd");
    if (session_id.empty() || prompt.empty()) return HookOutcome::skipped;

    {
        SessionStore store(ctx.config.db_path_resolved(), ctx.log);
        auto existing = store.get_session(session_id);
        if (existing && !existing->title.empty()) return HookOutcome::skipped;
        store.ensure_session(session_id, "claude", cwd);
    }

    // The store is closed while the summarizer runs
    std::string title = generate_title(ctx.summarizer, prompt, ctx.log);

    SessionStore store(ctx.config.db_path_resolved(), ctx.log);
    store.set_session_title(session_id, title);
    ctx.log.info("hook:prompt", "Early title for " + short_id(session_id) + ": " + title);
    return HookOutcome::stored;
}

HookOutcome on_session_end(const nlohmann::json& input, const HookContext& ctx) {
    if (!ctx.config.enabled) return HookOutcome::skipped;

    std::string session_id = str_field(input, "session_id");
    if (session_id.empty()) {
        ctx.log.warn("hook:session-end", "Missing session_id in hook input");
        return HookOutcome::skipped;
    }

    std::vector<TurnRecord> turns;
    {
        SessionStore store(ctx.config.db_path_resolved(), ctx.log);
        turns = store.get_session_turns(session_id);
    }
    if (turns.empty()) {
        ctx.log.info("hook:session-end", "No turns found for session " +
                     short_id(session_id) + ", skipping summary");
        return HookOutcome::skipped;
    }

    SessionRecap recap = summarize_session(ctx.summarizer, turns, ctx.log);

    SessionStore store(ctx.config.db_path_resolved(), ctx.log);
    store.update_session_summary(session_id, recap.title, recap.summary);
    ctx.log.info("hook:session-end", "Session summary for " + short_id(session_id) + ": " + recap.title);
    return HookOutcome::stored;
}

HookOutcome on_codex_turn(const nlohmann::json& input, const HookContext& ctx) {
    if (!ctx.config.enabled) return HookOutcome::skipped;
    if (str_field(input, "type") != "agent-turn-complete") return HookOutcome::skipped;

    std::string thread_id = str_field(input, "thread-id");
    std::string cwd = str_field(input, "cwd");
    if (thread_id.empty()) {
        ctx.log.warn("hook:codex", "Missing thread-id in Codex hook input");
        return HookOutcome::skipped;
    }

    std::string user_message;
    auto messages = input.find("input-messages");
    if (messages != input.end() && messages->is_array()) {
        for (auto it = messages->rbegin(); it != messages->rend(); ++it) {
            if (it->is_object() && str_field(*it, "role") == "user") {
                auto content = it->find("content");
                if (content != it->end()) user_message = codex_text(*content);
                break;
            }
        }
    }

    std::string reply;
    auto last = input.find("last-assistant-message");
    if (last != input.end()) {
        if (last->is_string()) {
            reply = last->get<std::string>();
        } else if (last->is_object()) {
            auto content = last->find("content");
            if (content != last->end()) reply = codex_text(*content);
        }
    }

    if (user_message.empty() && reply.empty()) return HookOutcome::skipped;

    TurnSummary summary = summarize_turn(ctx.summarizer, user_message, reply, "",
                                         ctx.config, ctx.log);

    std::string session_id = "codex-" + thread_id;
    SessionStore store(ctx.config.db_path_resolved(), ctx.log);
    store.ensure_session(session_id, "codex", cwd);
    // Codex events carry no transcript, so number from what is stored
    int turn_number = store.max_turn_number(session_id) + 1;
    store.store_turn(session_id, turn_number,
                     truncate_utf8(user_message, static_cast<size_t>(ctx.config.max_prompt_chars)),
                     truncate_utf8(reply, static_cast<size_t>(ctx.config.max_response_chars)),
                     summary.title, summary.description, summary.tags, ctx.config.model);
    ctx.log.info("hook:codex", "Codex turn " + std::to_string(turn_number) + " for thread " +
                 short_id(thread_id) + ": " + summary.title);
    return HookOutcome::stored;
}

HookOutcome run_hook(HookType type, const nlohmann::json& input, const HookContext& ctx) {
    if (!input.is_object()) {
        ctx.log.error(std::string("hook:") + hook_name(type), "Hook input is not a JSON object");
        return HookOutcome::skipped;
    }
    switch (type) {
        case HookType::stop:        return on_turn_complete(input, ctx);
        case HookType::prompt:      return on_prompt(input, ctx);
        case HookType::session_end: return on_session_end(input, ctx);
        case HookType::codex:       return on_codex_turn(input, ctx);
    }
    return HookOutcome::skipped;
}

} // namespace rekal
