#include "summarizer.hpp"
#include "logger.hpp"
#include "utils.hpp"
#include <cstdio>
#include <sstream>
#include <sys/wait.h>

namespace rekal {

static const char* kTurnSummaryPrompt = R"(Index one coding turn so it can be found by a later search.

Reply with ONLY this JSON object, no markdown and no commentary:
{"title": "...", "description": "...", "tags": ["..."]}

title: the outcome as a headline of at most 80 characters. Be concrete.
  good: "Fix null pointer in JWT refresh flow"
  good: "Add FTS5 index to turns table"
  bad:  "Update code", "Work on auth improvements"

description: 2 to 5 bullet points naming files, functions, errors or decisions
that would tell a future reader whether this turn is relevant.

tags: 5 to 10 search terms covering
  domain (auth, payments, rendering, deployment)
  action (debug, implement, refactor, configure, test)
  stack  (react, golang, postgres, redis, docker)
  detail (jwt-refresh, rate-limiter, fts5-index)
  Leave out generic words such as code, fix, update, change, work, file.)";

static const char* kSessionRecapPrompt = R"(Summarize a finished coding session so it can be recalled later.

Reply with ONLY this JSON object, no markdown and no commentary:
{"session_title": "...", "session_summary": "..."}

session_title: the overall goal or theme, at most 80 characters.
session_summary: 2 to 4 sentences on outcomes, key decisions and open issues.
Describe what was achieved rather than retelling each turn.)";

static const char* kQuickTitlePrompt = R"(Write a short title (at most 60 characters) for the intent of this coding session.

Reply with ONLY this JSON object: {"title": "..."})";

std::string shell_quote(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    out += "'";
    return out;
}

nlohmann::json parse_model_json(const std::string& text) {
    std::string body = trim(text);
    if (body.rfind("```", 0) == 0) {
        auto nl = body.find('\n');
        auto close = body.rfind("```");
        if (nl != std::string::npos && close != std::string::npos && close > nl) {
            body = trim(body.substr(nl + 1, close - nl - 1));
        }
    }
    try {
        auto j = nlohmann::json::parse(body);
        if (!j.is_object()) throw SummarizerError("model reply is not a JSON object");
        return j;
    } catch (const nlohmann::json::exception& e) {
        throw SummarizerError(std::string("malformed model reply: ") + e.what());
    }
}

nlohmann::json parse_claude_output(const std::string& out) {
    nlohmann::json wrapper;
    try {
        wrapper = nlohmann::json::parse(out);
    } catch (const nlohmann::json::exception& e) {
        throw SummarizerError(std::string("malformed claude output: ") + e.what());
    }
    if (wrapper.is_object() && wrapper.contains("result")) {
        auto& result = wrapper["result"];
        if (result.is_string()) return parse_model_json(result.get<std::string>());
        if (result.is_object()) return result;
    }
    if (wrapper.is_object()) return wrapper;
    throw SummarizerError("unexpected claude output");
}

nlohmann::json parse_codex_output(const std::string& out) {
    std::string last_text;
    std::istringstream in(out);
    std::string line;
    while (std::getline(in, line)) {
        if (trim(line).empty()) continue;
        try {
            auto ev = nlohmann::json::parse(line);
            if (!ev.is_object()) continue;
            if (ev.value("type", "") != "message" || ev.value("role", "") != "assistant") continue;
            auto content = ev.find("content");
            if (content == ev.end()) continue;
            if (content->is_string()) {
                last_text = content->get<std::string>();
            } else if (content->is_array()) {
                for (auto& block : *content) {
                    if (block.is_object() && block.value("type", "") == "text" &&
                        block.contains("text") && block["text"].is_string()) {
                        last_text = block["text"].get<std::string>();
                    }
                }
            }
        } catch (const nlohmann::json::exception&) {
            continue;
        }
    }
    if (last_text.empty()) last_text = out;
    return parse_model_json(last_text);
}

std::string CliSummarizer::build_command(const std::string& system, const std::string& user) const {
    std::string cmd = "timeout " + std::to_string(config_.timeout) + " ";
    if (config_.provider == "codex") {
        cmd += "codex exec --model " + shell_quote(config_.model) + " --json " +
               shell_quote(system + "\n\n" + user);
    } else {
        cmd += "claude -p --model " + shell_quote(config_.model) +
               " --tools '' --output-format json --no-session-persistence"
               " --system-prompt " + shell_quote(system) + " " + shell_quote(user);
    }
    cmd += " 2>/dev/null";
    return cmd;
}

nlohmann::json CliSummarizer::complete(const std::string& system, const std::string& user) {
    std::string cmd = build_command(system, user);

    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) throw SummarizerError("failed to start " + config_.provider + " CLI");

    std::string output;
    char buffer[4096];
    while (size_t n = std::fread(buffer, 1, sizeof(buffer), pipe)) {
        output.append(buffer, n);
    }
    int status = pclose(pipe);
    if (status == -1) throw SummarizerError("failed to wait for " + config_.provider + " CLI");

    if (WIFEXITED(status)) status = WEXITSTATUS(status);
    if (status == 124) {
        throw SummarizerError(config_.provider + " CLI timed out after " +
                              std::to_string(config_.timeout) + "s");
    }
    if (status != 0) {
        throw SummarizerError(config_.provider + " CLI failed (exit " + std::to_string(status) + ")");
    }

    if (config_.provider == "codex") return parse_codex_output(output);
    return parse_claude_output(output);
}

// ── Summaries with fallbacks ───────────────────────────────────────

static std::string string_or_join(const nlohmann::json& j, const std::string& sep) {
    if (j.is_string()) return j.get<std::string>();
    if (!j.is_array()) return "";
    std::vector<std::string> parts;
    for (auto& item : j) {
        if (item.is_string()) parts.push_back(item.get<std::string>());
        else if (!item.is_null()) parts.push_back(item.dump());
    }
    return join(parts, sep);
}

static std::string string_field(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return "";
    return it->get<std::string>();
}

TurnSummary fallback_turn_summary(const std::string& prompt) {
    TurnSummary s;
    s.title = prompt.empty() ? "Untitled turn" : truncate_utf8(prompt, 60);
    s.description = "- Summarization failed";
    return s;
}

SessionRecap fallback_session_recap(const std::vector<TurnRecord>& turns) {
    SessionRecap r;
    if (turns.empty()) {
        r.title = "Untitled";
    } else {
        r.title = turns.front().title.empty() ? "Untitled session" : turns.front().title;
    }
    r.summary = "Session with " + std::to_string(turns.size()) + " turns.";
    return r;
}

TurnSummary summarize_turn(Summarizer& summarizer, const std::string& prompt,
                           const std::string& response, const std::string& edits,
                           const Config& config, Logger& log) {
    std::string files = trim(edits).empty()
        ? "(none)" : truncate_utf8(edits, static_cast<size_t>(config.max_edit_chars));
    std::string input =
        "USER ASKED:\n" + truncate_utf8(prompt, static_cast<size_t>(config.max_prompt_chars)) +
        "\n\nAGENT OUTPUT:\n" + truncate_utf8(response, static_cast<size_t>(config.max_response_chars)) +
        "\n\nFILES CHANGED:\n" + files;

    nlohmann::json reply;
    try {
        reply = summarizer.complete(kTurnSummaryPrompt, input);
    } catch (const std::exception& e) {
        log.error("summarizer", std::string("turn summarization failed: ") + e.what());
        return fallback_turn_summary(prompt);
    }

    TurnSummary s;
    s.title = string_field(reply, "title");
    if (s.title.empty()) s.title = fallback_turn_summary(prompt).title;
    if (reply.contains("description")) s.description = string_or_join(reply["description"], "\n");
    if (reply.contains("tags")) s.tags = string_or_join(reply["tags"], ", ");
    return s;
}

SessionRecap summarize_session(Summarizer& summarizer, const std::vector<TurnRecord>& turns,
                               Logger& log) {
    std::string turns_text;
    for (size_t i = 0; i < turns.size(); i++) {
        if (i) turns_text += "\n\n";
        turns_text += "Turn " + std::to_string(i + 1) + ": " +
                      (turns[i].title.empty() ? "Untitled" : turns[i].title) + "\n" +
                      turns[i].description;
    }

    nlohmann::json reply;
    try {
        reply = summarizer.complete(kSessionRecapPrompt, "SESSION TURNS:\n\n" + turns_text);
    } catch (const std::exception& e) {
        log.error("summarizer", std::string("session recap failed: ") + e.what());
        return fallback_session_recap(turns);
    }

    SessionRecap r;
    r.title = string_field(reply, "session_title");
    r.summary = string_field(reply, "session_summary");
    if (r.title.empty()) r.title = fallback_session_recap(turns).title;
    return r;
}

std::string generate_title(Summarizer& summarizer, const std::string& opening_prompt,
                           Logger& log) {
    std::string fallback = truncate_utf8(opening_prompt, 60);
    try {
        auto reply = summarizer.complete(kQuickTitlePrompt, truncate_utf8(opening_prompt, 500));
        std::string title = string_field(reply, "title");
        return title.empty() ? fallback : title;
    } catch (const std::exception& e) {
        log.error("summarizer", std::string("title generation failed: ") + e.what());
        return fallback;
    }
}

} // namespace rekal
