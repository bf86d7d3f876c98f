#pragma once
#include <string>
#include <vector>
#include <variant>
#include <set>
#include <nlohmann/json.hpp>

namespace rekal {

struct ContentBlock {
    enum class Kind { text, tool_use, other };

    Kind kind = Kind::other;
    std::string text;         // Kind::text
    std::string tool_name;    // Kind::tool_use
    nlohmann::json tool_input;

    static ContentBlock from_json(const nlohmann::json& j);
};

// Message payload: plain text or a list of typed blocks.
using MessageContent = std::variant<std::string, std::vector<ContentBlock>>;

struct TranscriptEntry {
    std::string role;         // "user", "assistant", or anything else
    MessageContent content;

    // Reads {"type": ..., "message": {"content": ...}}. Unexpected shapes
    // degrade to empty plain text.
    static TranscriptEntry from_json(const nlohmann::json& j);
};

struct ToolFilter {
    std::set<std::string> skip = {"Read", "Grep", "Glob", "WebFetch", "WebSearch"};
    std::set<std::string> mutating = {"Write", "Edit", "MultiEdit"};
};

struct TranscriptDigest {
    std::string prompts;
    std::string responses;
    std::string edits;
    int turn_count = 0;
};

struct LatestTurn {
    std::string prompt;
    std::string response;
    std::string edits;
    int turn_number = 0;
};

// Joins every text block with a single space; plain text is returned as is.
std::string flatten_text(const MessageContent& content);

// A user entry with non-blank text. Tool-result echoes do not qualify.
bool is_user_turn(const TranscriptEntry& entry);

// Missing or unreadable files yield no entries. Bad lines are skipped.
std::vector<TranscriptEntry> load_transcript(const std::string& path);

TranscriptDigest parse_transcript(const std::vector<TranscriptEntry>& entries,
                                  const ToolFilter& filter = {});
TranscriptDigest parse_transcript(const std::string& path,
                                  const ToolFilter& filter = {});

LatestTurn extract_latest_turn(const std::vector<TranscriptEntry>& entries,
                               const ToolFilter& filter = {});
LatestTurn extract_latest_turn(const std::string& path,
                               const ToolFilter& filter = {});

} // namespace rekal
