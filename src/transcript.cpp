#include "transcript.hpp"
#include "utils.hpp"
#include <fstream>

namespace rekal {

ContentBlock ContentBlock::from_json(const nlohmann::json& j) {
    ContentBlock b;
    if (!j.is_object()) return b;

    auto type = j.find("type");
    if (type == j.end() || !type->is_string()) return b;

    if (*type == "text") {
        b.kind = Kind::text;
        auto text = j.find("text");
        if (text != j.end() && text->is_string()) b.text = text->get<std::string>();
    } else if (*type == "tool_use") {
        b.kind = Kind::tool_use;
        auto name = j.find("name");
        if (name != j.end() && name->is_string()) b.tool_name = name->get<std::string>();
        auto input = j.find("input");
        if (input != j.end()) b.tool_input = *input;
    }
    return b;
}

TranscriptEntry TranscriptEntry::from_json(const nlohmann::json& j) {
    TranscriptEntry e;
    if (!j.is_object()) return e;

    auto type = j.find("type");
    if (type != j.end() && type->is_string()) e.role = type->get<std::string>();

    auto msg = j.find("message");
    if (msg == j.end() || !msg->is_object()) return e;

    auto content = msg->find("content");
    if (content == msg->end()) return e;

    if (content->is_string()) {
        e.content = content->get<std::string>();
    } else if (content->is_array()) {
        std::vector<ContentBlock> blocks;
        for (auto& item : *content) {
            blocks.push_back(ContentBlock::from_json(item));
        }
        e.content = std::move(blocks);
    }
    return e;
}

std::string flatten_text(const MessageContent& content) {
    if (auto* text = std::get_if<std::string>(&content)) {
        return *text;
    }
    std::vector<std::string> parts;
    for (auto& block : std::get<std::vector<ContentBlock>>(content)) {
        if (block.kind == ContentBlock::Kind::text) parts.push_back(block.text);
    }
    return join(parts, " ");
}

bool is_user_turn(const TranscriptEntry& entry) {
    return entry.role == "user" && !trim(flatten_text(entry.content)).empty();
}

std::vector<TranscriptEntry> load_transcript(const std::string& path) {
    std::vector<TranscriptEntry> entries;
    std::ifstream f(path);
    if (!f) return entries;

    std::string line;
    while (std::getline(f, line)) {
        if (trim(line).empty()) continue;
        try {
            auto j = nlohmann::json::parse(line);
            if (!j.is_object()) continue;
            entries.push_back(TranscriptEntry::from_json(j));
        } catch (const nlohmann::json::exception&) {
            continue;
        }
    }
    return entries;
}

// Appends assistant text to responses and mutating tool calls to edits.
static void collect_assistant(const TranscriptEntry& entry, const ToolFilter& filter,
                              std::vector<std::string>& responses,
                              std::vector<std::string>& edits) {
    if (auto* text = std::get_if<std::string>(&entry.content)) {
        if (!text->empty()) responses.push_back(*text);
        return;
    }
    for (auto& block : std::get<std::vector<ContentBlock>>(entry.content)) {
        if (block.kind == ContentBlock::Kind::text) {
            if (!block.text.empty()) responses.push_back(block.text);
        } else if (block.kind == ContentBlock::Kind::tool_use) {
            if (filter.skip.count(block.tool_name)) continue;
            if (!filter.mutating.count(block.tool_name)) continue;
            if (!block.tool_input.is_object()) continue;
            auto path = block.tool_input.find("file_path");
            if (path == block.tool_input.end() || !path->is_string()) continue;
            auto p = path->get<std::string>();
            if (!p.empty()) edits.push_back("[" + block.tool_name + ": " + p + "]");
        }
    }
}

TranscriptDigest parse_transcript(const std::vector<TranscriptEntry>& entries,
                                  const ToolFilter& filter) {
    std::vector<std::string> prompts, responses, edits;
    TranscriptDigest out;

    for (auto& entry : entries) {
        if (entry.role == "user") {
            if (!is_user_turn(entry)) continue;
            prompts.push_back(flatten_text(entry.content));
            out.turn_count++;
        } else if (entry.role == "assistant") {
            collect_assistant(entry, filter, responses, edits);
        }
    }

    out.prompts = join(prompts, "\n\n");
    out.responses = join(responses, "\n\n");
    out.edits = join(edits, "\n");
    return out;
}

TranscriptDigest parse_transcript(const std::string& path, const ToolFilter& filter) {
    return parse_transcript(load_transcript(path), filter);
}

LatestTurn extract_latest_turn(const std::vector<TranscriptEntry>& entries,
                               const ToolFilter& filter) {
    LatestTurn out;

    // turn_number is the ordinal of the anchor among all user turns
    int user_turns = 0;
    size_t anchor = entries.size();
    for (size_t i = 0; i < entries.size(); i++) {
        if (is_user_turn(entries[i])) {
            user_turns++;
            anchor = i;
        }
    }
    if (anchor == entries.size()) return out;

    out.prompt = flatten_text(entries[anchor].content);
    out.turn_number = user_turns;

    std::vector<std::string> responses, edits;
    for (size_t i = anchor + 1; i < entries.size(); i++) {
        if (entries[i].role == "assistant") {
            collect_assistant(entries[i], filter, responses, edits);
        }
    }
    out.response = join(responses, "\n\n");
    out.edits = join(edits, "\n");
    return out;
}

LatestTurn extract_latest_turn(const std::string& path, const ToolFilter& filter) {
    return extract_latest_turn(load_transcript(path), filter);
}

} // namespace rekal
