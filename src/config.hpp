#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "utils.hpp"

namespace rekal {

struct Config {
    std::string provider = "claude";   // summarizer CLI: "claude" or "codex"
    std::string model = "haiku";
    std::string db_path = "~/.rekal/db.sqlite";
    std::string log_path = "~/.rekal/rekal.log";
    bool enabled = true;
    int timeout = 30;                  // summarizer call timeout, seconds
    int max_prompt_chars = 4000;
    int max_response_chars = 8000;
    int max_edit_chars = 2000;

    std::string db_path_resolved() const { return expand_path(db_path); }
    std::string log_path_resolved() const { return expand_path(log_path); }

    static Config load(const std::string& path);
    void save(const std::string& path) const;
    nlohmann::json to_json() const;
    // Only known keys are read; unknown keys and values of the wrong type
    // are ignored.
    static Config from_json(const nlohmann::json& j);
};

} // namespace rekal
