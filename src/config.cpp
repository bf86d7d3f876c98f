#include "config.hpp"
#include <fstream>
#include <iostream>

namespace rekal {

nlohmann::json Config::to_json() const {
    nlohmann::json j;
    j["provider"] = provider;
    j["model"] = model;
    j["db_path"] = db_path;
    j["log_path"] = log_path;
    j["enabled"] = enabled;
    j["timeout"] = timeout;
    j["max_prompt_chars"] = max_prompt_chars;
    j["max_response_chars"] = max_response_chars;
    j["max_edit_chars"] = max_edit_chars;
    return j;
}

static void read_string(const nlohmann::json& j, const char* key, std::string& out) {
    auto it = j.find(key);
    if (it != j.end() && it->is_string()) out = it->get<std::string>();
}

static void read_int(const nlohmann::json& j, const char* key, int& out) {
    auto it = j.find(key);
    if (it != j.end() && it->is_number_integer()) out = it->get<int>();
}

static void read_bool(const nlohmann::json& j, const char* key, bool& out) {
    auto it = j.find(key);
    if (it != j.end() && it->is_boolean()) out = it->get<bool>();
}

Config Config::from_json(const nlohmann::json& j) {
    Config c;
    if (!j.is_object()) return c;

    read_string(j, "provider", c.provider);
    read_string(j, "model", c.model);
    read_string(j, "db_path", c.db_path);
    read_string(j, "log_path", c.log_path);
    read_bool(j, "enabled", c.enabled);
    read_int(j, "timeout", c.timeout);
    read_int(j, "max_prompt_chars", c.max_prompt_chars);
    read_int(j, "max_response_chars", c.max_response_chars);
    read_int(j, "max_edit_chars", c.max_edit_chars);

    const Config defaults;
    if (c.timeout < 1) c.timeout = defaults.timeout;
    if (c.max_prompt_chars < 0) c.max_prompt_chars = defaults.max_prompt_chars;
    if (c.max_response_chars < 0) c.max_response_chars = defaults.max_response_chars;
    if (c.max_edit_chars < 0) c.max_edit_chars = defaults.max_edit_chars;
    return c;
}

Config Config::load(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        return Config{};
    }
    try {
        nlohmann::json j = nlohmann::json::parse(f);
        if (!j.is_object()) {
            std::cerr << "[warn] Config at " << path << " is not an object, using defaults\n";
            return Config{};
        }
        return from_json(j);
    } catch (const std::exception& e) {
        std::cerr << "[warn] Failed to parse config: " << e.what() << ", using defaults\n";
        return Config{};
    }
}

void Config::save(const std::string& path) const {
    auto parent = fs::path(path).parent_path();
    if (!parent.empty()) fs::create_directories(parent);
    std::ofstream f(path);
    f << to_json().dump(2) << std::endl;
}

} // namespace rekal
