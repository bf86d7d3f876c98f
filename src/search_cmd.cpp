#include "search_cmd.hpp"
#include "config.hpp"
#include "format.hpp"
#include "hooks.hpp"
#include "logger.hpp"
#include "session_store.hpp"
#include "summarizer.hpp"
#include "utils.hpp"
#include <iostream>

namespace rekal {

static bool parse_int(const std::string& s, int& out) {
    try {
        size_t pos = 0;
        int v = std::stoi(s, &pos);
        if (pos != s.size()) return false;
        out = v;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

int cmd_search(const std::vector<std::string>& args) {
    std::vector<std::string> words;
    std::string workspace;
    int limit = 15;

    for (size_t i = 0; i < args.size(); i++) {
        if (args[i] == "--workspace" && i + 1 < args.size()) {
            workspace = args[++i];
        } else if (args[i] == "--limit" && i + 1 < args.size()) {
            if (!parse_int(args[++i], limit) || limit < 1) {
                std::cerr << "Invalid --limit: " << args[i] << "\n";
                return 1;
            }
        } else {
            words.push_back(args[i]);
        }
    }

    if (words.empty()) {
        std::cerr << "Usage: rekal search <query...> [--workspace W] [--limit N]\n";
        return 1;
    }

    Config cfg = Config::load(default_config_path());
    Logger log(std::cerr, Logger::Level::warn);
    SessionStore store(cfg.db_path_resolved(), log);
    std::cout << format_search_results(store.search(join(words, " "), workspace, limit)) << "\n";
    return 0;
}

int cmd_recent(const std::vector<std::string>& args) {
    std::string workspace;
    int limit = 10;

    for (size_t i = 0; i < args.size(); i++) {
        if (args[i] == "--workspace" && i + 1 < args.size()) {
            workspace = args[++i];
        } else if (!parse_int(args[i], limit) || limit < 1) {
            std::cerr << "Usage: rekal recent [N] [--workspace W]\n";
            return 1;
        }
    }

    Config cfg = Config::load(default_config_path());
    Logger log(std::cerr, Logger::Level::warn);
    SessionStore store(cfg.db_path_resolved(), log);
    std::cout << format_recent_sessions(store.recent_sessions(workspace, limit)) << "\n";
    return 0;
}

int cmd_session(const std::vector<std::string>& args) {
    if (args.empty()) {
        std::cerr << "Usage: rekal session <session-id-or-prefix>\n";
        return 1;
    }

    Config cfg = Config::load(default_config_path());
    Logger log(std::cerr, Logger::Level::warn);
    SessionStore store(cfg.db_path_resolved(), log);
    auto detail = store.session_detail(args[0]);
    std::cout << format_session_detail(detail) << "\n";
    return detail ? 0 : 1;
}

int cmd_stats() {
    Config cfg = Config::load(default_config_path());
    Logger log(std::cerr, Logger::Level::warn);
    SessionStore store(cfg.db_path_resolved(), log);
    std::cout << format_stats(store.stats()) << "\n";
    return 0;
}

int cmd_hook(const std::vector<std::string>& args) {
    std::optional<HookType> type;
    if (!args.empty()) type = parse_hook_type(args[0]);
    if (!type) {
        std::cerr << "Usage: rekal hook <stop|prompt|session-end|codex>\n";
        return 1;
    }

    Config cfg = Config::load(default_config_path());
    if (!cfg.enabled) return 0;

    Logger log(cfg.log_path_resolved());
    std::string tag = std::string("hook:") + hook_name(*type);

    nlohmann::json input;
    try {
        input = nlohmann::json::parse(std::cin);
    } catch (const nlohmann::json::exception& e) {
        log.error(tag, std::string("Failed to read hook input from stdin: ") + e.what());
        return 0;
    }

    CliSummarizer summarizer(cfg);
    HookContext ctx{cfg, summarizer, log};
    try {
        run_hook(*type, input, ctx);
    } catch (const StoreError& e) {
        log.error(tag, e.what());
        return 1;
    }
    return 0;
}

int cmd_init() {
    std::string path = default_config_path();
    if (fs::exists(path)) {
        std::cout << "Config already exists at " << path << "\n";
        return 0;
    }
    Config{}.save(path);
    std::cout << "Wrote default config to " << path << "\n";
    return 0;
}

} // namespace rekal
