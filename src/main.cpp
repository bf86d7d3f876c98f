#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>
#include "search_cmd.hpp"

static void print_usage() {
    std::cout << "Usage: rekal <command> [options]\n\n"
              << "Commands:\n"
              << "  search <query...> [--workspace W] [--limit N]\n"
              << "                              Search indexed turns\n"
              << "  recent [N] [--workspace W]  Show recent sessions (default)\n"
              << "  session <id-or-prefix>      Show one session with its turns\n"
              << "  stats                       Show usage statistics\n"
              << "  hook <stop|prompt|session-end|codex>\n"
              << "                              Capture hook, reads JSON on stdin\n"
              << "  init                        Write a default ~/.rekal/config.json\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        try {
            return rekal::cmd_recent({});
        } catch (const std::exception& e) {
            std::cerr << "[error] " << e.what() << "\n";
            return 1;
        }
    }

    std::string cmd = argv[1];
    std::vector<std::string> args;
    for (int i = 2; i < argc; i++) {
        args.push_back(argv[i]);
    }

    try {
        if (cmd == "search") {
            return rekal::cmd_search(args);
        }
        else if (cmd == "recent") {
            return rekal::cmd_recent(args);
        }
        else if (cmd == "session") {
            return rekal::cmd_session(args);
        }
        else if (cmd == "stats") {
            return rekal::cmd_stats();
        }
        else if (cmd == "hook") {
            return rekal::cmd_hook(args);
        }
        else if (cmd == "init") {
            return rekal::cmd_init();
        }
        else if (cmd == "-h" || cmd == "--help" || cmd == "help") {
            print_usage();
            return 0;
        }
        else {
            std::cerr << "Unknown command: " << cmd << "\n";
            print_usage();
            return 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "[error] " << e.what() << "\n";
        return 1;
    }
}
