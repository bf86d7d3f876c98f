#pragma once
#include <string>
#include <ostream>
#include <fstream>

namespace rekal {

// Line-oriented log sink. Owned by the entry point and passed down by
// reference; nothing in the library logs through a global.
class Logger {
public:
    enum class Level { debug = 0, info, warn, error };

    explicit Logger(std::ostream& out, Level min_level = Level::info);

    // Appends to file_path, creating parent directories. Falls back to
    // std::cerr when the file cannot be opened.
    explicit Logger(const std::string& file_path, Level min_level = Level::info);

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void log(Level level, const std::string& tag, const std::string& msg);

    void debug(const std::string& tag, const std::string& msg) { log(Level::debug, tag, msg); }
    void info(const std::string& tag, const std::string& msg)  { log(Level::info, tag, msg); }
    void warn(const std::string& tag, const std::string& msg)  { log(Level::warn, tag, msg); }
    void error(const std::string& tag, const std::string& msg) { log(Level::error, tag, msg); }

    void set_min_level(Level level) { min_level_ = level; }
    Level min_level() const { return min_level_; }

private:
    std::ofstream file_;
    std::ostream* out_;
    Level min_level_;
};

const char* level_name(Logger::Level level);

} // namespace rekal
