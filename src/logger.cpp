#include "logger.hpp"
#include "utils.hpp"
#include <iostream>

namespace rekal {

const char* level_name(Logger::Level level) {
    switch (level) {
        case Logger::Level::debug: return "debug";
        case Logger::Level::info:  return "info";
        case Logger::Level::warn:  return "warn";
        case Logger::Level::error: return "error";
    }
    return "info";
}

Logger::Logger(std::ostream& out, Level min_level)
    : out_(&out), min_level_(min_level) {}

Logger::Logger(const std::string& file_path, Level min_level)
    : out_(&std::cerr), min_level_(min_level) {
    std::error_code ec;
    auto parent = fs::path(file_path).parent_path();
    if (!parent.empty()) fs::create_directories(parent, ec);
    file_.open(file_path, std::ios::app);
    if (file_) {
        out_ = &file_;
    } else {
        std::cerr << "[logger] Cannot open " << file_path << ", logging to stderr\n";
    }
}

void Logger::log(Level level, const std::string& tag, const std::string& msg) {
    if (level < min_level_) return;
    *out_ << now_utc_str() << " [" << level_name(level) << "] [" << tag << "] " << msg << "\n";
    out_->flush();
}

} // namespace rekal
