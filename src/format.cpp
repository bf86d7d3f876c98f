#include "format.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <set>
#include <sstream>

namespace rekal {

std::string format_age(double days) {
    if (days < 1) {
        int hours = std::max(1, static_cast<int>(days * 24));
        return std::to_string(hours) + "h ago";
    }
    if (days < 7)   return std::to_string(static_cast<int>(days)) + "d ago";
    if (days < 30)  return std::to_string(static_cast<int>(days / 7)) + "w ago";
    if (days < 365) return std::to_string(static_cast<int>(days / 30)) + "mo ago";
    return std::to_string(static_cast<int>(days / 365)) + "y ago";
}

size_t unique_prefix(const std::vector<std::string>& ids, size_t floor) {
    if (ids.size() <= 1) return floor;

    size_t max_len = 0;
    for (auto& id : ids) max_len = std::max(max_len, id.size());

    for (size_t len = floor; len < max_len; len++) {
        std::set<std::string> seen;
        for (auto& id : ids) seen.insert(id.substr(0, len));
        if (seen.size() == ids.size()) return len;
    }
    return max_len;
}

std::string format_search_results(const std::vector<SearchHit>& results) {
    if (results.empty()) return "No results found.";

    std::vector<std::string> ids;
    for (auto& r : results) ids.push_back(r.session_id);
    size_t prefix = unique_prefix(ids);

    std::ostringstream out;
    for (auto& r : results) {
        std::string workspace = r.workspace_path.empty() ? "" : path_basename(r.workspace_path);
        std::string title = r.title.empty() ? "Untitled" : r.title;
        std::string source = r.source.empty() ? "claude" : r.source;

        out << "## " << title << " (" << format_age(r.age_days);
        if (!workspace.empty()) out << ", " << workspace;
        out << ", " << source << ")\n";
        if (!r.tags.empty()) out << "Tags: " << r.tags << "\n";
        if (!r.description.empty()) out << r.description << "\n";
        out << "Session: " << r.session_id.substr(0, prefix) << "\n\n";
    }
    std::string s = out.str();
    s.pop_back();
    return s;
}

std::string format_recent_sessions(const std::vector<SessionRecord>& sessions) {
    if (sessions.empty()) return "No sessions found.";

    std::vector<std::string> ids;
    for (auto& s : sessions) ids.push_back(s.session_id);
    size_t prefix = unique_prefix(ids);

    std::vector<std::string> lines;
    for (auto& s : sessions) {
        std::string title = s.title.empty() ? "Untitled session" : s.title;
        std::string line = "- **" + title + "** (" + s.started_at.substr(0, 16) + ", " +
                           std::to_string(s.turn_count) + " turns, " + s.source + ")";
        if (!s.workspace_path.empty()) line += " [" + path_basename(s.workspace_path) + "]";
        line += " `" + s.session_id.substr(0, prefix) + "`";
        lines.push_back(line);
        if (!s.summary.empty()) lines.push_back("  " + s.summary);
    }
    return join(lines, "\n");
}

std::string format_session_detail(const std::optional<SessionDetail>& detail) {
    if (!detail) return "Session not found.";

    const SessionRecord& s = detail->session;
    std::ostringstream out;
    out << "# " << (s.title.empty() ? "Untitled session" : s.title) << "\n";
    out << "Source: " << s.source << "\n";
    out << "Workspace: " << (s.workspace_path.empty() ? "unknown" : s.workspace_path) << "\n";
    out << "Started: " << s.started_at << "\n";
    if (!s.summary.empty()) out << "\n" << s.summary << "\n";
    out << "\n## Turns (" << s.turn_count << ")";

    for (auto& t : detail->turns) {
        out << "\n\n### " << (t.title.empty() ? "Untitled" : t.title)
            << " (" << t.timestamp.substr(0, 16) << ")";
        if (!t.tags.empty()) out << "\nTags: " << t.tags;
        if (!t.description.empty()) out << "\n" << t.description;
    }
    return out.str();
}

std::string format_stats(const StoreStats& stats) {
    std::string hit_rate = "-";
    if (stats.total_searches > 0) {
        long pct = std::lround(100.0 * static_cast<double>(stats.searches_with_hits) /
                               static_cast<double>(stats.total_searches));
        hit_rate = std::to_string(pct) + "%";
    }

    std::ostringstream avg;
    avg << std::fixed << std::setprecision(1) << stats.avg_results;

    std::vector<std::string> lines = {
        "# Rekal Stats",
        "",
        "Sessions: " + std::to_string(stats.total_sessions) + " (" +
            std::to_string(stats.claude_sessions) + " claude, " +
            std::to_string(stats.codex_sessions) + " codex)",
        "Turns indexed: " + std::to_string(stats.total_turns),
        "Last indexed: " + stats.last_indexed.value_or("never"),
        "",
        "Searches: " + std::to_string(stats.total_searches),
        "Hit rate: " + hit_rate + " (" + std::to_string(stats.searches_with_hits) + "/" +
            std::to_string(stats.total_searches) + " returned results)",
        "Avg results per search: " + avg.str(),
    };
    return join(lines, "\n");
}

} // namespace rekal
