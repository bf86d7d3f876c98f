#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace rekal {

// A scored search result: one turn joined with its session.
struct SearchHit {
    int64_t turn_id = 0;
    std::string session_id;
    int turn_number = 0;
    std::string title;
    std::string description;
    std::string tags;
    std::string user_message;
    std::string timestamp;
    std::string workspace_path;
    std::string source;
    double rank = 0.0;      // bm25(), lower is better
    double age_days = 0.0;
    double score = 0.0;     // combined, higher is better
};

constexpr double kRecencyTimeConstantDays = 30.0;
constexpr double kMissingAgeDays = 365.0;
constexpr double kWorkspaceBonus = 2.0;

// Quotes every whitespace-separated token as an FTS5 phrase so no token is
// read as query syntax. An empty query becomes the empty phrase "".
std::string sanitize_fts_query(const std::string& query);

// Days between the timestamp and now; kMissingAgeDays if it does not parse.
double age_days(const std::string& timestamp, int64_t now_epoch);

double recency_weight(double days);

double workspace_weight(const std::string& workspace_filter,
                        const std::string& workspace_path);

// Scores every hit, sorts best first and keeps at most limit.
void rank_hits(std::vector<SearchHit>& hits, const std::string& workspace_filter,
               int64_t now_epoch, int limit);

} // namespace rekal
