#include "ranking.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cmath>

namespace rekal {

std::string sanitize_fts_query(const std::string& query) {
    auto tokens = split_whitespace(query);
    if (tokens.empty()) return "\"\"";

    std::vector<std::string> quoted;
    for (auto& tok : tokens) {
        std::string q = "\"";
        for (char c : tok) {
            if (c == '"') q += "\"\"";
            else q += c;
        }
        q += "\"";
        quoted.push_back(std::move(q));
    }
    return join(quoted, " ");
}

double age_days(const std::string& timestamp, int64_t now_epoch) {
    auto ts = parse_utc_timestamp(timestamp);
    if (!ts) return kMissingAgeDays;
    return static_cast<double>(now_epoch - *ts) / 86400.0;
}

double recency_weight(double days) {
    return std::exp(-days / kRecencyTimeConstantDays);
}

double workspace_weight(const std::string& workspace_filter,
                        const std::string& workspace_path) {
    if (workspace_filter.empty() || workspace_path.empty()) return 1.0;
    return workspace_path.find(workspace_filter) != std::string::npos ? kWorkspaceBonus : 1.0;
}

void rank_hits(std::vector<SearchHit>& hits, const std::string& workspace_filter,
               int64_t now_epoch, int limit) {
    for (auto& h : hits) {
        h.age_days = age_days(h.timestamp, now_epoch);
        double lexical = -h.rank;
        h.score = lexical * recency_weight(h.age_days)
                * workspace_weight(workspace_filter, h.workspace_path);
    }

    std::stable_sort(hits.begin(), hits.end(),
                     [](const SearchHit& a, const SearchHit& b) { return a.score > b.score; });

    size_t keep = limit > 0 ? static_cast<size_t>(limit) : 0;
    if (hits.size() > keep) hits.resize(keep);
}

} // namespace rekal
