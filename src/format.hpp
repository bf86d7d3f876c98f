#pragma once
#include <string>
#include <vector>
#include <optional>
#include "session_store.hpp"

namespace rekal {

// "3h ago", "2d ago", "1w ago", "4mo ago", "2y ago".
std::string format_age(double days);

// Shortest prefix length (at least floor) that keeps all ids distinct.
size_t unique_prefix(const std::vector<std::string>& ids, size_t floor = 8);

std::string format_search_results(const std::vector<SearchHit>& results);
std::string format_recent_sessions(const std::vector<SessionRecord>& sessions);
std::string format_session_detail(const std::optional<SessionDetail>& detail);
std::string format_stats(const StoreStats& stats);

} // namespace rekal
