#pragma once
#include <string>
#include <vector>
#include <map>
#include <optional>
#include <stdexcept>
#include <cstdint>
#include "ranking.hpp"

struct sqlite3;

namespace rekal {

class Logger;

class StoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct SessionRecord {
    std::string session_id;
    std::string source;
    std::string workspace_path;   // empty when unknown
    std::string model;
    std::string title;            // empty until summarized
    std::string summary;
    std::string started_at;
    std::string ended_at;         // empty while the session is open
    int turn_count = 0;
};

struct TurnRecord {
    int64_t id = 0;
    std::string session_id;
    int turn_number = 0;
    std::string user_message;
    std::string agent_output;
    std::string title;
    std::string description;
    std::string tags;
    std::string model_name;
    std::string timestamp;
};

struct SessionDetail {
    SessionRecord session;
    std::vector<TurnRecord> turns;
};

struct StoreStats {
    int64_t total_sessions = 0;
    int64_t claude_sessions = 0;
    int64_t codex_sessions = 0;
    std::map<std::string, int64_t> sessions_by_source;
    int64_t total_turns = 0;
    std::optional<std::string> last_indexed;
    int64_t total_searches = 0;
    int64_t searches_with_hits = 0;
    double avg_results = 0.0;
};

// SQLite-backed session and turn store with an FTS5 index over turns.
// One instance owns one connection; open it per invocation.
class SessionStore {
public:
    // Throws StoreError if the database cannot be opened or initialized.
    SessionStore(const std::string& db_path, Logger& log);
    ~SessionStore();

    SessionStore(const SessionStore&) = delete;
    SessionStore& operator=(const SessionStore&) = delete;

    // Insert-if-absent. An existing session keeps its original fields.
    void ensure_session(const std::string& session_id,
                        const std::string& source = "claude",
                        const std::string& workspace_path = "",
                        const std::string& model = "");

    // Insert or replace the (session_id, turn_number) row. turn_count only
    // grows when the key is new. Returns the row id.
    int64_t store_turn(const std::string& session_id, int turn_number,
                       const std::string& user_message, const std::string& agent_output,
                       const std::string& title, const std::string& description,
                       const std::string& tags, const std::string& model_name = "");

    // Sets title and summary and stamps ended_at.
    void update_session_summary(const std::string& session_id,
                                const std::string& title, const std::string& summary);

    void set_session_title(const std::string& session_id, const std::string& title);

    // Scored full-text search. Never throws on a bad query: engine errors
    // produce an empty result. Every call is recorded in search_log.
    std::vector<SearchHit> search(const std::string& query,
                                  const std::string& workspace = "",
                                  int limit = 20);

    std::vector<SessionRecord> recent_sessions(const std::string& workspace = "",
                                               int limit = 10);

    // Exact id first, then a unique prefix. Ambiguous or unknown -> nullopt.
    std::optional<SessionDetail> session_detail(const std::string& id_or_prefix);

    std::optional<SessionRecord> get_session(const std::string& session_id);
    std::vector<TurnRecord> get_session_turns(const std::string& session_id);
    int max_turn_number(const std::string& session_id);

    StoreStats stats();

    const std::string& path() const { return db_path_; }

private:
    sqlite3* db_ = nullptr;
    std::string db_path_;
    Logger& log_;

    void init_schema();
    void exec(const char* sql);
    std::vector<SearchHit> fetch_candidates(const std::string& fts_query, int64_t fetch_limit);
    void log_search(const std::string& query, int result_count, const std::string& workspace);
};

} // namespace rekal
