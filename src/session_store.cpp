#include "session_store.hpp"
#include "logger.hpp"
#include "utils.hpp"
#include <sqlite3.h>

namespace rekal {

namespace {

// Prepared statement that finalizes itself. Errors throw StoreError.
class Statement {
public:
    Statement(sqlite3* db, const char* sql) : db_(db) {
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
            std::string msg = sqlite3_errmsg(db_);
            if (stmt_) sqlite3_finalize(stmt_);
            stmt_ = nullptr;
            throw StoreError("prepare failed: " + msg);
        }
    }
    ~Statement() { if (stmt_) sqlite3_finalize(stmt_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bind(int idx, const std::string& value) {
        sqlite3_bind_text(stmt_, idx, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
    }

    // Empty strings are stored as NULL.
    void bind_nullable(int idx, const std::string& value) {
        if (value.empty()) sqlite3_bind_null(stmt_, idx);
        else bind(idx, value);
    }

    void bind(int idx, int64_t value) {
        sqlite3_bind_int64(stmt_, idx, value);
    }

    // true while rows are available, false when done.
    bool step() {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        throw StoreError("step failed: " + std::string(sqlite3_errmsg(db_)));
    }

    void run() {
        while (step()) {}
    }

    std::string text(int col) const {
        const unsigned char* t = sqlite3_column_text(stmt_, col);
        return t ? reinterpret_cast<const char*>(t) : "";
    }

    bool is_null(int col) const {
        return sqlite3_column_type(stmt_, col) == SQLITE_NULL;
    }

    int64_t int64(int col) const { return sqlite3_column_int64(stmt_, col); }
    double real(int col) const { return sqlite3_column_double(stmt_, col); }

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_ = nullptr;
};

// BEGIN IMMEDIATE on construction; rolls back unless commit() was called.
class Transaction {
public:
    explicit Transaction(sqlite3* db) : db_(db) {
        exec("BEGIN IMMEDIATE");
    }
    ~Transaction() {
        if (!done_) sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
    }

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit() {
        exec("COMMIT");
        done_ = true;
    }

private:
    sqlite3* db_;
    bool done_ = false;

    void exec(const char* sql) {
        char* err = nullptr;
        if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
            std::string msg = err ? err : sqlite3_errmsg(db_);
            sqlite3_free(err);
            throw StoreError(std::string(sql) + " failed: " + msg);
        }
    }
};

const char* kSessionColumns =
    "session_id, source, workspace_path, model, title, summary, "
    "started_at, ended_at, turn_count";

SessionRecord read_session(const Statement& st) {
    SessionRecord s;
    s.session_id = st.text(0);
    s.source = st.text(1);
    s.workspace_path = st.text(2);
    s.model = st.text(3);
    s.title = st.text(4);
    s.summary = st.text(5);
    s.started_at = st.text(6);
    s.ended_at = st.text(7);
    s.turn_count = static_cast<int>(st.int64(8));
    return s;
}

} // namespace

SessionStore::SessionStore(const std::string& db_path, Logger& log)
    : db_path_(db_path), log_(log) {
    auto parent = fs::path(db_path).parent_path();
    if (!parent.empty()) fs::create_directories(parent);

    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        throw StoreError("Failed to open session DB: " + msg);
    }

    // Brief overlapping writers wait instead of failing with SQLITE_BUSY
    sqlite3_busy_timeout(db_, 5000);

    try {
        init_schema();
    } catch (const StoreError&) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

SessionStore::~SessionStore() {
    if (db_) sqlite3_close(db_);
}

void SessionStore::exec(const char* sql) {
    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw StoreError("Failed to init session DB: " + msg);
    }
}

void SessionStore::init_schema() {
    exec("PRAGMA journal_mode=WAL;");
    exec("PRAGMA foreign_keys=ON;");
    // FTS5 tables are written from triggers
    exec("PRAGMA trusted_schema=ON;");

    exec(R"SQL(
        CREATE TABLE IF NOT EXISTS sessions (
            session_id TEXT PRIMARY KEY,
            source TEXT NOT NULL DEFAULT 'claude',
            workspace_path TEXT,
            model TEXT,
            title TEXT,
            summary TEXT,
            started_at TEXT NOT NULL DEFAULT (datetime('now')),
            ended_at TEXT,
            turn_count INTEGER DEFAULT 0
        );

        CREATE TABLE IF NOT EXISTS turns (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            session_id TEXT NOT NULL REFERENCES sessions(session_id),
            turn_number INTEGER,
            user_message TEXT,
            agent_output TEXT,
            title TEXT,
            description TEXT,
            tags TEXT,
            model_name TEXT,
            timestamp TEXT NOT NULL DEFAULT (datetime('now')),
            UNIQUE(session_id, turn_number)
        );

        CREATE TABLE IF NOT EXISTS search_log (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            query TEXT NOT NULL,
            result_count INTEGER DEFAULT 0,
            workspace TEXT,
            searched_at TEXT NOT NULL DEFAULT (datetime('now'))
        );

        CREATE INDEX IF NOT EXISTS idx_turns_session ON turns(session_id);
        CREATE INDEX IF NOT EXISTS idx_turns_timestamp ON turns(timestamp);
        CREATE INDEX IF NOT EXISTS idx_sessions_started ON sessions(started_at);
        CREATE INDEX IF NOT EXISTS idx_sessions_workspace ON sessions(workspace_path);

        CREATE VIRTUAL TABLE IF NOT EXISTS turns_fts USING fts5(
            title, description, tags, user_message,
            content='turns', content_rowid='id'
        );

        CREATE TRIGGER IF NOT EXISTS turns_ai AFTER INSERT ON turns BEGIN
            INSERT INTO turns_fts(rowid, title, description, tags, user_message)
                VALUES (new.id, new.title, new.description, new.tags, new.user_message);
        END;

        CREATE TRIGGER IF NOT EXISTS turns_ad AFTER DELETE ON turns BEGIN
            INSERT INTO turns_fts(turns_fts, rowid, title, description, tags, user_message)
                VALUES ('delete', old.id, old.title, old.description, old.tags, old.user_message);
        END;

        CREATE TRIGGER IF NOT EXISTS turns_au AFTER UPDATE ON turns BEGIN
            INSERT INTO turns_fts(turns_fts, rowid, title, description, tags, user_message)
                VALUES ('delete', old.id, old.title, old.description, old.tags, old.user_message);
            INSERT INTO turns_fts(rowid, title, description, tags, user_message)
                VALUES (new.id, new.title, new.description, new.tags, new.user_message);
        END;
    )SQL");
}

// ── Write path ─────────────────────────────────────────────────────

void SessionStore::ensure_session(const std::string& session_id, const std::string& source,
                                  const std::string& workspace_path, const std::string& model) {
    Statement st(db_, "INSERT OR IGNORE INTO sessions (session_id, source, workspace_path, model) "
                      "VALUES (?, ?, ?, ?)");
    st.bind(1, session_id);
    st.bind(2, source.empty() ? std::string("claude") : source);
    st.bind_nullable(3, workspace_path);
    st.bind_nullable(4, model);
    st.run();
}

int64_t SessionStore::store_turn(const std::string& session_id, int turn_number,
                                 const std::string& user_message, const std::string& agent_output,
                                 const std::string& title, const std::string& description,
                                 const std::string& tags, const std::string& model_name) {
    Transaction tx(db_);

    std::optional<int64_t> existing;
    {
        Statement st(db_, "SELECT id FROM turns WHERE session_id = ? AND turn_number = ?");
        st.bind(1, session_id);
        st.bind(2, static_cast<int64_t>(turn_number));
        if (st.step()) existing = st.int64(0);
    }

    int64_t row_id = 0;
    if (existing) {
        // In-place update keeps the row id; turns_au re-indexes it
        Statement st(db_, "UPDATE turns SET user_message = ?, agent_output = ?, title = ?, "
                          "description = ?, tags = ?, model_name = ?, timestamp = datetime('now') "
                          "WHERE id = ?");
        st.bind(1, user_message);
        st.bind(2, agent_output);
        st.bind(3, title);
        st.bind(4, description);
        st.bind(5, tags);
        st.bind_nullable(6, model_name);
        st.bind(7, *existing);
        st.run();
        row_id = *existing;
    } else {
        Statement st(db_, "INSERT INTO turns (session_id, turn_number, user_message, agent_output, "
                          "title, description, tags, model_name) VALUES (?, ?, ?, ?, ?, ?, ?, ?)");
        st.bind(1, session_id);
        st.bind(2, static_cast<int64_t>(turn_number));
        st.bind(3, user_message);
        st.bind(4, agent_output);
        st.bind(5, title);
        st.bind(6, description);
        st.bind(7, tags);
        st.bind_nullable(8, model_name);
        st.run();
        row_id = sqlite3_last_insert_rowid(db_);

        Statement up(db_, "UPDATE sessions SET turn_count = turn_count + 1 WHERE session_id = ?");
        up.bind(1, session_id);
        up.run();
    }

    tx.commit();
    return row_id;
}

void SessionStore::update_session_summary(const std::string& session_id,
                                          const std::string& title, const std::string& summary) {
    Statement st(db_, "UPDATE sessions SET title = ?, summary = ?, ended_at = datetime('now') "
                      "WHERE session_id = ?");
    st.bind(1, title);
    st.bind(2, summary);
    st.bind(3, session_id);
    st.run();
}

void SessionStore::set_session_title(const std::string& session_id, const std::string& title) {
    Statement st(db_, "UPDATE sessions SET title = ? WHERE session_id = ?");
    st.bind(1, title);
    st.bind(2, session_id);
    st.run();
}

// ── Search ─────────────────────────────────────────────────────────

std::vector<SearchHit> SessionStore::fetch_candidates(const std::string& fts_query, int64_t fetch_limit) {
    Statement st(db_, R"SQL(
        SELECT t.id, t.session_id, t.turn_number, t.title, t.description, t.tags,
               t.user_message, t.timestamp, s.workspace_path, s.source,
               bm25(turns_fts) AS rank
        FROM turns_fts
        JOIN turns t ON t.id = turns_fts.rowid
        JOIN sessions s ON s.session_id = t.session_id
        WHERE turns_fts MATCH ?
        ORDER BY rank
        LIMIT ?
    )SQL");
    st.bind(1, fts_query);
    st.bind(2, fetch_limit);

    std::vector<SearchHit> hits;
    while (st.step()) {
        SearchHit h;
        h.turn_id = st.int64(0);
        h.session_id = st.text(1);
        h.turn_number = static_cast<int>(st.int64(2));
        h.title = st.text(3);
        h.description = st.text(4);
        h.tags = st.text(5);
        h.user_message = st.text(6);
        h.timestamp = st.text(7);
        h.workspace_path = st.text(8);
        h.source = st.text(9);
        h.rank = st.real(10);
        hits.push_back(std::move(h));
    }
    return hits;
}

std::vector<SearchHit> SessionStore::search(const std::string& query,
                                            const std::string& workspace, int limit) {
    std::vector<SearchHit> results;
    if (limit > 0) {
        try {
            // Over-fetch so recency and workspace can reorder the lexical top
            results = fetch_candidates(sanitize_fts_query(query), static_cast<int64_t>(limit) * 3);
        } catch (const StoreError& e) {
            log_.warn("store", std::string("search failed: ") + e.what());
            results.clear();
        }
        rank_hits(results, workspace, epoch_now(), limit);
    }

    log_search(query, static_cast<int>(results.size()), workspace);
    return results;
}

void SessionStore::log_search(const std::string& query, int result_count,
                              const std::string& workspace) {
    try {
        Statement st(db_, "INSERT INTO search_log (query, result_count, workspace) VALUES (?, ?, ?)");
        st.bind(1, query);
        st.bind(2, static_cast<int64_t>(result_count));
        st.bind_nullable(3, workspace);
        st.run();
    } catch (const StoreError& e) {
        log_.debug("store", std::string("search_log insert failed: ") + e.what());
    }
}

// ── Browse ─────────────────────────────────────────────────────────

std::vector<SessionRecord> SessionStore::recent_sessions(const std::string& workspace, int limit) {
    std::string sql = std::string("SELECT ") + kSessionColumns + " FROM sessions ";
    if (!workspace.empty()) sql += "WHERE instr(workspace_path, ?) > 0 ";
    sql += "ORDER BY started_at DESC, rowid DESC LIMIT ?";

    Statement st(db_, sql.c_str());
    int idx = 1;
    if (!workspace.empty()) st.bind(idx++, workspace);
    st.bind(idx, static_cast<int64_t>(limit));

    std::vector<SessionRecord> out;
    while (st.step()) out.push_back(read_session(st));
    return out;
}

std::optional<SessionRecord> SessionStore::get_session(const std::string& session_id) {
    std::string sql = std::string("SELECT ") + kSessionColumns + " FROM sessions WHERE session_id = ?";
    Statement st(db_, sql.c_str());
    st.bind(1, session_id);
    if (!st.step()) return std::nullopt;
    return read_session(st);
}

std::optional<SessionDetail> SessionStore::session_detail(const std::string& id_or_prefix) {
    if (id_or_prefix.empty()) return std::nullopt;

    auto session = get_session(id_or_prefix);
    if (!session) {
        // Literal prefix compare; LIKE would treat '_' and '%' as wildcards
        std::string sql = std::string("SELECT ") + kSessionColumns +
                          " FROM sessions WHERE substr(session_id, 1, length(?1)) = ?1 LIMIT 2";
        Statement st(db_, sql.c_str());
        st.bind(1, id_or_prefix);
        std::vector<SessionRecord> matches;
        while (st.step()) matches.push_back(read_session(st));
        if (matches.size() != 1) return std::nullopt;
        session = std::move(matches.front());
    }

    SessionDetail detail;
    detail.session = std::move(*session);
    detail.turns = get_session_turns(detail.session.session_id);
    return detail;
}

std::vector<TurnRecord> SessionStore::get_session_turns(const std::string& session_id) {
    Statement st(db_, "SELECT id, session_id, turn_number, user_message, agent_output, title, "
                      "description, tags, model_name, timestamp "
                      "FROM turns WHERE session_id = ? ORDER BY turn_number");
    st.bind(1, session_id);

    std::vector<TurnRecord> turns;
    while (st.step()) {
        TurnRecord t;
        t.id = st.int64(0);
        t.session_id = st.text(1);
        t.turn_number = static_cast<int>(st.int64(2));
        t.user_message = st.text(3);
        t.agent_output = st.text(4);
        t.title = st.text(5);
        t.description = st.text(6);
        t.tags = st.text(7);
        t.model_name = st.text(8);
        t.timestamp = st.text(9);
        turns.push_back(std::move(t));
    }
    return turns;
}

int SessionStore::max_turn_number(const std::string& session_id) {
    Statement st(db_, "SELECT COALESCE(MAX(turn_number), 0) FROM turns WHERE session_id = ?");
    st.bind(1, session_id);
    return st.step() ? static_cast<int>(st.int64(0)) : 0;
}

StoreStats SessionStore::stats() {
    StoreStats s;
    {
        Statement st(db_, R"SQL(
            SELECT
                (SELECT COUNT(*) FROM sessions),
                (SELECT COUNT(*) FROM turns),
                (SELECT MAX(timestamp) FROM turns),
                (SELECT COUNT(*) FROM search_log),
                (SELECT COUNT(*) FROM search_log WHERE result_count > 0),
                (SELECT AVG(result_count) FROM search_log)
        )SQL");
        if (st.step()) {
            s.total_sessions = st.int64(0);
            s.total_turns = st.int64(1);
            if (!st.is_null(2)) s.last_indexed = st.text(2);
            s.total_searches = st.int64(3);
            s.searches_with_hits = st.int64(4);
            s.avg_results = st.is_null(5) ? 0.0 : st.real(5);
        }
    }
    {
        Statement st(db_, "SELECT source, COUNT(*) FROM sessions GROUP BY source ORDER BY source");
        while (st.step()) s.sessions_by_source[st.text(0)] = st.int64(1);
    }
    auto count_of = [&](const char* source) -> int64_t {
        auto it = s.sessions_by_source.find(source);
        return it == s.sessions_by_source.end() ? 0 : it->second;
    };
    s.claude_sessions = count_of("claude");
    s.codex_sessions = count_of("codex");
    return s;
}

} // namespace rekal
