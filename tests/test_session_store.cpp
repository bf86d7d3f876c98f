#include <catch2/catch_test_macros.hpp>
#include <limits>
#include <set>
#include <sstream>
#include "test_helpers.hpp"
#include "logger.hpp"
#include "session_store.hpp"

using namespace rekal;
using rekal::testing::TempDir;
using rekal::testing::exec_sql;
using rekal::testing::query_int;

namespace {

struct StoreFixture {
    TempDir dir;
    std::ostringstream log_out;
    Logger log{log_out, Logger::Level::debug};
    std::string db_path = dir.file("db.sqlite");
    SessionStore store{db_path, log};
};

void seed(SessionStore& store) {
    store.ensure_session("session-abc123def456", "claude", "/Users/test/Projects/crustland");
    store.store_turn("session-abc123def456", 1, "fix auth middleware",
                     "fixed null check in token validation", "Fix auth middleware null check",
                     "Status: completed\n- Fixed null check in auth handler",
                     "authentication, middleware, jwt, bugfix");
    store.store_turn("session-abc123def456", 2, "add rate limiting",
                     "implemented sliding window limiter", "Add per-agent rate limiting",
                     "Status: completed\n- Implemented sliding window algorithm",
                     "api, rate-limiting, middleware");

    store.ensure_session("session-xyz789ghi000", "codex", "/Users/test/Projects/rekal");
    store.store_turn("session-xyz789ghi000", 1, "set up SQLite FTS5 search",
                     "created full-text index with BM25", "Initialize FTS5 search index",
                     "Status: completed\n- Created FTS5 virtual table with triggers",
                     "sqlite, fts5, search, database");

    store.ensure_session("session-jwt-debug-999", "claude", "/Users/test/Projects/crustland");
    store.store_turn("session-jwt-debug-999", 1, "debug token expiry issue",
                     "traced race condition in refresh flow", "Debug JWT token refresh race condition",
                     "Status: in_progress\n- Found race in refresh flow",
                     "authentication, jwt, debug, race-condition");
}

} // namespace

TEST_CASE("Opening creates the schema and parent directories", "[store]") {
    TempDir dir;
    std::ostringstream out;
    Logger log(out);
    std::string path = dir.file("nested/deeper/db.sqlite");
    {
        SessionStore store(path, log);
        REQUIRE(store.path() == path);
    }
    REQUIRE(fs::exists(path));
    REQUIRE(query_int(path, "SELECT COUNT(*) FROM sqlite_master WHERE name IN "
                            "('sessions','turns','search_log','turns_fts')") == 4);
    REQUIRE(query_int(path, "SELECT COUNT(*) FROM sqlite_master WHERE type='trigger'") == 3);

    // Reopening an initialized database is harmless
    SessionStore again(path, log);
    REQUIRE(again.stats().total_sessions == 0);
}

TEST_CASE("Opening an unusable path throws StoreError", "[store]") {
    TempDir dir;
    std::ostringstream out;
    Logger log(out);
    fs::create_directories(dir.path() / "a_directory");
    REQUIRE_THROWS_AS(SessionStore(dir.file("a_directory"), log), StoreError);
}

TEST_CASE("ensure_session keeps the first insert", "[store]") {
    StoreFixture f;
    f.store.ensure_session("s1", "claude", "/work/one", "haiku");
    f.store.ensure_session("s1", "codex", "/work/two", "gpt");

    auto s = f.store.get_session("s1");
    REQUIRE(s);
    REQUIRE(s->source == "claude");
    REQUIRE(s->workspace_path == "/work/one");
    REQUIRE(s->model == "haiku");
    REQUIRE(s->turn_count == 0);
    REQUIRE(s->ended_at.empty());
    REQUIRE_FALSE(s->started_at.empty());

    f.store.ensure_session("s2");
    auto s2 = f.store.get_session("s2");
    REQUIRE(s2->source == "claude");
    REQUIRE(s2->workspace_path.empty());
    REQUIRE(query_int(f.db_path, "SELECT COUNT(*) FROM sessions WHERE session_id='s2' "
                                 "AND workspace_path IS NULL AND model IS NULL") == 1);
}

TEST_CASE("turn_count equals the number of distinct turn numbers", "[store]") {
    StoreFixture f;
    f.store.ensure_session("s1");
    f.store.store_turn("s1", 1, "a", "a", "t1", "d", "x");
    f.store.store_turn("s1", 2, "b", "b", "t2", "d", "x");
    f.store.store_turn("s1", 2, "b again", "b", "t2", "d", "x");
    f.store.store_turn("s1", 3, "c", "c", "t3", "d", "x");
    f.store.store_turn("s1", 1, "a again", "a", "t1", "d", "x");

    REQUIRE(f.store.get_session("s1")->turn_count == 3);
    REQUIRE(f.store.max_turn_number("s1") == 3);
    REQUIRE(f.store.max_turn_number("unknown") == 0);
    REQUIRE(query_int(f.db_path, "SELECT COUNT(*) FROM turns WHERE session_id='s1'") == 3);
}

TEST_CASE("Re-storing a turn replaces it and keeps the row id", "[store]") {
    StoreFixture f;
    f.store.ensure_session("s1");
    int64_t first = f.store.store_turn("s1", 1, "first prompt", "first output",
                                       "First title", "first description", "one");
    int64_t second = f.store.store_turn("s1", 1, "second prompt", "second output",
                                        "Second title", "second description", "two", "sonnet");
    REQUIRE(first == second);

    auto turns = f.store.get_session_turns("s1");
    REQUIRE(turns.size() == 1);
    REQUIRE(turns[0].user_message == "second prompt");
    REQUIRE(turns[0].agent_output == "second output");
    REQUIRE(turns[0].title == "Second title");
    REQUIRE(turns[0].tags == "two");
    REQUIRE(turns[0].model_name == "sonnet");
}

TEST_CASE("Replacing a turn re-indexes it for search", "[store]") {
    StoreFixture f;
    f.store.ensure_session("s1");
    f.store.store_turn("s1", 1, "zebra question", "out", "Zebra topic", "about zebras", "zebra");
    REQUIRE(f.store.search("zebra").size() == 1);

    f.store.store_turn("s1", 1, "giraffe question", "out", "Giraffe topic", "about giraffes", "giraffe");
    REQUIRE(f.store.search("zebra").empty());
    auto hits = f.store.search("giraffe");
    REQUIRE(hits.size() == 1);
    REQUIRE(hits[0].title == "Giraffe topic");
}

TEST_CASE("Storing a turn for an unknown session violates the foreign key", "[store]") {
    StoreFixture f;
    REQUIRE_THROWS_AS(f.store.store_turn("ghost", 1, "p", "o", "t", "d", "x"), StoreError);
    REQUIRE(query_int(f.db_path, "SELECT COUNT(*) FROM turns") == 0);
}

TEST_CASE("update_session_summary sets the recap and ends the session", "[store]") {
    StoreFixture f;
    f.store.ensure_session("s1");
    f.store.set_session_title("s1", "Early title");
    REQUIRE(f.store.get_session("s1")->title == "Early title");
    REQUIRE(f.store.get_session("s1")->ended_at.empty());

    f.store.update_session_summary("s1", "Final title", "We fixed things.");
    auto s = f.store.get_session("s1");
    REQUIRE(s->title == "Final title");
    REQUIRE(s->summary == "We fixed things.");
    REQUIRE_FALSE(s->ended_at.empty());

    // Unknown ids are a no-op
    f.store.update_session_summary("nope", "x", "y");
    REQUIRE_FALSE(f.store.get_session("nope"));
}

TEST_CASE("End-to-end search finds indexed turns", "[store][search]") {
    StoreFixture f;
    seed(f.store);

    // "authentication" appears only in the tags of two turns
    auto hits = f.store.search("authentication");
    REQUIRE(hits.size() == 2);
    std::set<std::string> sessions;
    for (auto& h : hits) {
        REQUIRE(h.score > 0.0);
        REQUIRE(h.turn_number == 1);
        REQUIRE(h.source == "claude");
        sessions.insert(h.session_id);
    }
    REQUIRE(sessions == std::set<std::string>{"session-abc123def456", "session-jwt-debug-999"});
    REQUIRE(hits[0].score >= hits[1].score);

    auto fts = f.store.search("FTS5");
    REQUIRE(fts.size() == 1);
    REQUIRE(fts[0].session_id == "session-xyz789ghi000");
    REQUIRE(fts[0].source == "codex");
    REQUIRE(fts[0].workspace_path == "/Users/test/Projects/rekal");
    REQUIRE(fts[0].title == "Initialize FTS5 search index");

    REQUIRE(f.store.search("middleware").size() == 2);
}

TEST_CASE("Each indexed column matches on its own", "[store][search]") {
    StoreFixture f;
    f.store.ensure_session("s1");
    f.store.store_turn("s1", 1, "deltaword prompt", "echoword output", "alphaword title",
                       "bravoword description", "charlieword");

    REQUIRE(f.store.search("alphaword").size() == 1);
    REQUIRE(f.store.search("bravoword").size() == 1);
    REQUIRE(f.store.search("charlieword").size() == 1);
    REQUIRE(f.store.search("deltaword").size() == 1);
    // agent_output is stored but not indexed
    REQUIRE(f.store.search("echoword").empty());
}

TEST_CASE("A very large limit is accepted", "[store][search]") {
    StoreFixture f;
    seed(f.store);

    auto hits = f.store.search("auth", "", std::numeric_limits<int>::max());
    REQUIRE(hits.size() == 1);
    REQUIRE(hits[0].title == "Fix auth middleware null check");
    REQUIRE(query_int(f.db_path, "SELECT result_count FROM search_log WHERE query='auth'") == 1);
}

TEST_CASE("A search with no matches is still logged", "[store][search]") {
    StoreFixture f;
    seed(f.store);

    REQUIRE(f.store.search("nonexistent-term-xyz").empty());
    REQUIRE(query_int(f.db_path, "SELECT COUNT(*) FROM search_log "
                                 "WHERE query='nonexistent-term-xyz' AND result_count=0") == 1);
}

TEST_CASE("Query syntax never reaches the engine unescaped", "[store][search]") {
    StoreFixture f;
    seed(f.store);

    for (const std::string q : {"", "\"", "foo OR", "(auth AND) OR NOT", "*", "a\"b", "NEAR(", "-", "title:auth"}) {
        REQUIRE_NOTHROW(f.store.search(q));
    }
    REQUIRE(query_int(f.db_path, "SELECT COUNT(*) FROM search_log") == 9);
}

TEST_CASE("Search limit is honored", "[store][search]") {
    StoreFixture f;
    f.store.ensure_session("s1");
    for (int i = 1; i <= 10; i++) {
        f.store.store_turn("s1", i, "common word " + std::to_string(i), "o", "common", "d", "t");
    }
    REQUIRE(f.store.search("common", "", 4).size() == 4);
    REQUIRE(f.store.search("common", "", 50).size() == 10);
    REQUIRE(f.store.search("common", "", 0).empty());
    REQUIRE(f.store.search("common", "", -1).empty());
}

TEST_CASE("Recent turns outrank old ones with equal text", "[store][search]") {
    StoreFixture f;
    f.store.ensure_session("old");
    f.store.ensure_session("new");
    f.store.store_turn("old", 1, "kubernetes rollout", "o", "Kubernetes rollout", "d", "k8s");
    f.store.store_turn("new", 1, "kubernetes rollout", "o", "Kubernetes rollout", "d", "k8s");
    exec_sql(f.db_path, "UPDATE turns SET timestamp = datetime('now', '-90 days') WHERE session_id='old'");
    exec_sql(f.db_path, "UPDATE turns SET timestamp = datetime('now', '-1 days') WHERE session_id='new'");

    auto hits = f.store.search("kubernetes");
    REQUIRE(hits.size() == 2);
    REQUIRE(hits[0].session_id == "new");
    REQUIRE(hits[1].session_id == "old");
    REQUIRE(hits[0].age_days < hits[1].age_days);
}

TEST_CASE("Workspace match boosts ranking", "[store][search]") {
    StoreFixture f;
    f.store.ensure_session("elsewhere", "claude", "/home/dev/other");
    f.store.ensure_session("here", "claude", "/home/dev/webapp");
    f.store.store_turn("elsewhere", 1, "redis cache", "o", "Redis cache", "d", "redis");
    f.store.store_turn("here", 1, "redis cache", "o", "Redis cache", "d", "redis");
    exec_sql(f.db_path, "UPDATE turns SET timestamp = datetime('now', '-2 days')");

    auto hits = f.store.search("redis", "webapp");
    REQUIRE(hits.size() == 2);
    REQUIRE(hits[0].session_id == "here");
    REQUIRE(query_int(f.db_path, "SELECT COUNT(*) FROM search_log WHERE workspace='webapp'") == 1);
}

TEST_CASE("Unparseable timestamps rank as a year old", "[store][search]") {
    StoreFixture f;
    f.store.ensure_session("s1");
    f.store.store_turn("s1", 1, "graphql schema", "o", "GraphQL", "d", "graphql");
    exec_sql(f.db_path, "UPDATE turns SET timestamp = 'not a date'");

    auto hits = f.store.search("graphql");
    REQUIRE(hits.size() == 1);
    REQUIRE(hits[0].age_days == kMissingAgeDays);
}

TEST_CASE("Session prefix resolution", "[store]") {
    StoreFixture f;
    seed(f.store);

    SECTION("exact id") {
        auto d = f.store.session_detail("session-jwt-debug-999");
        REQUIRE(d);
        REQUIRE(d->session.session_id == "session-jwt-debug-999");
        REQUIRE(d->turns.size() == 1);
    }
    SECTION("unique prefix") {
        auto d = f.store.session_detail("session-abc1");
        REQUIRE(d);
        REQUIRE(d->session.session_id == "session-abc123def456");
        REQUIRE(d->turns.size() == 2);
        REQUIRE(d->turns[0].turn_number == 1);
        REQUIRE(d->turns[1].turn_number == 2);
    }
    SECTION("ambiguous prefix") {
        REQUIRE_FALSE(f.store.session_detail("session-"));
    }
    SECTION("unknown prefix") {
        REQUIRE_FALSE(f.store.session_detail("nothing-like-it"));
    }
    SECTION("empty input") {
        REQUIRE_FALSE(f.store.session_detail(""));
    }
    SECTION("wildcard characters are literal") {
        REQUIRE_FALSE(f.store.session_detail("session_abc"));
        REQUIRE_FALSE(f.store.session_detail("%"));
    }
}

TEST_CASE("An exact id wins over longer ids sharing it as a prefix", "[store]") {
    StoreFixture f;
    f.store.ensure_session("abc");
    f.store.ensure_session("abcdef");
    auto d = f.store.session_detail("abc");
    REQUIRE(d);
    REQUIRE(d->session.session_id == "abc");
}

TEST_CASE("Recent sessions are newest first with an optional workspace filter", "[store]") {
    StoreFixture f;
    seed(f.store);
    exec_sql(f.db_path, "UPDATE sessions SET started_at = '2025-01-01 10:00:00' WHERE session_id='session-abc123def456'");
    exec_sql(f.db_path, "UPDATE sessions SET started_at = '2025-03-01 10:00:00' WHERE session_id='session-xyz789ghi000'");
    exec_sql(f.db_path, "UPDATE sessions SET started_at = '2025-02-01 10:00:00' WHERE session_id='session-jwt-debug-999'");

    auto all = f.store.recent_sessions();
    REQUIRE(all.size() == 3);
    REQUIRE(all[0].session_id == "session-xyz789ghi000");
    REQUIRE(all[1].session_id == "session-jwt-debug-999");
    REQUIRE(all[2].session_id == "session-abc123def456");

    auto crustland = f.store.recent_sessions("crustland");
    REQUIRE(crustland.size() == 2);
    REQUIRE(crustland[0].session_id == "session-jwt-debug-999");

    REQUIRE(f.store.recent_sessions("", 1).size() == 1);
    REQUIRE(f.store.recent_sessions("no-such-workspace").empty());
}

TEST_CASE("Sessions started in the same second keep insertion recency", "[store]") {
    StoreFixture f;
    f.store.ensure_session("first");
    f.store.ensure_session("second");
    exec_sql(f.db_path, "UPDATE sessions SET started_at = '2025-05-05 05:05:05'");

    auto recent = f.store.recent_sessions();
    REQUIRE(recent.size() == 2);
    REQUIRE(recent[0].session_id == "second");
}

TEST_CASE("Stats aggregate sessions, turns and searches", "[store]") {
    StoreFixture f;

    auto empty = f.store.stats();
    REQUIRE(empty.total_sessions == 0);
    REQUIRE(empty.total_turns == 0);
    REQUIRE_FALSE(empty.last_indexed);
    REQUIRE(empty.total_searches == 0);
    REQUIRE(empty.avg_results == 0.0);

    seed(f.store);
    f.store.search("authentication");
    f.store.search("nonexistent-term-xyz");

    auto s = f.store.stats();
    REQUIRE(s.total_sessions == 3);
    REQUIRE(s.claude_sessions == 2);
    REQUIRE(s.codex_sessions == 1);
    REQUIRE(s.sessions_by_source.size() == 2);
    REQUIRE(s.total_turns == 4);
    REQUIRE(s.last_indexed);
    REQUIRE(s.total_searches == 2);
    REQUIRE(s.searches_with_hits == 1);
    REQUIRE(s.avg_results > 0.0);
}
