#include "sqlite_logger.hpp"
#include <chrono>
#include <filesystem>
#include <stdexcept>

namespace diktat {

static void exec_sql(sqlite3* db, const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw std::runtime_error("SQLite exec failed: " + msg);
    }
}

AttemptLogger::AttemptLogger(const std::string& dbPath)
    : dbPath_(dbPath)
    , db_(nullptr, sqlite3_close) {
    if (dbPath != ":memory:") {
        std::filesystem::path parent = std::filesystem::path(dbPath).parent_path();
        if (!parent.empty()) std::filesystem::create_directories(parent);
    }

    sqlite3* raw = nullptr;
    int rc = sqlite3_open(dbPath.c_str(), &raw);
    db_.reset(raw); // sqlite3_open hands out a handle even on failure
    if (rc != SQLITE_OK) {
        throw std::runtime_error("Cannot open SQLite DB at " + dbPath + ": " +
                                 (raw ? sqlite3_errmsg(raw) : "out of memory"));
    }
    initSchema();
}

void AttemptLogger::initSchema() {
    const char* schema = R"SQL(
    PRAGMA journal_mode=WAL;
    CREATE TABLE IF NOT EXISTS sessions (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        exercise_id TEXT NOT NULL,
        started_ms INTEGER NOT NULL,
        ended_ms INTEGER,
        preserve_case INTEGER NOT NULL DEFAULT 0
    );
    CREATE TABLE IF NOT EXISTS attempts (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        session_id INTEGER NOT NULL,
        sentence_index INTEGER NOT NULL,
        reference TEXT NOT NULL,
        candidate TEXT NOT NULL,
        correct_words INTEGER NOT NULL,
        reference_words INTEGER NOT NULL,
        ts_ms INTEGER NOT NULL,
        FOREIGN KEY(session_id) REFERENCES sessions(id)
    );
    )SQL";
    exec_sql(db_.get(), schema);
}

void AttemptLogger::check(int rc, const char* what) const {
    if (rc != SQLITE_OK) {
        throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db_.get()));
    }
}

AttemptLogger::Statement AttemptLogger::prepare(const char* sql) const {
    sqlite3_stmt* st = nullptr;
    int rc = sqlite3_prepare_v2(db_.get(), sql, -1, &st, nullptr);
    Statement stmt(st, sqlite3_finalize);
    check(rc, "Failed to prepare statement");
    return stmt;
}

std::int64_t AttemptLogger::nowMs() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

std::int64_t AttemptLogger::startSession(const std::string& exerciseId, bool preserveCase) {
    auto st = prepare("INSERT INTO sessions (exercise_id, started_ms, preserve_case) VALUES (?, ?, ?);");
    check(sqlite3_bind_text(st.get(), 1, exerciseId.c_str(), -1, SQLITE_TRANSIENT), "Failed to bind exercise id");
    check(sqlite3_bind_int64(st.get(), 2, nowMs()), "Failed to bind start time");
    check(sqlite3_bind_int(st.get(), 3, preserveCase ? 1 : 0), "Failed to bind case flag");
    if (sqlite3_step(st.get()) != SQLITE_DONE) {
        throw std::runtime_error(std::string("Failed to insert session: ") + sqlite3_errmsg(db_.get()));
    }
    return sqlite3_last_insert_rowid(db_.get());
}

void AttemptLogger::endSession(std::int64_t sessionId) {
    auto st = prepare("UPDATE sessions SET ended_ms=? WHERE id=?;");
    check(sqlite3_bind_int64(st.get(), 1, nowMs()), "Failed to bind end time");
    check(sqlite3_bind_int64(st.get(), 2, sessionId), "Failed to bind session id");
    if (sqlite3_step(st.get()) != SQLITE_DONE) {
        throw std::runtime_error(std::string("Failed to end session: ") + sqlite3_errmsg(db_.get()));
    }
    if (sqlite3_changes(db_.get()) == 0) {
        throw std::runtime_error("No session with id " + std::to_string(sessionId));
    }
}

void AttemptLogger::logAttempt(std::int64_t sessionId,
                               std::size_t sentenceIndex,
                               const std::string& reference,
                               const std::string& candidate,
                               std::size_t correctWords,
                               std::size_t referenceWords) {
    auto st = prepare("INSERT INTO attempts (session_id, sentence_index, reference, candidate, "
                      "correct_words, reference_words, ts_ms) VALUES (?, ?, ?, ?, ?, ?, ?);");
    check(sqlite3_bind_int64(st.get(), 1, sessionId), "Failed to bind session id");
    check(sqlite3_bind_int64(st.get(), 2, static_cast<sqlite3_int64>(sentenceIndex)), "Failed to bind sentence index");
    check(sqlite3_bind_text(st.get(), 3, reference.c_str(), -1, SQLITE_TRANSIENT), "Failed to bind reference");
    check(sqlite3_bind_text(st.get(), 4, candidate.c_str(), -1, SQLITE_TRANSIENT), "Failed to bind candidate");
    check(sqlite3_bind_int64(st.get(), 5, static_cast<sqlite3_int64>(correctWords)), "Failed to bind correct words");
    check(sqlite3_bind_int64(st.get(), 6, static_cast<sqlite3_int64>(referenceWords)), "Failed to bind reference words");
    check(sqlite3_bind_int64(st.get(), 7, nowMs()), "Failed to bind timestamp");
    if (sqlite3_step(st.get()) != SQLITE_DONE) {
        throw std::runtime_error(std::string("Failed to insert attempt: ") + sqlite3_errmsg(db_.get()));
    }
}

std::int64_t AttemptLogger::attemptCount(std::int64_t sessionId) const {
    auto st = prepare("SELECT COUNT(*) FROM attempts WHERE session_id=?;");
    check(sqlite3_bind_int64(st.get(), 1, sessionId), "Failed to bind session id");
    if (sqlite3_step(st.get()) != SQLITE_ROW) {
        throw std::runtime_error(std::string("Failed to count attempts: ") + sqlite3_errmsg(db_.get()));
    }
    return sqlite3_column_int64(st.get(), 0);
}

} // namespace diktat
