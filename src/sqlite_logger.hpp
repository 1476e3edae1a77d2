#pragma once
#include <sqlite3.h>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace diktat {

// Persistent log of practice sessions and the answers typed in them.
// Schema:
//  - sessions(id INTEGER PK, exercise_id TEXT, started_ms INTEGER, ended_ms INTEGER, preserve_case INTEGER)
//  - attempts(id INTEGER PK, session_id INTEGER, sentence_index INTEGER, reference TEXT,
//             candidate TEXT, correct_words INTEGER, reference_words INTEGER, ts_ms INTEGER)
//
// Times are wall clock milliseconds since the epoch. Every failing SQLite
// call throws std::runtime_error. Not thread-safe.
class AttemptLogger {
public:
    // ":memory:" opens a private in-memory database.
    explicit AttemptLogger(const std::string& dbPath);

    // Begins a session; returns the new session id.
    std::int64_t startSession(const std::string& exerciseId, bool preserveCase);

    // Marks end time for a session.
    void endSession(std::int64_t sessionId);

    void logAttempt(std::int64_t sessionId,
                    std::size_t sentenceIndex,
                    const std::string& reference,
                    const std::string& candidate,
                    std::size_t correctWords,
                    std::size_t referenceWords);

    std::int64_t attemptCount(std::int64_t sessionId) const;

    const std::string& path() const { return dbPath_; }

private:
    using Statement = std::unique_ptr<sqlite3_stmt, int(*)(sqlite3_stmt*)>;

    void initSchema();
    Statement prepare(const char* sql) const;
    void check(int rc, const char* what) const;
    static std::int64_t nowMs();

    std::string dbPath_;
    std::unique_ptr<sqlite3, int(*)(sqlite3*)> db_;
};

} // namespace diktat
