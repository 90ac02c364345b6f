#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include "internal/db/sql/sql_queries.hpp"
#include "internal/util/errors.hpp"

namespace streak::db::sqlite {

using streak::db::ErrorCode;
using streak::db::Result;

namespace {

using StmtPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

// Read paths throw; write paths report through Result.
StmtPtr PrepareOrThrow(sqlite3* db, const char* sql) {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
        throw util::StorageError(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
    }
    return StmtPtr(st, &sqlite3_finalize);
}

StmtPtr TryPrepare(sqlite3* db, const char* sql) {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
        return StmtPtr(nullptr, &sqlite3_finalize);
    }
    return StmtPtr(st, &sqlite3_finalize);
}

// SQLITE_ROW -> true, SQLITE_DONE -> false, anything else throws.
bool StepRow(sqlite3* db, sqlite3_stmt* st) {
    const int rc = sqlite3_step(st);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw util::StorageError(std::string("sqlite step: ") + sqlite3_errmsg(db));
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

uint32_t ColU32(sqlite3_stmt* st, int col) {
    return static_cast<uint32_t>(sqlite3_column_int64(st, col));
}

model::PairStreakRecord ReadPairStreak(sqlite3_stmt* st) {
    model::PairStreakRecord r;
    r.id_a = ColText(st, 0);
    r.id_b = ColText(st, 1);
    r.current_streak = ColU32(st, 2);
    r.longest_streak = ColU32(st, 3);
    r.last_action_a_ms = ColU64(st, 4);
    r.last_action_b_ms = ColU64(st, 5);
    r.started_at_ms = ColU64(st, 6);
    r.expires_at_ms = ColU64(st, 7);
    r.version = ColU64(st, 8);
    return r;
}

model::HabitDayRecord ReadHabitDay(sqlite3_stmt* st) {
    model::HabitDayRecord r;
    r.user_id = ColText(st, 0);
    r.habit_id = ColText(st, 1);
    r.day = ColText(st, 2);
    r.completed = sqlite3_column_int(st, 3) != 0;
    r.snap_count = ColU32(st, 4);
    r.penalty_applied = ColU32(st, 5);
    return r;
}

model::HabitRecord ReadHabit(sqlite3_stmt* st) {
    model::HabitRecord r;
    r.habit_id = ColText(st, 0);
    r.user_id = ColText(st, 1);
    r.active = sqlite3_column_int(st, 2) != 0;
    r.created_on = ColText(st, 3);
    return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Pair streaks
// ------------------------------------------------------------------

Result SqliteRepository::InsertPairStreak(Transaction& t, const model::PairStreakRecord& r) {
    auto* db = TX(t).Handle();

    auto st = TryPrepare(db, sql::INSERT_PAIR_STREAK);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.id_a);
    BindText(st.get(), 2, r.id_b);
    BindU64(st.get(), 3, r.current_streak);
    BindU64(st.get(), 4, r.longest_streak);
    BindU64(st.get(), 5, r.last_action_a_ms);
    BindU64(st.get(), 6, r.last_action_b_ms);
    BindU64(st.get(), 7, r.started_at_ms);
    BindU64(st.get(), 8, r.expires_at_ms);
    BindU64(st.get(), 9, r.version);

    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);

    // ON CONFLICT DO NOTHING: zero changes means the pair already exists
    if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::AlreadyExists);
    return Result::Ok();
}

std::optional<model::PairStreakRecord>
SqliteRepository::GetPairStreak(Transaction& t, const std::string& id_a, const std::string& id_b) {
    auto* db = TX(t).Handle();

    auto st = PrepareOrThrow(db, sql::SELECT_PAIR_STREAK);
    BindText(st.get(), 1, id_a);
    BindText(st.get(), 2, id_b);

    if (!StepRow(db, st.get())) return std::nullopt;
    return ReadPairStreak(st.get());
}

Result SqliteRepository::CompareAndSwapPairStreak(Transaction& t, uint64_t expected_version,
                                                  const model::PairStreakRecord& r) {
    auto* db = TX(t).Handle();

    auto st = TryPrepare(db, sql::CAS_PAIR_STREAK);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindU64(st.get(), 1, r.current_streak);
    BindU64(st.get(), 2, r.longest_streak);
    BindU64(st.get(), 3, r.last_action_a_ms);
    BindU64(st.get(), 4, r.last_action_b_ms);
    BindU64(st.get(), 5, r.started_at_ms);
    BindU64(st.get(), 6, r.expires_at_ms);
    BindText(st.get(), 7, r.id_a);
    BindText(st.get(), 8, r.id_b);
    BindU64(st.get(), 9, expected_version);

    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);

    if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::Conflict, "pair streak version changed");
    return Result::Ok();
}

std::vector<model::PairStreakRecord>
SqliteRepository::ListPairStreaksForUser(Transaction& t, const std::string& user_id) {
    auto* db = TX(t).Handle();

    auto st = PrepareOrThrow(db, sql::SELECT_PAIR_STREAKS_FOR_USER);
    BindText(st.get(), 1, user_id);
    BindText(st.get(), 2, user_id);

    std::vector<model::PairStreakRecord> out;
    while (StepRow(db, st.get())) {
        out.push_back(ReadPairStreak(st.get()));
    }
    return out;
}

// ------------------------------------------------------------------
// Habit ledger
// ------------------------------------------------------------------

Result SqliteRepository::UpsertCompletion(Transaction& t, const std::string& user_id, const std::string& habit_id,
                                          const std::string& day) {
    auto* db = TX(t).Handle();

    auto st = TryPrepare(db, sql::UPSERT_COMPLETION);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, user_id);
    BindText(st.get(), 2, habit_id);
    BindText(st.get(), 3, day);

    return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::InsertMissIfAbsent(Transaction& t, const std::string& user_id, const std::string& habit_id,
                                            const std::string& day) {
    auto* db = TX(t).Handle();

    auto st = TryPrepare(db, sql::INSERT_MISS);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, user_id);
    BindText(st.get(), 2, habit_id);
    BindText(st.get(), 3, day);

    return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::HabitDayRecord>
SqliteRepository::GetHabitDay(Transaction& t, const std::string& user_id, const std::string& habit_id,
                              const std::string& day) {
    auto* db = TX(t).Handle();

    auto st = PrepareOrThrow(db, sql::SELECT_HABIT_DAY);
    BindText(st.get(), 1, user_id);
    BindText(st.get(), 2, habit_id);
    BindText(st.get(), 3, day);

    if (!StepRow(db, st.get())) return std::nullopt;
    return ReadHabitDay(st.get());
}

std::vector<model::HabitDayRecord>
SqliteRepository::ListHabitDays(Transaction& t, const std::string& user_id, const std::string& habit_id,
                                const std::string& from_day, const std::string& to_day) {
    auto* db = TX(t).Handle();

    auto st = PrepareOrThrow(db, sql::SELECT_HABIT_DAYS);
    BindText(st.get(), 1, user_id);
    BindText(st.get(), 2, habit_id);
    BindText(st.get(), 3, from_day);
    BindText(st.get(), 4, to_day);

    std::vector<model::HabitDayRecord> out;
    while (StepRow(db, st.get())) {
        out.push_back(ReadHabitDay(st.get()));
    }
    return out;
}

std::vector<model::HabitDayRecord>
SqliteRepository::ListUserHabitDays(Transaction& t, const std::string& user_id, const std::string& from_day,
                                    const std::string& to_day) {
    auto* db = TX(t).Handle();

    auto st = PrepareOrThrow(db, sql::SELECT_USER_HABIT_DAYS);
    BindText(st.get(), 1, user_id);
    BindText(st.get(), 2, from_day);
    BindText(st.get(), 3, to_day);

    std::vector<model::HabitDayRecord> out;
    while (StepRow(db, st.get())) {
        out.push_back(ReadHabitDay(st.get()));
    }
    return out;
}

Result SqliteRepository::ClaimPenalty(Transaction& t, const std::string& user_id, const std::string& habit_id,
                                      const std::string& day, uint32_t penalty) {
    auto* db = TX(t).Handle();

    auto st = TryPrepare(db, sql::CLAIM_PENALTY);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindU64(st.get(), 1, penalty);
    BindText(st.get(), 2, user_id);
    BindText(st.get(), 3, habit_id);
    BindText(st.get(), 4, day);

    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);

    if (sqlite3_changes(db) == 1) return Result::Ok();
    if (!GetHabitDay(t, user_id, habit_id, day)) return Result::Err(ErrorCode::NotFound);
    return Result::Err(ErrorCode::Conflict, "penalty already applied or day completed");
}

// ------------------------------------------------------------------
// Profiles
// ------------------------------------------------------------------

Result SqliteRepository::InsertProfile(Transaction& t, const model::ProfileRecord& r) {
    auto* db = TX(t).Handle();

    auto st = TryPrepare(db, sql::INSERT_PROFILE);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.user_id);
    BindU64(st.get(), 2, r.score);
    BindU64(st.get(), 3, r.current_streak);
    BindU64(st.get(), 4, r.longest_streak);
    BindU64(st.get(), 5, r.version);

    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);

    if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::AlreadyExists);
    return Result::Ok();
}

std::optional<model::ProfileRecord> SqliteRepository::GetProfile(Transaction& t, const std::string& user_id) {
    auto* db = TX(t).Handle();

    auto st = PrepareOrThrow(db, sql::SELECT_PROFILE);
    BindText(st.get(), 1, user_id);

    if (!StepRow(db, st.get())) return std::nullopt;

    model::ProfileRecord r;
    r.user_id = ColText(st.get(), 0);
    r.score = ColU64(st.get(), 1);
    r.current_streak = ColU32(st.get(), 2);
    r.longest_streak = ColU32(st.get(), 3);
    r.version = ColU64(st.get(), 4);
    return r;
}

Result SqliteRepository::CompareAndSwapProfile(Transaction& t, uint64_t expected_version,
                                               const model::ProfileRecord& r) {
    auto* db = TX(t).Handle();

    auto st = TryPrepare(db, sql::CAS_PROFILE);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindU64(st.get(), 1, r.score);
    BindU64(st.get(), 2, r.current_streak);
    BindU64(st.get(), 3, r.longest_streak);
    BindText(st.get(), 4, r.user_id);
    BindU64(st.get(), 5, expected_version);

    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);

    if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::Conflict, "profile version changed");
    return Result::Ok();
}

// ------------------------------------------------------------------
// Habits
// ------------------------------------------------------------------

Result SqliteRepository::UpsertHabit(Transaction& t, const model::HabitRecord& r) {
    auto* db = TX(t).Handle();

    auto st = TryPrepare(db, sql::UPSERT_HABIT);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.habit_id);
    BindText(st.get(), 2, r.user_id);
    sqlite3_bind_int(st.get(), 3, r.active ? 1 : 0);
    BindText(st.get(), 4, r.created_on);

    return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::HabitRecord> SqliteRepository::GetHabit(Transaction& t, const std::string& habit_id) {
    auto* db = TX(t).Handle();

    auto st = PrepareOrThrow(db, sql::SELECT_HABIT);
    BindText(st.get(), 1, habit_id);

    if (!StepRow(db, st.get())) return std::nullopt;
    return ReadHabit(st.get());
}

std::vector<model::HabitRecord> SqliteRepository::ListActiveHabits(Transaction& t) {
    auto* db = TX(t).Handle();

    auto st = PrepareOrThrow(db, sql::SELECT_ACTIVE_HABITS);

    std::vector<model::HabitRecord> out;
    while (StepRow(db, st.get())) {
        out.push_back(ReadHabit(st.get()));
    }
    return out;
}

// ------------------------------------------------------------------
// Send tally
// ------------------------------------------------------------------

Result SqliteRepository::AddSnapsSent(Transaction& t, const std::string& user_id, uint64_t count) {
    auto* db = TX(t).Handle();

    auto st = TryPrepare(db, sql::ADD_SNAPS_SENT);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, user_id);
    BindU64(st.get(), 2, count);

    return Translate(db, sqlite3_step(st.get()));
}

uint64_t SqliteRepository::GetSnapsSent(Transaction& t, const std::string& user_id) {
    auto* db = TX(t).Handle();

    auto st = PrepareOrThrow(db, sql::SELECT_SNAPS_SENT);
    BindText(st.get(), 1, user_id);

    if (!StepRow(db, st.get())) return 0;
    return ColU64(st.get(), 0);
}

} // namespace streak::db::sqlite
