#include "pg_repository.hpp"

#include "internal/util/errors.hpp"

namespace streak::db::postgres {

namespace {

// BIGINT columns hold unsigned values; pqxx binds signed 64-bit.
int64_t S64(uint64_t v) {
  return static_cast<int64_t>(v);
}

model::PairStreakRecord ReadPairStreak(const pqxx::row& row) {
  model::PairStreakRecord r;
  r.id_a             = row[0].c_str();
  r.id_b             = row[1].c_str();
  r.current_streak   = row[2].as<uint32_t>();
  r.longest_streak   = row[3].as<uint32_t>();
  r.last_action_a_ms = row[4].as<uint64_t>();
  r.last_action_b_ms = row[5].as<uint64_t>();
  r.started_at_ms    = row[6].as<uint64_t>();
  r.expires_at_ms    = row[7].as<uint64_t>();
  r.version          = row[8].as<uint64_t>();
  return r;
}

model::HabitDayRecord ReadHabitDay(const pqxx::row& row) {
  model::HabitDayRecord r;
  r.user_id         = row[0].c_str();
  r.habit_id        = row[1].c_str();
  r.day             = row[2].c_str();
  r.completed       = row[3].as<bool>();
  r.snap_count      = row[4].as<uint32_t>();
  r.penalty_applied = row[5].as<uint32_t>();
  return r;
}

model::HabitRecord ReadHabit(const pqxx::row& row) {
  model::HabitRecord r;
  r.habit_id   = row[0].c_str();
  r.user_id    = row[1].c_str();
  r.active     = row[2].as<bool>();
  r.created_on = row[3].c_str();
  return r;
}

// Reads surface driver failures as StorageError.
template <typename Fn>
auto ReadOrThrow(const char* what, Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const pqxx::failure& e) {
    throw util::StorageError(std::string(what) + ": " + e.what());
  }
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Pair streaks
// ------------------------------------------------------------------

Result PgRepository::InsertPairStreak(Transaction& t, const model::PairStreakRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("insert_pair_streak", r.id_a, r.id_b, S64(r.current_streak),
                                          S64(r.longest_streak), S64(r.last_action_a_ms), S64(r.last_action_b_ms),
                                          S64(r.started_at_ms), S64(r.expires_at_ms), S64(r.version));
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::AlreadyExists);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::PairStreakRecord> PgRepository::GetPairStreak(Transaction& t, const std::string& id_a,
                                                                   const std::string& id_b) {
  auto res = ReadOrThrow("get_pair_streak", [&] { return TX(t).Work().exec_prepared("get_pair_streak", id_a, id_b); });
  if (res.empty()) return std::nullopt;
  return ReadPairStreak(res[0]);
}

Result PgRepository::CompareAndSwapPairStreak(Transaction& t, uint64_t expected_version,
                                              const model::PairStreakRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("cas_pair_streak", S64(r.current_streak), S64(r.longest_streak),
                                          S64(r.last_action_a_ms), S64(r.last_action_b_ms), S64(r.started_at_ms),
                                          S64(r.expires_at_ms), r.id_a, r.id_b, S64(expected_version));
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::Conflict, "pair streak version changed");
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::PairStreakRecord> PgRepository::ListPairStreaksForUser(Transaction& t, const std::string& user_id) {
  auto res = ReadOrThrow("list_pair_streaks_for_user",
                         [&] { return TX(t).Work().exec_prepared("list_pair_streaks_for_user", user_id); });

  std::vector<model::PairStreakRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadPairStreak(row));
  return out;
}

// ------------------------------------------------------------------
// Habit ledger
// ------------------------------------------------------------------

Result PgRepository::UpsertCompletion(Transaction& t, const std::string& user_id, const std::string& habit_id,
                                      const std::string& day) {
  try {
    TX(t).Work().exec_prepared("upsert_completion", user_id, habit_id, day);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::InsertMissIfAbsent(Transaction& t, const std::string& user_id, const std::string& habit_id,
                                        const std::string& day) {
  try {
    TX(t).Work().exec_prepared("insert_miss", user_id, habit_id, day);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::HabitDayRecord> PgRepository::GetHabitDay(Transaction& t, const std::string& user_id,
                                                               const std::string& habit_id, const std::string& day) {
  auto res = ReadOrThrow("get_habit_day",
                         [&] { return TX(t).Work().exec_prepared("get_habit_day", user_id, habit_id, day); });
  if (res.empty()) return std::nullopt;
  return ReadHabitDay(res[0]);
}

std::vector<model::HabitDayRecord> PgRepository::ListHabitDays(Transaction& t, const std::string& user_id,
                                                               const std::string& habit_id,
                                                               const std::string& from_day,
                                                               const std::string& to_day) {
  auto res = ReadOrThrow("list_habit_days", [&] {
    return TX(t).Work().exec_prepared("list_habit_days", user_id, habit_id, from_day, to_day);
  });

  std::vector<model::HabitDayRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadHabitDay(row));
  return out;
}

std::vector<model::HabitDayRecord> PgRepository::ListUserHabitDays(Transaction& t, const std::string& user_id,
                                                                   const std::string& from_day,
                                                                   const std::string& to_day) {
  auto res = ReadOrThrow("list_user_habit_days", [&] {
    return TX(t).Work().exec_prepared("list_user_habit_days", user_id, from_day, to_day);
  });

  std::vector<model::HabitDayRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadHabitDay(row));
  return out;
}

Result PgRepository::ClaimPenalty(Transaction& t, const std::string& user_id, const std::string& habit_id,
                                  const std::string& day, uint32_t penalty) {
  try {
    auto res = TX(t).Work().exec_prepared("claim_penalty", static_cast<int>(penalty), user_id, habit_id, day);
    if (res.affected_rows() == 1) return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }

  if (!GetHabitDay(t, user_id, habit_id, day)) return Result::Err(ErrorCode::NotFound);
  return Result::Err(ErrorCode::Conflict, "penalty already applied or day completed");
}

// ------------------------------------------------------------------
// Profiles
// ------------------------------------------------------------------

Result PgRepository::InsertProfile(Transaction& t, const model::ProfileRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("insert_profile", r.user_id, S64(r.score), S64(r.current_streak),
                                          S64(r.longest_streak), S64(r.version));
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::AlreadyExists);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::ProfileRecord> PgRepository::GetProfile(Transaction& t, const std::string& user_id) {
  auto res = ReadOrThrow("get_profile", [&] { return TX(t).Work().exec_prepared("get_profile", user_id); });
  if (res.empty()) return std::nullopt;

  model::ProfileRecord r;
  r.user_id        = res[0][0].c_str();
  r.score          = res[0][1].as<uint64_t>();
  r.current_streak = res[0][2].as<uint32_t>();
  r.longest_streak = res[0][3].as<uint32_t>();
  r.version        = res[0][4].as<uint64_t>();
  return r;
}

Result PgRepository::CompareAndSwapProfile(Transaction& t, uint64_t expected_version, const model::ProfileRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("cas_profile", S64(r.score), S64(r.current_streak), S64(r.longest_streak),
                                          r.user_id, S64(expected_version));
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::Conflict, "profile version changed");
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Habits
// ------------------------------------------------------------------

Result PgRepository::UpsertHabit(Transaction& t, const model::HabitRecord& r) {
  try {
    TX(t).Work().exec_prepared("upsert_habit", r.habit_id, r.user_id, r.active, r.created_on);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::HabitRecord> PgRepository::GetHabit(Transaction& t, const std::string& habit_id) {
  auto res = ReadOrThrow("get_habit", [&] { return TX(t).Work().exec_prepared("get_habit", habit_id); });
  if (res.empty()) return std::nullopt;
  return ReadHabit(res[0]);
}

std::vector<model::HabitRecord> PgRepository::ListActiveHabits(Transaction& t) {
  auto res = ReadOrThrow("list_active_habits", [&] { return TX(t).Work().exec_prepared("list_active_habits"); });

  std::vector<model::HabitRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadHabit(row));
  return out;
}

// ------------------------------------------------------------------
// Send tally
// ------------------------------------------------------------------

Result PgRepository::AddSnapsSent(Transaction& t, const std::string& user_id, uint64_t count) {
  try {
    TX(t).Work().exec_prepared("add_snaps_sent", user_id, S64(count));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

uint64_t PgRepository::GetSnapsSent(Transaction& t, const std::string& user_id) {
  auto res = ReadOrThrow("get_snaps_sent", [&] { return TX(t).Work().exec_prepared("get_snaps_sent", user_id); });
  if (res.empty()) return 0;
  return res[0][0].as<uint64_t>();
}

}
