#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/habit_day_record.hpp"
#include "internal/db/model/habit_record.hpp"
#include "internal/db/model/pair_streak_record.hpp"
#include "internal/db/model/profile_record.hpp"

namespace streak::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes happen inside a Transaction
  - Reads inside a transaction see its writes
  - Compare-and-swap writes check and bump the version atomically
  - Streak and score correctness depends on this behavior

  Read failures throw util::StorageError; "no row" is std::nullopt.

  The DB is the source of truth for:
    pair streaks
    habit ledger
    score profiles
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Pair streaks
  // ---------------------------------------------------------------------

  // AlreadyExists if the pair row is present; the existing row is untouched.
  virtual Result InsertPairStreak(Transaction&, const model::PairStreakRecord&) = 0;

  virtual std::optional<model::PairStreakRecord> GetPairStreak(Transaction&, const std::string& id_a, const std::string& id_b) = 0;

  // Stores the record with version = expected_version + 1 only if the stored
  // version equals expected_version. Conflict otherwise.
  virtual Result CompareAndSwapPairStreak(Transaction&, uint64_t expected_version, const model::PairStreakRecord&) = 0;

  virtual std::vector<model::PairStreakRecord> ListPairStreaksForUser(Transaction&, const std::string& user_id) = 0;

  // ---------------------------------------------------------------------
  // Habit ledger
  // ---------------------------------------------------------------------

  // completed = true, snap_count += 1. Creates the row on first call.
  virtual Result UpsertCompletion(Transaction&, const std::string& user_id, const std::string& habit_id, const std::string& day) = 0;

  // Creates a completed = false row; an existing row is left as is.
  virtual Result InsertMissIfAbsent(Transaction&, const std::string& user_id, const std::string& habit_id, const std::string& day) = 0;

  virtual std::optional<model::HabitDayRecord> GetHabitDay(Transaction&, const std::string& user_id, const std::string& habit_id,
                                                           const std::string& day) = 0;

  // Rows with from_day <= day <= to_day, newest first.
  virtual std::vector<model::HabitDayRecord> ListHabitDays(Transaction&, const std::string& user_id, const std::string& habit_id,
                                                           const std::string& from_day, const std::string& to_day) = 0;

  // All habits of a user, newest first.
  virtual std::vector<model::HabitDayRecord> ListUserHabitDays(Transaction&, const std::string& user_id, const std::string& from_day,
                                                               const std::string& to_day) = 0;

  // Sets penalty_applied on a missed day only if it is still 0. Conflict
  // when already charged (or the day is completed), NotFound without a row.
  virtual Result ClaimPenalty(Transaction&, const std::string& user_id, const std::string& habit_id, const std::string& day,
                              uint32_t penalty) = 0;

  // ---------------------------------------------------------------------
  // Score profiles
  // ---------------------------------------------------------------------

  // AlreadyExists if the profile is present.
  virtual Result InsertProfile(Transaction&, const model::ProfileRecord&) = 0;

  virtual std::optional<model::ProfileRecord> GetProfile(Transaction&, const std::string& user_id) = 0;

  virtual Result CompareAndSwapProfile(Transaction&, uint64_t expected_version, const model::ProfileRecord&) = 0;

  // ---------------------------------------------------------------------
  // Habits
  // ---------------------------------------------------------------------

  virtual Result UpsertHabit(Transaction&, const model::HabitRecord&) = 0;

  virtual std::optional<model::HabitRecord> GetHabit(Transaction&, const std::string& habit_id) = 0;

  // Ordered by (user_id, habit_id).
  virtual std::vector<model::HabitRecord> ListActiveHabits(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Snap send tally
  // ---------------------------------------------------------------------

  virtual Result AddSnapsSent(Transaction&, const std::string& user_id, uint64_t count) = 0;

  virtual uint64_t GetSnapsSent(Transaction&, const std::string& user_id) = 0;
};

} // namespace streak::db
