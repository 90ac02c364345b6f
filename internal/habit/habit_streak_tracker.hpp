#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/habit_day.hpp"
#include "internal/util/time.hpp"

namespace streak::habit {

struct TrackerOptions {
  uint32_t streak_lookback_days = 30;
  uint32_t miss_lookback_days   = 7;
};

struct MissOutcome {
  // consecutive missed days immediately before the recorded date
  uint32_t consecutive_misses = 0;
  // the day already had a completion; no penalty is due
  bool completed = false;
  // penalty already charged for this day (0 = not charged)
  uint32_t penalty_applied = 0;
};

/*
  Per-user, per-habit daily ledger.

  Rows are explicit: a day without a row is a gap, and a gap breaks a
  streak the same way a missed day does. Upserts are idempotent per
  (user, habit, date).

  The Transaction& overloads let ScoringEngine put the ledger write and the
  profile update in one transaction.
*/
class HabitStreakTracker {
 public:
  explicit HabitStreakTracker(std::shared_ptr<db::Repository> repository, TrackerOptions options = {});

  uint32_t RecordCompletion(const std::string& user_id, const std::string& habit_id, util::Date date);
  uint32_t RecordCompletion(db::Transaction& tx, const std::string& user_id, const std::string& habit_id,
                            util::Date date);

  // Never downgrades a completed day.
  MissOutcome RecordMiss(const std::string& user_id, const std::string& habit_id, util::Date date);
  MissOutcome RecordMiss(db::Transaction& tx, const std::string& user_id, const std::string& habit_id,
                         util::Date date);

  // False when the day is completed or already charged.
  bool ClaimPenalty(db::Transaction& tx, const std::string& user_id, const std::string& habit_id, util::Date date,
                    uint32_t penalty);

  // Run of completed days ending at the newest row on or before as_of.
  uint32_t CurrentStreak(const std::string& user_id, const std::string& habit_id, util::Date as_of);
  // Longest run of completed days inside the lookback window ending at as_of.
  uint32_t LongestStreak(const std::string& user_id, const std::string& habit_id, util::Date as_of);

  std::optional<model::HabitDay> GetDay(const std::string& user_id, const std::string& habit_id, util::Date date);

  // All habits of a user in [from, to], newest first.
  std::vector<model::HabitDay> ListUserDays(const std::string& user_id, util::Date from, util::Date to);

  const TrackerOptions& Options() const {
    return options_;
  }

 private:
  uint32_t CurrentStreak(db::Transaction& tx, const std::string& user_id, const std::string& habit_id,
                         util::Date as_of);

  std::shared_ptr<db::Repository> repository_;
  TrackerOptions                  options_;
};

} // namespace streak::habit
