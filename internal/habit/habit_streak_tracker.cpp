#include "habit_streak_tracker.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"

namespace streak::habit {

namespace {

using std::chrono::days;

model::HabitDay FromRecord(const db::model::HabitDayRecord& record) {
  model::HabitDay day;
  day.user_id         = record.user_id;
  day.habit_id        = record.habit_id;
  day.date            = util::ParseDate(record.day);
  day.completed       = record.completed;
  day.snap_count      = record.snap_count;
  day.penalty_applied = record.penalty_applied;
  return day;
}

void RequireIds(const std::string& user_id, const std::string& habit_id) {
  if (user_id.empty() || habit_id.empty()) {
    throw util::InvalidArgument("user id and habit id must not be empty");
  }
}

} // namespace

HabitStreakTracker::HabitStreakTracker(std::shared_ptr<db::Repository> repository, TrackerOptions options)
    : repository_(std::move(repository)), options_(options) {
  options_.streak_lookback_days = std::max<uint32_t>(options_.streak_lookback_days, 1);
  options_.miss_lookback_days   = std::max<uint32_t>(options_.miss_lookback_days, 1);
}

uint32_t HabitStreakTracker::RecordCompletion(const std::string& user_id, const std::string& habit_id,
                                              util::Date date) {
  auto       tx     = repository_->Begin();
  const auto streak = RecordCompletion(*tx, user_id, habit_id, date);
  tx->Commit();
  return streak;
}

uint32_t HabitStreakTracker::RecordCompletion(db::Transaction& tx, const std::string& user_id,
                                              const std::string& habit_id, util::Date date) {
  RequireIds(user_id, habit_id);
  db::ThrowIfDbError(repository_->UpsertCompletion(tx, user_id, habit_id, util::FormatDate(date)),
                     "record completion");
  return CurrentStreak(tx, user_id, habit_id, date);
}

MissOutcome HabitStreakTracker::RecordMiss(const std::string& user_id, const std::string& habit_id, util::Date date) {
  auto       tx      = repository_->Begin();
  const auto outcome = RecordMiss(*tx, user_id, habit_id, date);
  tx->Commit();
  return outcome;
}

MissOutcome HabitStreakTracker::RecordMiss(db::Transaction& tx, const std::string& user_id,
                                           const std::string& habit_id, util::Date date) {
  RequireIds(user_id, habit_id);
  const auto day = util::FormatDate(date);
  db::ThrowIfDbError(repository_->InsertMissIfAbsent(tx, user_id, habit_id, day), "record miss");

  const auto row = repository_->GetHabitDay(tx, user_id, habit_id, day);
  if (!row) {
    throw util::StorageError("habit day " + user_id + "/" + habit_id + "/" + day + " missing after insert");
  }

  MissOutcome outcome;
  outcome.completed       = row->completed;
  outcome.penalty_applied = row->penalty_applied;

  const auto from = util::FormatDate(date - days(options_.miss_lookback_days));
  const auto to   = util::FormatDate(date - days(1));

  auto expected = date - days(1);
  for (const auto& prior : repository_->ListHabitDays(tx, user_id, habit_id, from, to)) {
    if (util::ParseDate(prior.day) != expected || prior.completed) {
      break;
    }
    ++outcome.consecutive_misses;
    expected -= days(1);
  }
  return outcome;
}

bool HabitStreakTracker::ClaimPenalty(db::Transaction& tx, const std::string& user_id, const std::string& habit_id,
                                      util::Date date, uint32_t penalty) {
  if (penalty == 0) {
    throw util::InvalidArgument("penalty must be positive");
  }

  const auto result = repository_->ClaimPenalty(tx, user_id, habit_id, util::FormatDate(date), penalty);
  if (result.code == db::ErrorCode::Conflict) {
    return false;
  }
  db::ThrowIfDbError(result, "claim penalty");
  return true;
}

uint32_t HabitStreakTracker::CurrentStreak(const std::string& user_id, const std::string& habit_id,
                                           util::Date as_of) {
  auto       tx     = repository_->Begin();
  const auto streak = CurrentStreak(*tx, user_id, habit_id, as_of);
  tx->Commit();
  return streak;
}

uint32_t HabitStreakTracker::CurrentStreak(db::Transaction& tx, const std::string& user_id,
                                           const std::string& habit_id, util::Date as_of) {
  const auto from = util::FormatDate(as_of - days(options_.streak_lookback_days - 1));
  const auto rows = repository_->ListHabitDays(tx, user_id, habit_id, from, util::FormatDate(as_of));
  if (rows.empty()) {
    return 0;
  }

  uint32_t streak   = 0;
  auto     expected = util::ParseDate(rows.front().day);
  for (const auto& row : rows) {
    if (util::ParseDate(row.day) != expected || !row.completed) {
      break;
    }
    ++streak;
    expected -= days(1);
  }
  return streak;
}

uint32_t HabitStreakTracker::LongestStreak(const std::string& user_id, const std::string& habit_id,
                                           util::Date as_of) {
  const auto from = util::FormatDate(as_of - days(options_.streak_lookback_days - 1));

  auto tx   = repository_->Begin();
  auto rows = repository_->ListHabitDays(*tx, user_id, habit_id, from, util::FormatDate(as_of));
  tx->Commit();

  uint32_t                  longest = 0;
  uint32_t                  run     = 0;
  std::optional<util::Date> previous;
  for (const auto& row : rows) {
    const auto date = util::ParseDate(row.day);
    if (!row.completed) {
      run = 0;
    } else if (previous && *previous - days(1) == date && run > 0) {
      ++run;
    } else {
      run = 1;
    }
    longest  = std::max(longest, run);
    previous = date;
  }
  return longest;
}

std::optional<model::HabitDay> HabitStreakTracker::GetDay(const std::string& user_id, const std::string& habit_id,
                                                          util::Date date) {
  auto tx  = repository_->Begin();
  auto row = repository_->GetHabitDay(*tx, user_id, habit_id, util::FormatDate(date));
  tx->Commit();

  if (!row) {
    return std::nullopt;
  }
  return FromRecord(*row);
}

std::vector<model::HabitDay> HabitStreakTracker::ListUserDays(const std::string& user_id, util::Date from,
                                                              util::Date to) {
  auto tx   = repository_->Begin();
  auto rows = repository_->ListUserHabitDays(*tx, user_id, util::FormatDate(from), util::FormatDate(to));
  tx->Commit();

  std::vector<model::HabitDay> out;
  out.reserve(rows.size());
  for (const auto& row : rows) {
    out.push_back(FromRecord(row));
  }
  return out;
}

} // namespace streak::habit
