#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace streak::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Pair streaks
// ------------------------------------------------------------------

Result MemoryRepository::InsertPairStreak(Transaction& t, const model::PairStreakRecord& r) {
  auto& s = TX(t).Mutable();
  if (r.id_a >= r.id_b) return Result::Err(ErrorCode::ConstraintViolation, "pair key must satisfy id_a < id_b");
  auto [_, inserted] = s.pair_streaks.try_emplace(PairKey{r.id_a, r.id_b}, r);
  if (!inserted) return Result::Err(ErrorCode::AlreadyExists);
  return Result::Ok();
}

std::optional<model::PairStreakRecord> MemoryRepository::GetPairStreak(Transaction& t, const std::string& id_a,
                                                                       const std::string& id_b) {
  const auto& s  = TX(t).View();
  auto        it = s.pair_streaks.find(PairKey{id_a, id_b});
  if (it == s.pair_streaks.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::CompareAndSwapPairStreak(Transaction& t, uint64_t expected_version,
                                                  const model::PairStreakRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.pair_streaks.find(PairKey{r.id_a, r.id_b});
  if (it == s.pair_streaks.end()) return Result::Err(ErrorCode::NotFound);
  if (it->second.version != expected_version) return Result::Err(ErrorCode::Conflict, "pair streak version changed");

  it->second         = r;
  it->second.version = expected_version + 1;
  return Result::Ok();
}

std::vector<model::PairStreakRecord> MemoryRepository::ListPairStreaksForUser(Transaction& t, const std::string& user_id) {
  std::vector<model::PairStreakRecord> out;
  for (const auto& [key, record] : TX(t).View().pair_streaks) {
    if (key.first == user_id || key.second == user_id) out.push_back(record);
  }
  return out;
}

// ------------------------------------------------------------------
// Habit ledger
// ------------------------------------------------------------------

Result MemoryRepository::UpsertCompletion(Transaction& t, const std::string& user_id, const std::string& habit_id,
                                          const std::string& day) {
  auto& s      = TX(t).Mutable();
  auto [it, _] = s.habit_days.try_emplace(DayKey{user_id, habit_id, day}, model::HabitDayRecord{user_id, habit_id, day});
  it->second.completed = true;
  it->second.snap_count++;
  return Result::Ok();
}

Result MemoryRepository::InsertMissIfAbsent(Transaction& t, const std::string& user_id, const std::string& habit_id,
                                            const std::string& day) {
  TX(t).Mutable().habit_days.try_emplace(DayKey{user_id, habit_id, day}, model::HabitDayRecord{user_id, habit_id, day});
  return Result::Ok();
}

std::optional<model::HabitDayRecord> MemoryRepository::GetHabitDay(Transaction& t, const std::string& user_id,
                                                                   const std::string& habit_id, const std::string& day) {
  const auto& s  = TX(t).View();
  auto        it = s.habit_days.find(DayKey{user_id, habit_id, day});
  if (it == s.habit_days.end()) return std::nullopt;
  return it->second;
}

std::vector<model::HabitDayRecord> MemoryRepository::ListHabitDays(Transaction& t, const std::string& user_id,
                                                                   const std::string& habit_id, const std::string& from_day,
                                                                   const std::string& to_day) {
  const auto& s     = TX(t).View();
  auto        first = s.habit_days.lower_bound(DayKey{user_id, habit_id, from_day});
  auto        last  = s.habit_days.upper_bound(DayKey{user_id, habit_id, to_day});

  std::vector<model::HabitDayRecord> out;
  for (auto it = first; it != last; ++it) out.push_back(it->second);
  std::reverse(out.begin(), out.end());
  return out;
}

std::vector<model::HabitDayRecord> MemoryRepository::ListUserHabitDays(Transaction& t, const std::string& user_id,
                                                                       const std::string& from_day,
                                                                       const std::string& to_day) {
  std::vector<model::HabitDayRecord> out;
  for (const auto& [key, record] : TX(t).View().habit_days) {
    if (record.user_id == user_id && record.day >= from_day && record.day <= to_day) out.push_back(record);
  }
  std::stable_sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.day > b.day; });
  return out;
}

Result MemoryRepository::ClaimPenalty(Transaction& t, const std::string& user_id, const std::string& habit_id,
                                      const std::string& day, uint32_t penalty) {
  auto& s  = TX(t).Mutable();
  auto  it = s.habit_days.find(DayKey{user_id, habit_id, day});
  if (it == s.habit_days.end()) return Result::Err(ErrorCode::NotFound);
  if (it->second.completed || it->second.penalty_applied != 0) {
    return Result::Err(ErrorCode::Conflict, "penalty already applied or day completed");
  }
  it->second.penalty_applied = penalty;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Profiles
// ------------------------------------------------------------------

Result MemoryRepository::InsertProfile(Transaction& t, const model::ProfileRecord& r) {
  auto [_, inserted] = TX(t).Mutable().profiles.try_emplace(r.user_id, r);
  if (!inserted) return Result::Err(ErrorCode::AlreadyExists);
  return Result::Ok();
}

std::optional<model::ProfileRecord> MemoryRepository::GetProfile(Transaction& t, const std::string& user_id) {
  const auto& s  = TX(t).View();
  auto        it = s.profiles.find(user_id);
  if (it == s.profiles.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::CompareAndSwapProfile(Transaction& t, uint64_t expected_version, const model::ProfileRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.profiles.find(r.user_id);
  if (it == s.profiles.end()) return Result::Err(ErrorCode::NotFound);
  if (it->second.version != expected_version) return Result::Err(ErrorCode::Conflict, "profile version changed");

  it->second         = r;
  it->second.version = expected_version + 1;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Habits
// ------------------------------------------------------------------

Result MemoryRepository::UpsertHabit(Transaction& t, const model::HabitRecord& r) {
  TX(t).Mutable().habits[r.habit_id] = r;
  return Result::Ok();
}

std::optional<model::HabitRecord> MemoryRepository::GetHabit(Transaction& t, const std::string& habit_id) {
  const auto& s  = TX(t).View();
  auto        it = s.habits.find(habit_id);
  if (it == s.habits.end()) return std::nullopt;
  return it->second;
}

std::vector<model::HabitRecord> MemoryRepository::ListActiveHabits(Transaction& t) {
  std::vector<model::HabitRecord> out;
  for (const auto& [_, habit] : TX(t).View().habits) {
    if (habit.active) out.push_back(habit);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    return std::tie(a.user_id, a.habit_id) < std::tie(b.user_id, b.habit_id);
  });
  return out;
}

// ------------------------------------------------------------------
// Send tally
// ------------------------------------------------------------------

Result MemoryRepository::AddSnapsSent(Transaction& t, const std::string& user_id, uint64_t count) {
  TX(t).Mutable().snaps_sent[user_id] += count;
  return Result::Ok();
}

uint64_t MemoryRepository::GetSnapsSent(Transaction& t, const std::string& user_id) {
  const auto& s  = TX(t).View();
  auto        it = s.snaps_sent.find(user_id);
  return it == s.snaps_sent.end() ? 0 : it->second;
}

} // namespace streak::db::memory
