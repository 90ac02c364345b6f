#include "internal/habit/habit_streak_tracker.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using std::chrono::days;

using streak::db::memory::MemoryRepository;
using streak::habit::HabitStreakTracker;
using streak::util::Date;
using streak::util::ParseDate;

const Date kDay1 = ParseDate("2024-03-01");

HabitStreakTracker MakeTracker() {
  return HabitStreakTracker(std::make_shared<MemoryRepository>());
}

void TestCompletionIsIdempotent() {
  auto tracker = MakeTracker();

  const auto once  = tracker.RecordCompletion("u", "h", kDay1);
  const auto twice = tracker.RecordCompletion("u", "h", kDay1);
  assert(once == 1);
  assert(twice == once);

  auto day = tracker.GetDay("u", "h", kDay1);
  assert(day.has_value());
  assert(day->completed);
  assert(day->snap_count == 2);
}

void TestConsecutiveDaysAccumulate() {
  auto tracker = MakeTracker();
  for (int i = 0; i < 5; ++i) {
    assert(tracker.RecordCompletion("u", "h", kDay1 + days(i)) == static_cast<uint32_t>(i + 1));
  }
  assert(tracker.CurrentStreak("u", "h", kDay1 + days(4)) == 5);

  // measured from the newest record, not from as_of
  assert(tracker.CurrentStreak("u", "h", kDay1 + days(9)) == 5);
  // records after as_of are ignored
  assert(tracker.CurrentStreak("u", "h", kDay1 + days(2)) == 3);
}

void TestGapBreaksStreak() {
  auto tracker = MakeTracker();
  tracker.RecordCompletion("u", "h", kDay1);
  tracker.RecordCompletion("u", "h", kDay1 + days(1));
  assert(tracker.RecordCompletion("u", "h", kDay1 + days(3)) == 1);
}

void TestMissBreaksStreak() {
  auto tracker = MakeTracker();
  tracker.RecordCompletion("u", "h", kDay1);
  tracker.RecordMiss("u", "h", kDay1 + days(1));
  assert(tracker.CurrentStreak("u", "h", kDay1 + days(1)) == 0);
  assert(tracker.RecordCompletion("u", "h", kDay1 + days(2)) == 1);
}

void TestConsecutiveMissesCountPrecedingDays() {
  auto tracker = MakeTracker();

  assert(tracker.RecordMiss("u", "h", kDay1).consecutive_misses == 0);
  assert(tracker.RecordMiss("u", "h", kDay1 + days(1)).consecutive_misses == 1);
  assert(tracker.RecordMiss("u", "h", kDay1 + days(2)).consecutive_misses == 2);

  // recording the same day again does not count itself
  assert(tracker.RecordMiss("u", "h", kDay1 + days(2)).consecutive_misses == 2);

  // gap on day 4 stops the count
  assert(tracker.RecordMiss("u", "h", kDay1 + days(4)).consecutive_misses == 0);

  // a completion stops the count
  tracker.RecordCompletion("u", "h", kDay1 + days(5));
  assert(tracker.RecordMiss("u", "h", kDay1 + days(6)).consecutive_misses == 0);

  // other habits are independent
  assert(tracker.RecordMiss("u", "other", kDay1 + days(1)).consecutive_misses == 0);
}

void TestMissNeverDowngradesCompletion() {
  auto tracker = MakeTracker();
  tracker.RecordCompletion("u", "h", kDay1);

  const auto outcome = tracker.RecordMiss("u", "h", kDay1);
  assert(outcome.completed);
  assert(outcome.penalty_applied == 0);

  auto day = tracker.GetDay("u", "h", kDay1);
  assert(day->completed);
  assert(tracker.CurrentStreak("u", "h", kDay1) == 1);
}

void TestCompletionUpgradesMissedDay() {
  auto tracker = MakeTracker();
  tracker.RecordMiss("u", "h", kDay1);
  assert(tracker.RecordCompletion("u", "h", kDay1) == 1);
  assert(tracker.GetDay("u", "h", kDay1)->completed);
}

void TestLongestStreakInWindow() {
  auto tracker = MakeTracker();
  for (int i = 0; i < 3; ++i) tracker.RecordCompletion("u", "h", kDay1 + days(i));
  tracker.RecordMiss("u", "h", kDay1 + days(3));
  tracker.RecordCompletion("u", "h", kDay1 + days(4));
  tracker.RecordCompletion("u", "h", kDay1 + days(5));

  assert(tracker.LongestStreak("u", "h", kDay1 + days(5)) == 3);
  assert(tracker.CurrentStreak("u", "h", kDay1 + days(5)) == 2);
}

void TestListUserDaysNewestFirst() {
  auto tracker = MakeTracker();
  tracker.RecordCompletion("u", "a", kDay1);
  tracker.RecordMiss("u", "b", kDay1 + days(1));
  tracker.RecordCompletion("u", "a", kDay1 + days(2));
  tracker.RecordCompletion("someone-else", "a", kDay1 + days(2));

  const auto rows = tracker.ListUserDays("u", kDay1, kDay1 + days(2));
  assert(rows.size() == 3);
  assert(rows[0].date == kDay1 + days(2));
  assert(rows[1].habit_id == "b");
  assert(!rows[1].completed);
  assert(rows[2].date == kDay1);
}

void TestEmptyIdsAreRejected() {
  auto tracker = MakeTracker();
  bool threw   = false;
  try {
    tracker.RecordCompletion("", "h", kDay1);
  } catch (const streak::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestCompletionIsIdempotent();
  TestConsecutiveDaysAccumulate();
  TestGapBreaksStreak();
  TestMissBreaksStreak();
  TestConsecutiveMissesCountPrecedingDays();
  TestMissNeverDowngradesCompletion();
  TestCompletionUpgradesMissedDay();
  TestLongestStreakInWindow();
  TestListUserDaysNewestFirst();
  TestEmptyIdsAreRejected();

  std::cout << "streak_engine_unit_habit_streak_tracker: pass\n";
  return 0;
}
