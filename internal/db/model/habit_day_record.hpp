#pragma once

#include <cstdint>
#include <string>

namespace streak::db::model {

/*
  One ledger row per (user_id, habit_id, day).

  day is ISO "YYYY-MM-DD" (UTC) so lexicographic order is date order
  in every backend.
*/

struct HabitDayRecord {
  std::string user_id;
  std::string habit_id;
  std::string day;

  bool completed = false;

  uint32_t snap_count = 0;

  // 0 = not charged yet
  uint32_t penalty_applied = 0;
};

} // namespace streak::db::model
