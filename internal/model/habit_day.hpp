#pragma once

#include <cstdint>
#include <string>

#include "internal/util/time.hpp"

namespace streak::model {

struct HabitDay {
  std::string user_id;
  std::string habit_id;
  util::Date  date;

  bool     completed       = false;
  uint32_t snap_count      = 0;
  uint32_t penalty_applied = 0;
};

struct Habit {
  std::string habit_id;
  std::string user_id;
  bool        active = true;
  util::Date  created_on;
};

} // namespace streak::model
