#pragma once

#include <string>

namespace streak::db::model {

/*
  Habit metadata mirrored from the surrounding system.
  Read-only input to the penalty sweep.
*/

struct HabitRecord {
  std::string habit_id;
  std::string user_id;

  bool active = true;

  // ISO day the habit was created; the sweep never charges earlier days
  std::string created_on;
};

} // namespace streak::db::model
