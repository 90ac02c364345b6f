#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/habit_day.hpp"

namespace streak::habit {

// Habit metadata fed in by the surrounding system; read by PenaltySweep.
class HabitCatalog {
 public:
  explicit HabitCatalog(std::shared_ptr<db::Repository> repository);

  // Creates or replaces the habit row.
  void Register(const model::Habit& habit);

  // NotFound for an unknown habit.
  void SetActive(const std::string& habit_id, bool active);

  std::optional<model::Habit> Get(const std::string& habit_id);

  // Ordered by (user_id, habit_id).
  std::vector<model::Habit> ListActive();

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace streak::habit
