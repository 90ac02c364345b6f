#include "habit_catalog.hpp"

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace streak::habit {

namespace {

db::model::HabitRecord ToRecord(const model::Habit& habit) {
  return db::model::HabitRecord{habit.habit_id, habit.user_id, habit.active, util::FormatDate(habit.created_on)};
}

model::Habit FromRecord(const db::model::HabitRecord& record) {
  model::Habit habit;
  habit.habit_id   = record.habit_id;
  habit.user_id    = record.user_id;
  habit.active     = record.active;
  habit.created_on = util::ParseDate(record.created_on);
  return habit;
}

} // namespace

HabitCatalog::HabitCatalog(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

void HabitCatalog::Register(const model::Habit& habit) {
  if (habit.habit_id.empty() || habit.user_id.empty()) {
    throw util::InvalidArgument("habit id and user id must not be empty");
  }

  auto tx = repository_->Begin();
  db::ThrowIfDbError(repository_->UpsertHabit(*tx, ToRecord(habit)), "register habit " + habit.habit_id);
  tx->Commit();
}

void HabitCatalog::SetActive(const std::string& habit_id, bool active) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetHabit(*tx, habit_id);
  if (!record) {
    throw util::NotFound("habit " + habit_id + " not found");
  }

  record->active = active;
  db::ThrowIfDbError(repository_->UpsertHabit(*tx, *record), "update habit " + habit_id);
  tx->Commit();
}

std::optional<model::Habit> HabitCatalog::Get(const std::string& habit_id) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetHabit(*tx, habit_id);
  tx->Commit();

  if (!record) {
    return std::nullopt;
  }
  return FromRecord(*record);
}

std::vector<model::Habit> HabitCatalog::ListActive() {
  auto tx      = repository_->Begin();
  auto records = repository_->ListActiveHabits(*tx);
  tx->Commit();

  std::vector<model::Habit> out;
  out.reserve(records.size());
  for (const auto& record : records) {
    out.push_back(FromRecord(record));
  }
  return out;
}

} // namespace streak::habit
