#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace streak::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertPairStreak(Transaction&, const model::PairStreakRecord&) override;
  std::optional<model::PairStreakRecord> GetPairStreak(Transaction&, const std::string& id_a,
                                                       const std::string& id_b) override;
  Result CompareAndSwapPairStreak(Transaction&, uint64_t expected_version,
                                  const model::PairStreakRecord&) override;
  std::vector<model::PairStreakRecord> ListPairStreaksForUser(Transaction&, const std::string& user_id) override;

  Result UpsertCompletion(Transaction&, const std::string& user_id, const std::string& habit_id,
                          const std::string& day) override;
  Result InsertMissIfAbsent(Transaction&, const std::string& user_id, const std::string& habit_id,
                            const std::string& day) override;
  std::optional<model::HabitDayRecord> GetHabitDay(Transaction&, const std::string& user_id,
                                                   const std::string& habit_id, const std::string& day) override;
  std::vector<model::HabitDayRecord> ListHabitDays(Transaction&, const std::string& user_id,
                                                   const std::string& habit_id, const std::string& from_day,
                                                   const std::string& to_day) override;
  std::vector<model::HabitDayRecord> ListUserHabitDays(Transaction&, const std::string& user_id,
                                                       const std::string& from_day, const std::string& to_day) override;
  Result ClaimPenalty(Transaction&, const std::string& user_id, const std::string& habit_id,
                      const std::string& day, uint32_t penalty) override;

  Result InsertProfile(Transaction&, const model::ProfileRecord&) override;
  std::optional<model::ProfileRecord> GetProfile(Transaction&, const std::string& user_id) override;
  Result CompareAndSwapProfile(Transaction&, uint64_t expected_version, const model::ProfileRecord&) override;

  Result UpsertHabit(Transaction&, const model::HabitRecord&) override;
  std::optional<model::HabitRecord> GetHabit(Transaction&, const std::string& habit_id) override;
  std::vector<model::HabitRecord> ListActiveHabits(Transaction&) override;

  Result AddSnapsSent(Transaction&, const std::string& user_id, uint64_t count) override;
  uint64_t GetSnapsSent(Transaction&, const std::string& user_id) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
