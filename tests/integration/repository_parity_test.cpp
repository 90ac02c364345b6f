#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/schema.hpp"

#if STREAK_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

#if STREAK_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace {

using streak::db::ErrorCode;
using streak::db::Repository;
using streak::db::memory::MemoryRepository;
using streak::db::model::HabitRecord;
using streak::db::model::PairStreakRecord;
using streak::db::model::ProfileRecord;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

void VerifyPairStreakInsertGetCas(Repository& repo, const std::string& prefix) {
  const auto a = prefix + "-a";
  const auto b = prefix + "-b";

  {
    auto             tx = repo.Begin();
    PairStreakRecord seed{.id_a = a, .id_b = b, .version = 1};
    assert(repo.InsertPairStreak(*tx, seed));

    // second insert leaves the row untouched
    PairStreakRecord dup{.id_a = a, .id_b = b, .current_streak = 9, .longest_streak = 9, .version = 1};
    auto             again = repo.InsertPairStreak(*tx, dup);
    assert(!again);
    assert(again.code == ErrorCode::AlreadyExists);
    tx->Commit();
  }

  PairStreakRecord read;
  {
    auto tx  = repo.Begin();
    auto got = repo.GetPairStreak(*tx, a, b);
    assert(got.has_value());
    assert(got->current_streak == 0);
    assert(got->version == 1);
    assert(got->last_action_a_ms == 0);
    read = *got;
    tx->Commit();
  }

  {
    auto tx                = repo.Begin();
    auto next              = read;
    next.current_streak    = 1;
    next.longest_streak    = 1;
    next.last_action_a_ms  = 1000;
    next.last_action_b_ms  = 2000;
    next.started_at_ms     = 2000;
    next.expires_at_ms     = 2000 + 86400000;
    assert(repo.CompareAndSwapPairStreak(*tx, read.version, next));
    tx->Commit();
  }

  {
    // stale version
    auto tx    = repo.Begin();
    auto stale = read;
    stale.current_streak = 5;
    stale.longest_streak = 5;
    auto r = repo.CompareAndSwapPairStreak(*tx, read.version, stale);
    assert(!r);
    assert(r.code == ErrorCode::Conflict);
    tx->Commit();
  }

  auto tx  = repo.Begin();
  auto got = repo.GetPairStreak(*tx, a, b);
  assert(got.has_value());
  assert(got->version == 2);
  assert(got->current_streak == 1);
  assert(got->last_action_b_ms == 2000);
  assert(got->expires_at_ms == 2000 + 86400000);
  assert(!repo.GetPairStreak(*tx, b, a + "-missing").has_value());
  tx->Commit();
}

void VerifyPairStreakListForUser(Repository& repo, const std::string& prefix) {
  const auto me = prefix + "-m";

  auto tx = repo.Begin();
  assert(repo.InsertPairStreak(*tx, PairStreakRecord{.id_a = prefix + "-a", .id_b = me, .version = 1}));
  assert(repo.InsertPairStreak(*tx, PairStreakRecord{.id_a = me, .id_b = prefix + "-z", .version = 1}));
  assert(repo.InsertPairStreak(*tx, PairStreakRecord{.id_a = prefix + "-a", .id_b = prefix + "-z", .version = 1}));
  tx->Commit();

  auto read = repo.Begin();
  auto rows = repo.ListPairStreaksForUser(*read, me);
  assert(rows.size() == 2);
  for (const auto& row : rows) {
    assert(row.id_a == me || row.id_b == me);
  }
  read->Commit();
}

void VerifyHabitLedger(Repository& repo, const std::string& prefix) {
  const auto user  = prefix + "-user";
  const auto habit = prefix + "-habit";

  auto tx = repo.Begin();
  assert(repo.UpsertCompletion(*tx, user, habit, "2024-03-01"));
  assert(repo.UpsertCompletion(*tx, user, habit, "2024-03-01"));
  assert(repo.InsertMissIfAbsent(*tx, user, habit, "2024-03-02"));
  assert(repo.UpsertCompletion(*tx, user, habit, "2024-03-04"));

  // a recorded completion is never downgraded
  assert(repo.InsertMissIfAbsent(*tx, user, habit, "2024-03-01"));

  // completion upgrades a missed day
  assert(repo.InsertMissIfAbsent(*tx, user, habit + "-other", "2024-03-03"));
  assert(repo.UpsertCompletion(*tx, user, habit + "-other", "2024-03-03"));
  tx->Commit();

  auto read = repo.Begin();
  auto day1 = repo.GetHabitDay(*read, user, habit, "2024-03-01");
  assert(day1.has_value());
  assert(day1->completed);
  assert(day1->snap_count == 2);
  assert(day1->penalty_applied == 0);

  auto day2 = repo.GetHabitDay(*read, user, habit, "2024-03-02");
  assert(day2.has_value());
  assert(!day2->completed);

  auto other = repo.GetHabitDay(*read, user, habit + "-other", "2024-03-03");
  assert(other.has_value());
  assert(other->completed);

  assert(!repo.GetHabitDay(*read, user, habit, "2024-03-03").has_value());

  auto ranged = repo.ListHabitDays(*read, user, habit, "2024-03-01", "2024-03-02");
  assert(ranged.size() == 2);
  assert(ranged[0].day == "2024-03-02");
  assert(ranged[1].day == "2024-03-01");

  auto all = repo.ListUserHabitDays(*read, user, "2024-02-01", "2024-03-31");
  assert(all.size() == 4);
  assert(all.front().day == "2024-03-04");
  assert(all.back().day == "2024-03-01");
  read->Commit();
}

void VerifyClaimPenalty(Repository& repo, const std::string& prefix) {
  const auto user  = prefix + "-user";
  const auto habit = prefix + "-habit";

  auto tx      = repo.Begin();
  auto missing = repo.ClaimPenalty(*tx, user, habit, "2024-04-01", 1);
  assert(!missing);
  assert(missing.code == ErrorCode::NotFound);

  assert(repo.InsertMissIfAbsent(*tx, user, habit, "2024-04-01"));
  assert(repo.ClaimPenalty(*tx, user, habit, "2024-04-01", 2));

  auto twice = repo.ClaimPenalty(*tx, user, habit, "2024-04-01", 2);
  assert(!twice);
  assert(twice.code == ErrorCode::Conflict);

  assert(repo.UpsertCompletion(*tx, user, habit, "2024-04-02"));
  auto completed = repo.ClaimPenalty(*tx, user, habit, "2024-04-02", 1);
  assert(!completed);
  assert(completed.code == ErrorCode::Conflict);
  tx->Commit();

  auto read = repo.Begin();
  auto day  = repo.GetHabitDay(*read, user, habit, "2024-04-01");
  assert(day.has_value());
  assert(day->penalty_applied == 2);
  read->Commit();
}

void VerifyProfiles(Repository& repo, const std::string& prefix) {
  const auto user = prefix + "-user";

  {
    auto tx = repo.Begin();
    assert(repo.InsertProfile(*tx, ProfileRecord{.user_id = user, .version = 1}));
    auto dup = repo.InsertProfile(*tx, ProfileRecord{.user_id = user, .score = 40, .version = 1});
    assert(dup.code == ErrorCode::AlreadyExists);
    tx->Commit();
  }

  {
    auto tx = repo.Begin();
    ProfileRecord next{.user_id = user, .score = 3, .current_streak = 2, .longest_streak = 2, .version = 1};
    assert(repo.CompareAndSwapProfile(*tx, 1, next));

    auto stale = repo.CompareAndSwapProfile(*tx, 1, next);
    assert(stale.code == ErrorCode::Conflict);
    tx->Commit();
  }

  auto tx  = repo.Begin();
  auto got = repo.GetProfile(*tx, user);
  assert(got.has_value());
  assert(got->score == 3);
  assert(got->current_streak == 2);
  assert(got->version == 2);
  assert(!repo.GetProfile(*tx, user + "-missing").has_value());
  tx->Commit();
}

void VerifyHabits(Repository& repo, const std::string& prefix) {
  {
    auto tx = repo.Begin();
    assert(repo.UpsertHabit(*tx, HabitRecord{.habit_id = prefix + "-h2", .user_id = prefix + "-u2", .active = true, .created_on = "2024-01-01"}));
    assert(repo.UpsertHabit(*tx, HabitRecord{.habit_id = prefix + "-h1", .user_id = prefix + "-u1", .active = true, .created_on = "2024-01-02"}));
    assert(repo.UpsertHabit(*tx, HabitRecord{.habit_id = prefix + "-h3", .user_id = prefix + "-u1", .active = false, .created_on = "2024-01-03"}));
    tx->Commit();
  }

  {
    auto tx      = repo.Begin();
    auto habit   = repo.GetHabit(*tx, prefix + "-h3");
    assert(habit.has_value());
    assert(!habit->active);
    assert(habit->created_on == "2024-01-03");

    habit->active = true;
    assert(repo.UpsertHabit(*tx, *habit));
    tx->Commit();
  }

  auto tx = repo.Begin();
  std::vector<HabitRecord> mine;
  for (auto& h : repo.ListActiveHabits(*tx)) {
    if (h.habit_id.rfind(prefix, 0) == 0) mine.push_back(h);
  }
  assert(mine.size() == 3);
  assert(mine[0].user_id == prefix + "-u1" && mine[0].habit_id == prefix + "-h1");
  assert(mine[1].user_id == prefix + "-u1" && mine[1].habit_id == prefix + "-h3");
  assert(mine[2].user_id == prefix + "-u2");
  tx->Commit();
}

void VerifySendTally(Repository& repo, const std::string& prefix) {
  auto tx = repo.Begin();
  assert(repo.GetSnapsSent(*tx, prefix + "-user") == 0);
  assert(repo.AddSnapsSent(*tx, prefix + "-user", 2));
  assert(repo.AddSnapsSent(*tx, prefix + "-user", 3));
  assert(repo.GetSnapsSent(*tx, prefix + "-user") == 5);
  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& prefix) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertProfile(*tx, ProfileRecord{.user_id = prefix + "-user", .version = 1}));
    assert(repo.UpsertCompletion(*tx, prefix + "-user", "h", "2024-05-01"));
    tx->Rollback();
  }

  {
    // destroyed without commit
    auto tx = repo.Begin();
    assert(repo.InsertPairStreak(*tx, PairStreakRecord{.id_a = prefix + "-a", .id_b = prefix + "-b", .version = 1}));
  }

  auto check_tx = repo.Begin();
  assert(!repo.GetProfile(*check_tx, prefix + "-user").has_value());
  assert(!repo.GetHabitDay(*check_tx, prefix + "-user", "h", "2024-05-01").has_value());
  assert(!repo.GetPairStreak(*check_tx, prefix + "-a", prefix + "-b").has_value());
  check_tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& prefix) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto tx = repo->Begin();
    assert(repo->InsertPairStreak(*tx, PairStreakRecord{.id_a = prefix + "-a", .id_b = prefix + "-b", .current_streak = 4,
                                                        .longest_streak = 7, .expires_at_ms = NowMs(), .version = 11}));
    assert(repo->InsertProfile(*tx, ProfileRecord{.user_id = prefix + "-user", .score = 12, .version = 3}));
    assert(repo->InsertMissIfAbsent(*tx, prefix + "-user", "h", "2024-06-01"));
    assert(repo->ClaimPenalty(*tx, prefix + "-user", "h", "2024-06-01", 3));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx   = repo->Begin();
  auto pair = repo->GetPairStreak(*tx, prefix + "-a", prefix + "-b");
  assert(pair.has_value());
  assert(pair->version == 11);
  assert(pair->longest_streak == 7);

  auto profile = repo->GetProfile(*tx, prefix + "-user");
  assert(profile.has_value());
  assert(profile->score == 12);

  auto day = repo->GetHabitDay(*tx, prefix + "-user", "h", "2024-06-01");
  assert(day.has_value());
  assert(day->penalty_applied == 3);
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

#if STREAK_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("streak_engine_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<streak::db::sqlite::SqliteDB>(db_path);
    for (const char* sql : streak::db::sql::kSqliteSchema) {
      db->Exec(sql);
    }
    return std::make_shared<streak::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup          = [db_path]() { std::filesystem::remove(db_path); },
  };
}
#endif

#if STREAK_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("STREAK_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("STREAK_TEST_POSTGRES_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() {
    auto pool = std::make_shared<streak::db::postgres::PgPool>(conninfo);
    {
      auto       conn = pool->Acquire();
      pqxx::work tx(*conn);
      for (const char* sql : streak::db::sql::kPostgresSchema) {
        tx.exec(sql);
      }
      tx.commit();
    }
    return std::make_shared<streak::db::postgres::PgRepository>(std::move(pool));
  };

  return BackendFactory{
      .name             = "postgres",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup          = []() {},
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto repo = backend.make_repository();

  // unique per run so a shared Postgres database can be reused
  const auto run = backend.name + "-" + std::to_string(NowMs());

  VerifyPairStreakInsertGetCas(*repo, run + "-pair");
  VerifyPairStreakListForUser(*repo, run + "-list");
  VerifyHabitLedger(*repo, run + "-ledger");
  VerifyClaimPenalty(*repo, run + "-claim");
  VerifyProfiles(*repo, run + "-profile");
  VerifyHabits(*repo, run + "-habit");
  VerifySendTally(*repo, run + "-tally");
  VerifyRollbackBehavior(*repo, run + "-rollback");

  repo.reset();
  VerifyRestartDurability(backend, run + "-durable");

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if STREAK_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if STREAK_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "streak_engine_integration_repository_parity: pass\n";
  return 0;
}
