#include "factory.hpp"

#include <stdexcept>

#include "internal/config/config_loader.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/schema.hpp"
#include "internal/observability/logging.hpp"
#if STREAK_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if STREAK_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace streak::factory {

using streak::runtime::config::RuntimeConfig;

namespace {

uint32_t OrDefault(uint32_t value, uint32_t fallback) {
  return value == 0 ? fallback : value;
}

#if STREAK_DB_SQLITE
void BootstrapSqliteSchema(const std::shared_ptr<db::sqlite::SqliteDB>& sqlite_db) {
  for (const char* sql : db::sql::kSqliteSchema) {
    sqlite_db->Exec(sql);
  }

  sqlite_db->Exec("SELECT id_a,id_b,current_streak,longest_streak,version FROM pair_streaks LIMIT 1;");
  sqlite_db->Exec("SELECT user_id,habit_id,day,completed,penalty_applied FROM habit_days LIMIT 1;");
  sqlite_db->Exec("SELECT user_id,score,current_streak,longest_streak,version FROM user_profiles LIMIT 1;");
}
#endif

#if STREAK_DB_POSTGRES
void BootstrapPostgresSchema(const std::shared_ptr<db::postgres::PgPool>& pool) {
  auto       conn = pool->Acquire();
  pqxx::work tx(*conn);

  for (const char* sql : db::sql::kPostgresSchema) {
    tx.exec(sql);
  }

  tx.exec("SELECT id_a,id_b,current_streak,longest_streak,version FROM pair_streaks LIMIT 1;");
  tx.exec("SELECT user_id,habit_id,day,completed,penalty_applied FROM habit_days LIMIT 1;");
  tx.exec("SELECT user_id,score,current_streak,longest_streak,version FROM user_profiles LIMIT 1;");
  tx.commit();
}
#endif

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if STREAK_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    BootstrapSqliteSchema(sqlite_db);
    STREAK_LOG_INFO("repository: sqlite", {observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if STREAK_DB_POSTGRES
    const auto max_connections = OrDefault(database.postgres().max_connections(), 16);
    auto pool = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    BootstrapPostgresSchema(pool);
    STREAK_LOG_INFO("repository: postgres", {observability::UIntField("max_connections", max_connections)});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  STREAK_LOG_INFO("repository: memory");
  return std::make_shared<db::memory::MemoryRepository>();
}

pair::EngineOptions EngineOptionsFrom(const RuntimeConfig& config) {
  const auto&         engine = config.engine();
  pair::EngineOptions options;
  options.pair_window  = streak::config::DurationOr(engine.pair_window(), engine.has_pair_window(), options.pair_window);
  options.max_attempts = OrDefault(engine.cas_max_attempts(), options.max_attempts);
  if (engine.has_default_deadline()) {
    options.default_deadline = streak::config::DurationOr(engine.default_deadline(), true, std::chrono::milliseconds::zero());
  }
  return options;
}

scoring::ScoringOptions ScoringOptionsFrom(const RuntimeConfig& config) {
  const auto&             scoring = config.scoring();
  scoring::ScoringOptions options;

  auto& policy            = options.policy;
  policy.base_points      = OrDefault(scoring.base_points(), policy.base_points);
  policy.bonus_block_days = OrDefault(scoring.bonus_block_days(), policy.bonus_block_days);
  policy.base_penalty     = OrDefault(scoring.base_penalty(), policy.base_penalty);
  policy.max_penalty      = OrDefault(scoring.max_penalty(), policy.max_penalty);
  policy.streak_decrement = OrDefault(scoring.streak_decrement(), policy.streak_decrement);
  policy.progressive_step = OrDefault(scoring.progressive_step(), policy.progressive_step);

  options.max_attempts      = OrDefault(config.engine().cas_max_attempts(), options.max_attempts);
  options.stats_window_days = OrDefault(scoring.stats_window_days(), options.stats_window_days);
  if (config.engine().has_default_deadline()) {
    options.default_deadline =
        streak::config::DurationOr(config.engine().default_deadline(), true, std::chrono::milliseconds::zero());
  }
  return options;
}

Runtime BuildRuntime(const RuntimeConfig& config, std::shared_ptr<const util::Clock> clock) {
  Runtime rt;
  rt.clock      = std::move(clock);
  rt.repository = BuildRepository(config);

  // ------------------------------------------------------------------
  // Pair streaks
  // ------------------------------------------------------------------
  rt.pair_store    = std::make_shared<pair::PairStreakStore>(rt.repository);
  rt.streak_engine = std::make_shared<pair::StreakEngine>(rt.pair_store, rt.clock, EngineOptionsFrom(config));

  // ------------------------------------------------------------------
  // Habits and scoring
  // ------------------------------------------------------------------
  habit::TrackerOptions tracker_options;
  tracker_options.streak_lookback_days =
      OrDefault(config.scoring().streak_lookback_days(), tracker_options.streak_lookback_days);
  tracker_options.miss_lookback_days =
      OrDefault(config.scoring().miss_lookback_days(), tracker_options.miss_lookback_days);

  rt.tracker = std::make_shared<habit::HabitStreakTracker>(rt.repository, tracker_options);
  rt.catalog = std::make_shared<habit::HabitCatalog>(rt.repository);
  rt.scoring = std::make_shared<scoring::ScoringEngine>(rt.repository, rt.tracker, ScoringOptionsFrom(config));
  rt.tally   = std::make_shared<tally::SendTally>(rt.repository);

  // ------------------------------------------------------------------
  // Daily sweep
  // ------------------------------------------------------------------
  sweep::SweepOptions sweep_options;
  sweep_options.workers = OrDefault(config.sweep().workers(), 1);
  rt.sweep              = std::make_shared<sweep::PenaltySweep>(rt.catalog, rt.scoring, sweep_options);

  const auto poll = streak::config::DurationOr(config.sweep().poll_interval(), config.sweep().has_poll_interval(),
                                       std::chrono::minutes(1));
  rt.scheduler    = std::make_shared<sweep::SweepScheduler>(rt.sweep, rt.clock, poll,
                                                         OrDefault(config.sweep().partial_retries(), 2));

  return rt;
}

} // namespace streak::factory
