#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/db/api/repository.hpp"
#include "internal/habit/habit_catalog.hpp"
#include "internal/habit/habit_streak_tracker.hpp"
#include "internal/pair/pair_streak_store.hpp"
#include "internal/pair/streak_engine.hpp"
#include "internal/scoring/scoring_engine.hpp"
#include "internal/sweep/penalty_sweep.hpp"
#include "internal/sweep/sweep_scheduler.hpp"
#include "internal/tally/send_tally.hpp"
#include "internal/util/time.hpp"

namespace streak::factory {

/*
  Runtime

  Owns all long-lived components. The scheduler is built but not started;
  the daemon starts it when sweep.enabled is set.
*/
struct Runtime {
  std::shared_ptr<db::Repository>    repository;
  std::shared_ptr<const util::Clock> clock;

  std::shared_ptr<pair::PairStreakStore>     pair_store;
  std::shared_ptr<pair::StreakEngine>        streak_engine;
  std::shared_ptr<habit::HabitStreakTracker> tracker;
  std::shared_ptr<habit::HabitCatalog>       catalog;
  std::shared_ptr<scoring::ScoringEngine>    scoring;
  std::shared_ptr<tally::SendTally>          tally;
  std::shared_ptr<sweep::PenaltySweep>       sweep;
  std::shared_ptr<sweep::SweepScheduler>     scheduler;
};

/*
  BuildRuntime

  Composition root: the only place that knows concrete repository types.
*/
Runtime BuildRuntime(const streak::runtime::config::RuntimeConfig& config,
                     std::shared_ptr<const util::Clock> clock = std::make_shared<util::SystemClock>());

std::shared_ptr<db::Repository> BuildRepository(const streak::runtime::config::RuntimeConfig& config);

pair::EngineOptions     EngineOptionsFrom(const streak::runtime::config::RuntimeConfig& config);
scoring::ScoringOptions ScoringOptionsFrom(const streak::runtime::config::RuntimeConfig& config);

} // namespace streak::factory
