#pragma once

#include <cstdint>
#include <memory>

#include "internal/habit/habit_catalog.hpp"
#include "internal/scoring/scoring_engine.hpp"
#include "internal/util/time.hpp"

namespace streak::sweep {

struct SweepOptions {
  // threads; one user's habits always stay on one thread
  uint32_t workers = 1;
};

// processed == penalized + skipped + failed
struct SweepReport {
  util::Date swept_date;

  uint64_t habits_processed = 0;
  uint64_t penalized        = 0;
  uint64_t skipped          = 0;
  uint64_t failed           = 0;
};

/*
  Daily batch: charges a miss for every active habit that has no completed
  day for (as_of - 1). Goes through ScoringEngine::OnMiss, so a second run
  for the same date charges nothing.
*/
class PenaltySweep {
 public:
  PenaltySweep(std::shared_ptr<habit::HabitCatalog> catalog, std::shared_ptr<scoring::ScoringEngine> scoring,
               SweepOptions options = {});

  SweepReport Run(util::Date as_of);

 private:
  std::shared_ptr<habit::HabitCatalog>    catalog_;
  std::shared_ptr<scoring::ScoringEngine> scoring_;
  SweepOptions                            options_;
};

} // namespace streak::sweep
