#include "internal/sweep/penalty_sweep.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include "hooked_repository.hpp"
#include "internal/db/memory/memory_repository.hpp"

namespace {

using std::chrono::days;

using streak::habit::HabitCatalog;
using streak::habit::HabitStreakTracker;
using streak::model::Habit;
using streak::scoring::ScoringEngine;
using streak::sweep::PenaltySweep;
using streak::sweep::SweepOptions;
using streak::testing::HookedRepository;
using streak::util::Date;
using streak::util::ParseDate;

const Date kAsOf  = ParseDate("2024-03-10");
const Date kSwept = ParseDate("2024-03-09");

struct Fixture {
  explicit Fixture(uint32_t workers = 4)
      : repo(std::make_shared<HookedRepository>()),
        tracker(std::make_shared<HabitStreakTracker>(repo)),
        catalog(std::make_shared<HabitCatalog>(repo)),
        scoring(std::make_shared<ScoringEngine>(repo, tracker)),
        sweep(catalog, scoring, SweepOptions{workers}) {
  }

  void AddHabit(const std::string& user, const std::string& habit, Date created_on, bool active = true) {
    catalog->Register(Habit{habit, user, active, created_on});
    scoring->EnsureProfile(user);
  }

  // u1: two habits, one completed on the swept day
  // u2: one habit
  // u3: two habits
  // u4: habit created after the swept day
  // u5: inactive habit
  void Seed() {
    const auto created = ParseDate("2024-02-01");
    AddHabit("u1", "u1-a", created);
    AddHabit("u1", "u1-b", created);
    AddHabit("u2", "u2-a", created);
    AddHabit("u3", "u3-a", created);
    AddHabit("u3", "u3-b", created);
    AddHabit("u4", "u4-new", kAsOf);
    AddHabit("u5", "u5-off", created, false);

    scoring->OnApproval("u1", "u1-a", kSwept);
  }

  std::shared_ptr<HookedRepository>   repo;
  std::shared_ptr<HabitStreakTracker> tracker;
  std::shared_ptr<HabitCatalog>       catalog;
  std::shared_ptr<ScoringEngine>      scoring;
  PenaltySweep                        sweep;
};

void TestSweepChargesYesterdayOnce() {
  Fixture f;
  f.Seed();

  const auto report = f.sweep.Run(kAsOf);
  assert(report.swept_date == kSwept);
  assert(report.habits_processed == 6);
  assert(report.penalized == 4);
  assert(report.skipped == 2);
  assert(report.failed == 0);

  assert(f.scoring->GetUserScoreProfile("u1").score == 0);
  assert(f.scoring->GetUserScoreProfile("u2").score == 0);
  assert(f.tracker->GetDay("u2", "u2-a", kSwept)->penalty_applied == 1);
  assert(f.tracker->GetDay("u1", "u1-a", kSwept)->completed);
  assert(!f.tracker->GetDay("u4", "u4-new", kSwept).has_value());
  assert(!f.tracker->GetDay("u5", "u5-off", kSwept).has_value());

  const auto again = f.sweep.Run(kAsOf);
  assert(again.habits_processed == 6);
  assert(again.penalized == 0);
  assert(again.skipped == 6);
  assert(again.failed == 0);
  assert(f.tracker->GetDay("u2", "u2-a", kSwept)->penalty_applied == 1);
}

void TestNextDayPenaltyIsProgressive() {
  Fixture f;
  f.Seed();
  for (int i = 0; i < 3; ++i) f.scoring->OnApproval("u2", "u2-a", kSwept - days(3 - i));

  f.sweep.Run(kAsOf);
  const auto report = f.sweep.Run(kAsOf + days(1));
  assert(report.penalized == 6);
  assert(report.skipped == 0);

  // second consecutive miss
  assert(f.tracker->GetDay("u2", "u2-a", kAsOf)->penalty_applied == 2);
  // first miss of a habit created that day
  assert(f.tracker->GetDay("u4", "u4-new", kAsOf)->penalty_applied == 1);
  // 3 approvals, then 1 + 2 charged
  assert(f.scoring->GetUserScoreProfile("u2").score == 0);
}

void TestFailingUserDoesNotStopSweep() {
  Fixture f;
  f.Seed();
  f.repo->FailLedgerFor("u3");

  const auto report = f.sweep.Run(kAsOf);
  assert(report.failed == 2);
  assert(report.penalized == 2);
  assert(report.skipped == 2);
  assert(!f.tracker->GetDay("u3", "u3-a", kSwept).has_value());

  f.repo->FailLedgerFor("");
  const auto retry = f.sweep.Run(kAsOf);
  assert(retry.failed == 0);
  assert(retry.penalized == 2);
  assert(retry.skipped == 4);
  assert(f.tracker->GetDay("u3", "u3-b", kSwept)->penalty_applied == 1);
}

// Routes the default logger into a string for the lifetime of the object.
class CapturedLog {
 public:
  CapturedLog() : previous_(spdlog::default_logger()) {
    auto sink   = std::make_shared<spdlog::sinks::ostream_sink_mt>(out_);
    auto logger = std::make_shared<spdlog::logger>("capture", sink);
    logger->set_pattern("%l|%v");
    logger->set_level(spdlog::level::info);
    spdlog::set_default_logger(logger);
  }

  ~CapturedLog() {
    spdlog::set_default_logger(previous_);
  }

  int CountLines(const std::string& prefix, const std::string& needle = "") const {
    std::istringstream in(out_.str());
    std::string        line;
    int                count = 0;
    while (std::getline(in, line)) {
      if (line.rfind(prefix, 0) == 0 && line.find(needle) != std::string::npos) ++count;
    }
    return count;
  }

 private:
  std::ostringstream              out_;
  std::shared_ptr<spdlog::logger> previous_;
};

void TestHabitWithoutProfileIsCountedAsFailure() {
  Fixture f;
  f.catalog->Register(Habit{"orphan-h", "orphan", true, ParseDate("2024-01-01")});
  f.AddHabit("u1", "u1-a", ParseDate("2024-01-01"));

  CapturedLog log;
  const auto  report = f.sweep.Run(kAsOf);
  assert(report.habits_processed == 2);
  assert(report.penalized == 1);
  assert(report.failed == 1);

  // one error line per failed habit; the summary carries the counts
  assert(log.CountLines("error|") == 1);
  assert(log.CountLines("error|", "subject=orphan") == 1);
  assert(log.CountLines("warning|", "sweep finished") == 1);
  assert(log.CountLines("warning|", "failed=1") == 1);
  assert(log.CountLines("info|", "sweep finished") == 0);
}

void TestSingleWorkerMatchesParallel() {
  Fixture serial(1);
  Fixture parallel(8);
  serial.Seed();
  parallel.Seed();

  const auto a = serial.sweep.Run(kAsOf);
  const auto b = parallel.sweep.Run(kAsOf);
  assert(a.penalized == b.penalized);
  assert(a.skipped == b.skipped);
  assert(a.habits_processed == b.habits_processed);
}

} // namespace

int main() {
  TestSweepChargesYesterdayOnce();
  TestNextDayPenaltyIsProgressive();
  TestFailingUserDoesNotStopSweep();
  TestHabitWithoutProfileIsCountedAsFailure();
  TestSingleWorkerMatchesParallel();

  std::cout << "streak_engine_unit_penalty_sweep: pass\n";
  return 0;
}
