#include "penalty_sweep.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace streak::sweep {

using observability::DateField;
using observability::UIntField;

namespace {

// Habits arrive ordered by user; split at user boundaries.
std::vector<std::vector<model::Habit>> GroupByUser(std::vector<model::Habit> habits) {
  std::vector<std::vector<model::Habit>> groups;
  for (auto& habit : habits) {
    if (groups.empty() || groups.back().front().user_id != habit.user_id) {
      groups.emplace_back();
    }
    groups.back().push_back(std::move(habit));
  }
  return groups;
}

} // namespace

PenaltySweep::PenaltySweep(std::shared_ptr<habit::HabitCatalog> catalog, std::shared_ptr<scoring::ScoringEngine> scoring,
                           SweepOptions options)
    : catalog_(std::move(catalog)), scoring_(std::move(scoring)), options_(options) {
  options_.workers = std::max<uint32_t>(options_.workers, 1);
}

SweepReport PenaltySweep::Run(util::Date as_of) {
  observability::SpanScope span("PenaltySweep.Run");
  const auto started_at = std::chrono::steady_clock::now();
  const auto swept_date = as_of - std::chrono::days(1);
  span.SetAttribute("sweep.date", util::FormatDate(swept_date));

  const auto groups = GroupByUser(catalog_->ListActive());

  std::atomic<size_t>   next_group{0};
  std::atomic<uint64_t> processed{0};
  std::atomic<uint64_t> penalized{0};
  std::atomic<uint64_t> skipped{0};
  std::atomic<uint64_t> failed{0};

  auto worker = [&] {
    for (size_t i = next_group++; i < groups.size(); i = next_group++) {
      for (const auto& habit : groups[i]) {
        ++processed;

        if (habit.created_on > swept_date) {
          ++skipped;
          continue;
        }

        try {
          const auto delta = scoring_->OnMiss(habit.user_id, habit.habit_id, swept_date);
          if (delta.points > 0) {
            ++penalized;
          } else {
            ++skipped;
          }
        } catch (const std::exception&) {
          // OnMiss already logged the error with its subject
          ++failed;
        }
      }
    }
  };

  const auto thread_count = std::min<size_t>(options_.workers, groups.size());
  if (thread_count <= 1) {
    worker();
  } else {
    std::vector<std::thread> threads;
    threads.reserve(thread_count);
    for (size_t t = 0; t < thread_count; ++t) {
      threads.emplace_back(worker);
    }
    for (auto& thread : threads) {
      thread.join();
    }
  }

  SweepReport report;
  report.swept_date       = swept_date;
  report.habits_processed = processed;
  report.penalized        = penalized;
  report.skipped          = skipped;
  report.failed           = failed;

  const auto duration_ms =
      std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
  observability::Metrics::Instance().ObserveSweepDurationMs(duration_ms);

  const auto level = report.failed > 0 ? spdlog::level::warn : spdlog::level::info;
  observability::Log(level, "sweep finished",
                     {DateField("date", swept_date), UIntField("processed", report.habits_processed),
                      UIntField("penalized", report.penalized), UIntField("skipped", report.skipped),
                      UIntField("failed", report.failed)});
  return report;
}

} // namespace streak::sweep
