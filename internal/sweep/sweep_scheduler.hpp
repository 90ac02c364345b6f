#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

#include "penalty_sweep.hpp"

namespace streak::sweep {

/*
  Background worker that runs the penalty sweep once per UTC day.

  Polls the clock every poll_interval; when the date differs from the last
  completed run, sweeps the day before it.

  A sweep that throws is retried on the next poll. A sweep that returns a
  report with failed habits is retried at most partial_retries times that
  day, waiting poll_interval, 2x, 4x ... between runs; after that the date
  is marked done and the failures stay logged.
*/
class SweepScheduler {
 public:
  SweepScheduler(std::shared_ptr<PenaltySweep> sweep, std::shared_ptr<const util::Clock> clock,
                 std::chrono::milliseconds poll_interval, uint32_t partial_retries = 2);
  ~SweepScheduler();

  void Start();
  void Stop();

  // Single poll step; true when the current date was marked done.
  bool RunIfDue();

  std::optional<util::Date> LastRunDate() const;

 private:
  void Run();

  // Caller holds mutex_.
  bool ShouldRetryPartial(util::Date today, util::TimePoint now, uint64_t failed);

  std::shared_ptr<PenaltySweep>      sweep_;
  std::shared_ptr<const util::Clock> clock_;
  std::chrono::milliseconds          poll_interval_;
  uint32_t                           partial_retries_;

  mutable std::mutex        mutex_;
  std::condition_variable   wake_;
  std::optional<util::Date> last_run_;

  // partial-failure bookkeeping for the date being retried
  std::optional<util::Date> retry_date_;
  uint32_t                  partial_runs_ = 0;
  util::TimePoint           next_retry_at_{};

  std::thread       thread_;
  std::atomic<bool> running_{false};
};

} // namespace streak::sweep
