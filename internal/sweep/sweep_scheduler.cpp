#include "sweep_scheduler.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"

namespace streak::sweep {

using observability::DateField;
using observability::StringField;
using observability::TimestampField;
using observability::UIntField;

SweepScheduler::SweepScheduler(std::shared_ptr<PenaltySweep> sweep, std::shared_ptr<const util::Clock> clock,
                               std::chrono::milliseconds poll_interval, uint32_t partial_retries)
    : sweep_(std::move(sweep)), clock_(std::move(clock)), poll_interval_(poll_interval),
      partial_retries_(partial_retries) {
  if (poll_interval_ <= std::chrono::milliseconds::zero()) {
    poll_interval_ = std::chrono::minutes(1);
  }
}

SweepScheduler::~SweepScheduler() {
  Stop();
}

void SweepScheduler::Start() {
  if (running_.exchange(true)) return;
  thread_ = std::thread(&SweepScheduler::Run, this);
}

void SweepScheduler::Stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
  }
  wake_.notify_all();
  if (thread_.joinable()) thread_.join();
}

bool SweepScheduler::RunIfDue() {
  const auto now   = clock_->Now();
  const auto today = util::DateOf(now);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (last_run_ && *last_run_ == today) return false;
    if (retry_date_ == today && now < next_retry_at_) return false;
  }

  SweepReport report;
  try {
    report = sweep_->Run(today);
  } catch (const std::exception& e) {
    STREAK_LOG_ERROR("sweep: run failed", {DateField("as_of", today), StringField("error", e.what())});
    return false;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (report.failed > 0 && ShouldRetryPartial(today, now, report.failed)) {
    return false;
  }

  last_run_ = today;
  retry_date_.reset();
  partial_runs_ = 0;
  return true;
}

bool SweepScheduler::ShouldRetryPartial(util::Date today, util::TimePoint now, uint64_t failed) {
  if (retry_date_ != today) {
    retry_date_   = today;
    partial_runs_ = 0;
  }

  if (partial_runs_ >= partial_retries_) {
    STREAK_LOG_WARN("sweep: failed habits left for today",
                    {DateField("as_of", today), UIntField("failed", failed), UIntField("runs", partial_runs_ + 1)});
    return false;
  }

  const auto backoff = poll_interval_ * (int64_t{1} << std::min<uint32_t>(partial_runs_, 16));
  ++partial_runs_;
  next_retry_at_ = now + backoff;

  STREAK_LOG_WARN("sweep: partial failure, will retry",
                  {DateField("as_of", today), UIntField("failed", failed), UIntField("retry", partial_runs_),
                   TimestampField("next_run", next_retry_at_)});
  return true;
}

std::optional<util::Date> SweepScheduler::LastRunDate() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_run_;
}

void SweepScheduler::Run() {
  STREAK_LOG_INFO("sweep scheduler started");
  while (running_) {
    RunIfDue();

    std::unique_lock<std::mutex> lock(mutex_);
    wake_.wait_for(lock, poll_interval_, [this] { return !running_; });
  }
  STREAK_LOG_INFO("sweep scheduler stopped");
}

} // namespace streak::sweep
