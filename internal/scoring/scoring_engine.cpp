#include "scoring_engine.hpp"

#include <algorithm>
#include <cmath>

#include "internal/observability/logging.hpp"
#include "internal/observability/observe.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace streak::scoring {

using observability::DateField;
using observability::IntField;
using observability::StringField;
using observability::UIntField;

namespace {

model::UserScoreProfile FromRecord(const db::model::ProfileRecord& record) {
  return model::UserScoreProfile{record.user_id, record.score, record.current_streak, record.longest_streak,
                                 record.version};
}

db::model::ProfileRecord ToRecord(const model::UserScoreProfile& profile) {
  return db::model::ProfileRecord{profile.user_id, profile.score, profile.current_streak, profile.longest_streak,
                                  profile.version};
}

model::UserScoreProfile LoadProfile(db::Repository& repository, db::Transaction& tx, const std::string& user_id) {
  auto record = repository.GetProfile(tx, user_id);
  if (!record) {
    throw util::NotFound("score profile for user " + user_id + " not found");
  }
  return FromRecord(*record);
}

} // namespace

ScoringEngine::ScoringEngine(std::shared_ptr<db::Repository> repository,
                             std::shared_ptr<habit::HabitStreakTracker> tracker, ScoringOptions options)
    : repository_(std::move(repository)), tracker_(std::move(tracker)), options_(options) {
  // habit_days.penalty_applied holds 1..3 for a charged day
  if (options_.policy.max_penalty == 0 || options_.policy.max_penalty > 3) {
    throw util::InvalidArgument("max penalty must be between 1 and 3");
  }
  if (options_.policy.base_penalty == 0) {
    throw util::InvalidArgument("base penalty must be positive");
  }
  if (options_.max_attempts == 0) {
    options_.max_attempts = 1;
  }
}

util::Deadline ScoringEngine::DefaultDeadline() const {
  if (options_.default_deadline) {
    return util::Deadline::After(*options_.default_deadline);
  }
  return util::Deadline::Never();
}

model::ScoreDelta ScoringEngine::OnApproval(const std::string& user_id, const std::string& habit_id,
                                            util::Date date) {
  return OnApproval(user_id, habit_id, date, DefaultDeadline());
}

model::ScoreDelta ScoringEngine::OnApproval(const std::string& user_id, const std::string& habit_id, util::Date date,
                                            const util::Deadline& deadline) {
  return observability::ObserveCall("ScoringEngine.OnApproval", user_id, [&] {
    for (uint32_t attempt = 1; attempt <= options_.max_attempts; ++attempt) {
      if (deadline.Expired()) {
        throw util::Timeout("approval for " + user_id + "/" + habit_id + ": deadline exceeded");
      }

      auto       tx      = repository_->Begin();
      const auto profile = LoadProfile(*repository_, *tx, user_id);
      const auto streak  = tracker_->RecordCompletion(*tx, user_id, habit_id, date);
      const auto points  = options_.policy.ApprovalPoints(streak);

      auto updated           = profile;
      updated.score          = profile.score + points;
      updated.current_streak = streak;
      updated.longest_streak = std::max(profile.longest_streak, streak);

      const auto result = repository_->CompareAndSwapProfile(*tx, profile.version, ToRecord(updated));
      if (result.code == db::ErrorCode::Conflict) {
        tx->Rollback();
        observability::Metrics::Instance().RecordCasConflict("profile");
        STREAK_LOG_WARN("profile version conflict, retrying",
                        {StringField("user_id", user_id), IntField("attempt", attempt)});
        continue;
      }
      db::ThrowIfDbError(result, "update score profile for " + user_id);
      tx->Commit();

      return model::ScoreDelta{points, updated.score, updated.current_streak};
    }

    throw util::ConcurrentUpdateConflict("approval for " + user_id + "/" + habit_id + ": gave up after " +
                                         std::to_string(options_.max_attempts) + " attempts");
  });
}

model::ScoreDelta ScoringEngine::OnMiss(const std::string& user_id, const std::string& habit_id, util::Date date) {
  return OnMiss(user_id, habit_id, date, DefaultDeadline());
}

model::ScoreDelta ScoringEngine::OnMiss(const std::string& user_id, const std::string& habit_id, util::Date date,
                                        const util::Deadline& deadline) {
  return observability::ObserveCall("ScoringEngine.OnMiss", user_id, [&] {
    for (uint32_t attempt = 1; attempt <= options_.max_attempts; ++attempt) {
      if (deadline.Expired()) {
        throw util::Timeout("miss for " + user_id + "/" + habit_id + ": deadline exceeded");
      }

      auto       tx      = repository_->Begin();
      const auto profile = LoadProfile(*repository_, *tx, user_id);
      const auto outcome = tracker_->RecordMiss(*tx, user_id, habit_id, date);

      const model::ScoreDelta unchanged{0, profile.score, profile.current_streak};
      if (outcome.completed || outcome.penalty_applied != 0) {
        tx->Commit();
        return unchanged;
      }

      const auto penalty = options_.policy.MissPenalty(outcome.consecutive_misses);
      if (!tracker_->ClaimPenalty(*tx, user_id, habit_id, date, penalty)) {
        tx->Commit();
        return unchanged;
      }

      auto updated           = profile;
      updated.score          = profile.score > penalty ? profile.score - penalty : 0;
      updated.current_streak = profile.current_streak > options_.policy.streak_decrement
                                   ? profile.current_streak - options_.policy.streak_decrement
                                   : 0;

      const auto result = repository_->CompareAndSwapProfile(*tx, profile.version, ToRecord(updated));
      if (result.code == db::ErrorCode::Conflict) {
        tx->Rollback();
        observability::Metrics::Instance().RecordCasConflict("profile");
        STREAK_LOG_WARN("profile version conflict, retrying",
                        {StringField("user_id", user_id), IntField("attempt", attempt)});
        continue;
      }
      db::ThrowIfDbError(result, "update score profile for " + user_id);
      tx->Commit();

      observability::Metrics::Instance().RecordPenaltyPoints(penalty);
      STREAK_LOG_INFO("applied miss penalty",
                      {StringField("user_id", user_id), StringField("habit_id", habit_id), DateField("date", date),
                       UIntField("penalty", penalty), UIntField("consecutive_misses", outcome.consecutive_misses),
                       UIntField("score", updated.score)});
      return model::ScoreDelta{penalty, updated.score, updated.current_streak};
    }

    throw util::ConcurrentUpdateConflict("miss for " + user_id + "/" + habit_id + ": gave up after " +
                                         std::to_string(options_.max_attempts) + " attempts");
  });
}

model::UserScoreProfile ScoringEngine::GetUserScoreProfile(const std::string& user_id) {
  auto       tx      = repository_->Begin();
  const auto profile = LoadProfile(*repository_, *tx, user_id);
  tx->Commit();
  return profile;
}

model::UserScoreProfile ScoringEngine::EnsureProfile(const std::string& user_id) {
  if (user_id.empty()) {
    throw util::InvalidArgument("user id must not be empty");
  }

  auto tx = repository_->Begin();

  db::model::ProfileRecord fresh;
  fresh.user_id = user_id;
  fresh.version = 1;

  const auto inserted = repository_->InsertProfile(*tx, fresh);
  if (!inserted && inserted.code != db::ErrorCode::AlreadyExists) {
    db::ThrowIfDbError(inserted, "create score profile for " + user_id);
  }

  const auto profile = LoadProfile(*repository_, *tx, user_id);
  tx->Commit();
  return profile;
}

model::ScoringStats ScoringEngine::GetScoringStats(const std::string& user_id, util::Date as_of) {
  const auto profile = GetUserScoreProfile(user_id);
  const auto window  = std::max<uint32_t>(options_.stats_window_days, 1);
  auto       history = tracker_->ListUserDays(user_id, as_of - std::chrono::days(window - 1), as_of);

  model::ScoringStats stats;
  stats.score          = profile.score;
  stats.current_streak = profile.current_streak;
  stats.longest_streak = profile.longest_streak;
  stats.total_days     = static_cast<uint32_t>(history.size());
  stats.completed_days =
      static_cast<uint32_t>(std::count_if(history.begin(), history.end(), [](const auto& day) { return day.completed; }));
  if (stats.total_days > 0) {
    stats.success_rate =
        static_cast<uint32_t>(std::lround(100.0 * stats.completed_days / static_cast<double>(stats.total_days)));
  }

  if (history.size() > options_.recent_days) {
    history.resize(options_.recent_days);
  }
  stats.recent_days = std::move(history);
  return stats;
}

} // namespace streak::scoring
