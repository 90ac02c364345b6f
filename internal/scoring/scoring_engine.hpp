#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/habit/habit_streak_tracker.hpp"
#include "internal/model/user_score_profile.hpp"
#include "internal/scoring/scoring_policy.hpp"
#include "internal/util/deadline.hpp"
#include "internal/util/time.hpp"

namespace streak::scoring {

struct ScoringOptions {
  ScoringPolicy policy;

  uint32_t                                 max_attempts = 5;
  std::optional<std::chrono::milliseconds> default_deadline;

  uint32_t stats_window_days = 30;
  uint32_t recent_days       = 7;
};

/*
  Sole writer of UserScoreProfile.

  Each attempt of OnApproval / OnMiss is one transaction: ledger write,
  profile read, versioned profile update. A version conflict rolls the whole
  attempt back (ledger write included) and retries, so a completion or a
  penalty is never counted twice for one (user, habit, date).
*/
class ScoringEngine {
 public:
  ScoringEngine(std::shared_ptr<db::Repository> repository, std::shared_ptr<habit::HabitStreakTracker> tracker,
                ScoringOptions options = {});

  // points = policy.ApprovalPoints(habit streak); profile streak = habit streak
  model::ScoreDelta OnApproval(const std::string& user_id, const std::string& habit_id, util::Date date);
  model::ScoreDelta OnApproval(const std::string& user_id, const std::string& habit_id, util::Date date,
                               const util::Deadline& deadline);

  // points = penalty charged (0 when the day was completed or already charged)
  model::ScoreDelta OnMiss(const std::string& user_id, const std::string& habit_id, util::Date date);
  model::ScoreDelta OnMiss(const std::string& user_id, const std::string& habit_id, util::Date date,
                           const util::Deadline& deadline);

  // NotFound when the user has no profile.
  model::UserScoreProfile GetUserScoreProfile(const std::string& user_id);

  // Idempotent create with zero score.
  model::UserScoreProfile EnsureProfile(const std::string& user_id);

  model::ScoringStats GetScoringStats(const std::string& user_id, util::Date as_of);

  const ScoringPolicy& Policy() const {
    return options_.policy;
  }

 private:
  util::Deadline DefaultDeadline() const;

  std::shared_ptr<db::Repository>            repository_;
  std::shared_ptr<habit::HabitStreakTracker> tracker_;
  ScoringOptions                             options_;
};

} // namespace streak::scoring
