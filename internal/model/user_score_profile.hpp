#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/model/habit_day.hpp"

namespace streak::model {

struct UserScoreProfile {
  std::string user_id;
  uint64_t    score          = 0;
  uint32_t    current_streak = 0;
  uint32_t    longest_streak = 0;
  uint64_t    version        = 0;
};

// Result of OnApproval / OnMiss.
struct ScoreDelta {
  // points added (approval) or removed (miss)
  uint64_t points     = 0;
  uint64_t new_score  = 0;
  uint32_t new_streak = 0;
};

struct ScoringStats {
  uint64_t score          = 0;
  uint32_t current_streak = 0;
  uint32_t longest_streak = 0;

  uint32_t completed_days = 0;
  uint32_t total_days     = 0;
  // percent, rounded
  uint32_t success_rate = 0;

  std::vector<HabitDay> recent_days;
};

} // namespace streak::model
