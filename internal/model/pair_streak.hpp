#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/util/time.hpp"

namespace streak::model {

struct PairStreak {
  std::string id_a;
  std::string id_b;

  uint32_t current_streak = 0;
  uint32_t longest_streak = 0;

  std::optional<util::TimePoint> last_action_a;
  std::optional<util::TimePoint> last_action_b;
  std::optional<util::TimePoint> streak_started_at;
  std::optional<util::TimePoint> streak_expires_at;

  uint64_t version = 0;

  std::optional<util::TimePoint>& LastAction(bool low_side) {
    return low_side ? last_action_a : last_action_b;
  }

  const std::optional<util::TimePoint>& LastAction(bool low_side) const {
    return low_side ? last_action_a : last_action_b;
  }
};

// Per-user view of one pair, as listed for the user's streak screen.
struct PairStreakView {
  std::string friend_id;

  uint32_t current_streak = 0;
  uint32_t longest_streak = 0;

  std::optional<util::TimePoint> my_last_action;
  std::optional<util::TimePoint> friend_last_action;
  std::optional<util::TimePoint> streak_started_at;
  std::optional<util::TimePoint> streak_expires_at;

  bool is_active           = false;
  bool needs_my_action     = false;
  bool needs_friend_action = false;
  bool expired             = false;
};

} // namespace streak::model
