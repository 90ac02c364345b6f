#pragma once

#include <chrono>
#include <cstdint>

#include "internal/model/pair_streak.hpp"

namespace streak::model {

enum class PairState : std::uint8_t {
  kIdle      = 0,
  kOneSided  = 1,
  kBothActed = 2,
  kExpired   = 3,
};

constexpr const char* PairStateName(PairState state) {
  switch (state) {
    case PairState::kIdle:
      return "idle";
    case PairState::kOneSided:
      return "one_sided";
    case PairState::kBothActed:
      return "both_acted";
    case PairState::kExpired:
      return "expired";
  }
  return "unknown";
}

// Expiry is strict: an action exactly at streak_expires_at still counts.
inline bool IsExpired(const PairStreak& streak, util::TimePoint now) {
  return streak.streak_expires_at.has_value() && now > *streak.streak_expires_at;
}

// Whether the other side's last action completes the exchange at `now`.
// No upper bound: an action stamped after `now` came from a concurrent caller.
inline bool OtherSideCounts(const std::optional<util::TimePoint>& other_action, util::TimePoint now,
                            std::chrono::milliseconds window) {
  return other_action.has_value() && *other_action >= now - window;
}

// State of the stored record at `now`. kBothActed is never stored: the
// transition clears both sides when it fires.
inline PairState Classify(const PairStreak& streak, util::TimePoint now) {
  if (IsExpired(streak, now)) {
    return PairState::kExpired;
  }
  if (streak.last_action_a.has_value() != streak.last_action_b.has_value()) {
    return PairState::kOneSided;
  }
  if (streak.last_action_a.has_value()) {
    return PairState::kBothActed;
  }
  return PairState::kIdle;
}

} // namespace streak::model
