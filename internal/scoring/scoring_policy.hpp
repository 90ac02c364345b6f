#pragma once

#include <algorithm>
#include <cstdint>

namespace streak::scoring {

/*
  Score constants.

  approval: base_points, plus streak / bonus_block_days once the habit
            streak reaches one full block (7 -> +1, 14 -> +2, 21 -> +3)
  miss:     base_penalty + progressive_step per prior consecutive miss,
            capped at max_penalty (1, 2, 3, 3, ...)
*/
struct ScoringPolicy {
  uint32_t base_points      = 1;
  uint32_t bonus_block_days = 7;
  uint32_t base_penalty     = 1;
  uint32_t progressive_step = 1;
  uint32_t max_penalty      = 3;
  uint32_t streak_decrement = 1;

  uint64_t StreakBonus(uint32_t habit_streak) const {
    if (bonus_block_days == 0 || habit_streak < bonus_block_days) {
      return 0;
    }
    return habit_streak / bonus_block_days;
  }

  uint64_t ApprovalPoints(uint32_t habit_streak) const {
    return base_points + StreakBonus(habit_streak);
  }

  uint32_t MissPenalty(uint32_t consecutive_misses) const {
    const uint64_t uncapped = static_cast<uint64_t>(base_penalty) + static_cast<uint64_t>(progressive_step) * consecutive_misses;
    return static_cast<uint32_t>(std::min<uint64_t>(uncapped, max_penalty));
  }
};

} // namespace streak::scoring
