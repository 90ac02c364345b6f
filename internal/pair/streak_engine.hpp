#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/pair_state.hpp"
#include "internal/model/pair_streak.hpp"
#include "internal/pair/pair_streak_store.hpp"
#include "internal/util/deadline.hpp"
#include "internal/util/time.hpp"

namespace streak::pair {

struct EngineOptions {
  std::chrono::milliseconds pair_window{std::chrono::hours(24)};
  uint32_t                  max_attempts = 5;
  // applied by the overloads that take no deadline
  std::optional<std::chrono::milliseconds> default_deadline;
};

struct ActionResult {
  uint32_t current_streak = 0;
  uint32_t longest_streak = 0;
  bool     increased      = false;
};

// Outcome of applying one action to a stored record.
struct Transition {
  model::PairStreak next;
  model::PairState  state     = model::PairState::kIdle;
  bool              increased = false;
};

/*
  Pair streak state machine.

  RecordAction is read -> compute -> compare-and-swap, retried up to
  max_attempts times on a version conflict. Opposite-direction calls for one
  pair (A->B, B->A) touch the same canonical row and are linearized by the
  version check; exactly one of them sees the other's action.
*/
class StreakEngine {
 public:
  StreakEngine(std::shared_ptr<PairStreakStore> store, std::shared_ptr<const util::Clock> clock,
               EngineOptions options = {});

  ActionResult RecordAction(const std::string& sender_id, const std::string& receiver_id);
  ActionResult RecordAction(const std::string& sender_id, const std::string& receiver_id, util::TimePoint now);
  ActionResult RecordAction(const std::string& sender_id, const std::string& receiver_id, util::TimePoint now,
                            const util::Deadline& deadline);

  // Argument order does not matter.
  std::optional<model::PairStreak> GetPairStreak(const std::string& user_a, const std::string& user_b);

  // Sorted by current streak, longest first; ties by friend id.
  std::vector<model::PairStreakView> ListPairStreaks(const std::string& user_id);
  std::vector<model::PairStreakView> ListPairStreaks(const std::string& user_id, util::TimePoint now);

  // Pure transition; `current` is left untouched.
  static Transition Apply(const model::PairStreak& current, bool sender_is_low, util::TimePoint now,
                          std::chrono::milliseconds window);

  const EngineOptions& Options() const {
    return options_;
  }

 private:
  util::Deadline DefaultDeadline() const;

  std::shared_ptr<PairStreakStore>   store_;
  std::shared_ptr<const util::Clock> clock_;
  EngineOptions                      options_;
};

} // namespace streak::pair
