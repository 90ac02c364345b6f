#pragma once

#include <cstdint>
#include <string>

namespace streak::db::model {

/*
  Persistent pair streak row.

  IMPORTANT:
  - (id_a, id_b) is the canonical pair key, id_a < id_b.
  - Version is the optimistic concurrency token. Every successful
    compare-and-swap bumps it by one.
  - Timestamps are epoch ms, 0 = null.
*/

struct PairStreakRecord {
  std::string id_a;
  std::string id_b;

  uint32_t current_streak = 0;
  uint32_t longest_streak = 0;

  uint64_t last_action_a_ms = 0;
  uint64_t last_action_b_ms = 0;

  uint64_t started_at_ms = 0;
  uint64_t expires_at_ms = 0;

  uint64_t version = 0;
};

} // namespace streak::db::model
