#pragma once

#include <cstdint>
#include <string>

namespace streak::db::model {

struct ProfileRecord {
  std::string user_id;

  uint64_t score          = 0;
  uint32_t current_streak = 0;
  uint32_t longest_streak = 0;

  // optimistic concurrency token
  uint64_t version = 0;
};

} // namespace streak::db::model
