#pragma once

#include <string>

namespace streak::model {

// Canonical key of an unordered friend pair: low < high.
struct PairKey {
  std::string low;
  std::string high;
  // true when the acting user is the low side (column *_a)
  bool is_low_side = false;
};

// Throws util::InvalidPair on a self-pair or an empty id.
PairKey Canonicalize(const std::string& actor_id, const std::string& other_id);

} // namespace streak::model
