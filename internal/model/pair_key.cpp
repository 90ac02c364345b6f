#include "pair_key.hpp"

#include "internal/util/errors.hpp"

namespace streak::model {

PairKey Canonicalize(const std::string& actor_id, const std::string& other_id) {
  if (actor_id.empty() || other_id.empty()) {
    throw util::InvalidPair("user id must not be empty");
  }
  if (actor_id == other_id) {
    throw util::InvalidPair("user '" + actor_id + "' cannot streak with themself");
  }

  if (actor_id < other_id) {
    return PairKey{actor_id, other_id, true};
  }
  return PairKey{other_id, actor_id, false};
}

} // namespace streak::model
