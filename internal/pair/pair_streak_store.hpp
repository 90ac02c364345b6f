#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/pair_streak.hpp"

namespace streak::pair {

/*
  Persistence for one PairStreak per canonical pair.

  Every call is its own short transaction; no lock is held between a read
  and the CompareAndSwap that follows it.
*/
class PairStreakStore {
 public:
  explicit PairStreakStore(std::shared_ptr<db::Repository> repository);

  // Zero-state row on first access. Concurrent creators converge on one row
  // (insert, on conflict fetch).
  model::PairStreak GetOrCreate(const std::string& low, const std::string& high);

  // Stores `updated` only if the stored version still equals old.version.
  // On success the stored version is old.version + 1. False on conflict.
  bool CompareAndSwap(const model::PairStreak& old, const model::PairStreak& updated);

  std::optional<model::PairStreak> Get(const std::string& low, const std::string& high);

  std::vector<model::PairStreak> ListForUser(const std::string& user_id);

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace streak::pair
