#include "pair_streak_store.hpp"

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace streak::pair {

namespace {

db::model::PairStreakRecord ToRecord(const model::PairStreak& streak) {
  db::model::PairStreakRecord record;
  record.id_a             = streak.id_a;
  record.id_b             = streak.id_b;
  record.current_streak   = streak.current_streak;
  record.longest_streak   = streak.longest_streak;
  record.last_action_a_ms = util::ToNullableMillis(streak.last_action_a);
  record.last_action_b_ms = util::ToNullableMillis(streak.last_action_b);
  record.started_at_ms    = util::ToNullableMillis(streak.streak_started_at);
  record.expires_at_ms    = util::ToNullableMillis(streak.streak_expires_at);
  record.version          = streak.version;
  return record;
}

model::PairStreak FromRecord(const db::model::PairStreakRecord& record) {
  model::PairStreak streak;
  streak.id_a              = record.id_a;
  streak.id_b              = record.id_b;
  streak.current_streak    = record.current_streak;
  streak.longest_streak    = record.longest_streak;
  streak.last_action_a     = util::FromNullableMillis(record.last_action_a_ms);
  streak.last_action_b     = util::FromNullableMillis(record.last_action_b_ms);
  streak.streak_started_at = util::FromNullableMillis(record.started_at_ms);
  streak.streak_expires_at = util::FromNullableMillis(record.expires_at_ms);
  streak.version           = record.version;
  return streak;
}

} // namespace

PairStreakStore::PairStreakStore(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

model::PairStreak PairStreakStore::GetOrCreate(const std::string& low, const std::string& high) {
  if (!(low < high)) {
    throw util::InvalidPair("pair key must be canonical: '" + low + "' < '" + high + "'");
  }

  auto tx = repository_->Begin();

  db::model::PairStreakRecord zero;
  zero.id_a    = low;
  zero.id_b    = high;
  zero.version = 1;

  const auto inserted = repository_->InsertPairStreak(*tx, zero);
  if (inserted) {
    tx->Commit();
    return FromRecord(zero);
  }
  if (inserted.code != db::ErrorCode::AlreadyExists) {
    db::ThrowIfDbError(inserted, "insert pair streak");
  }

  auto existing = repository_->GetPairStreak(*tx, low, high);
  if (!existing) {
    throw util::StorageError("pair streak " + low + "/" + high + " reported present but not readable");
  }
  tx->Commit();
  return FromRecord(*existing);
}

bool PairStreakStore::CompareAndSwap(const model::PairStreak& old, const model::PairStreak& updated) {
  if (old.id_a != updated.id_a || old.id_b != updated.id_b) {
    throw util::InvalidArgument("compare-and-swap across different pairs");
  }

  auto       tx     = repository_->Begin();
  const auto result = repository_->CompareAndSwapPairStreak(*tx, old.version, ToRecord(updated));
  if (result.code == db::ErrorCode::Conflict) {
    tx->Rollback();
    return false;
  }
  db::ThrowIfDbError(result, "compare-and-swap pair streak");

  tx->Commit();
  return true;
}

std::optional<model::PairStreak> PairStreakStore::Get(const std::string& low, const std::string& high) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetPairStreak(*tx, low, high);
  tx->Commit();

  if (!record) {
    return std::nullopt;
  }
  return FromRecord(*record);
}

std::vector<model::PairStreak> PairStreakStore::ListForUser(const std::string& user_id) {
  auto tx      = repository_->Begin();
  auto records = repository_->ListPairStreaksForUser(*tx, user_id);
  tx->Commit();

  std::vector<model::PairStreak> out;
  out.reserve(records.size());
  for (const auto& record : records) {
    out.push_back(FromRecord(record));
  }
  return out;
}

} // namespace streak::pair
