#include "send_tally.hpp"

#include "internal/util/errors.hpp"

namespace streak::tally {

SendTally::SendTally(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

uint64_t SendTally::RecordSnapsSent(const std::string& user_id, uint64_t count) {
  if (user_id.empty()) {
    throw util::InvalidArgument("user id must not be empty");
  }
  if (count == 0) {
    throw util::InvalidArgument("snap count must be positive");
  }

  auto tx = repository_->Begin();
  db::ThrowIfDbError(repository_->AddSnapsSent(*tx, user_id, count), "record snaps sent for " + user_id);
  const auto total = repository_->GetSnapsSent(*tx, user_id);
  tx->Commit();
  return total;
}

uint64_t SendTally::GetSnapsSent(const std::string& user_id) {
  auto       tx    = repository_->Begin();
  const auto total = repository_->GetSnapsSent(*tx, user_id);
  tx->Commit();
  return total;
}

} // namespace streak::tally
