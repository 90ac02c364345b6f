#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "internal/db/api/repository.hpp"

namespace streak::tally {

// "Snaps sent" counter. Independent of the approval score.
class SendTally {
 public:
  explicit SendTally(std::shared_ptr<db::Repository> repository);

  // Returns the new total.
  uint64_t RecordSnapsSent(const std::string& user_id, uint64_t count = 1);

  uint64_t GetSnapsSent(const std::string& user_id);

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace streak::tally
