#include "result.hpp"

#include "internal/util/errors.hpp"

namespace streak::db {

void ThrowIfDbError(const Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case ErrorCode::NotFound:
      throw util::NotFound(message);
    case ErrorCode::Conflict:
    case ErrorCode::SerializationFailure:
      throw util::ConcurrentUpdateConflict(message);
    case ErrorCode::ConstraintViolation:
      throw util::InvalidArgument(message);
    default:
      throw util::StorageError(message);
  }
}

} // namespace streak::db
