#include "unit_of_work.hpp"

namespace booking::core {

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto detail  = result.message.empty() ? std::string(db::ToString(result.code)) : result.message;
  const auto message = context + ": " + detail;

  // Lock contention inside a unit reruns the unit like a lost commit race.
  if (result.Retryable()) {
    throw db::TransactionConflict(message);
  }

  switch (result.code) {
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    case db::ErrorCode::Conflict:
    case db::ErrorCode::AlreadyExists:
    case db::ErrorCode::ConstraintViolation:
      throw util::InvalidState(message);
    default:
      throw util::StoreUnavailable(message);
  }
}

} // namespace booking::core
