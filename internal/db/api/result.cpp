#include "result.hpp"

#include "internal/util/errors.hpp"

namespace archstore::db {

void ThrowIfError(const Result& result, const std::string& context) {
  if (result) return;

  const auto message = context + ": " + result.message;
  switch (result.code) {
    case ErrorCode::NotFound:
      throw util::NotFound(message);
    case ErrorCode::AlreadyExists:
      throw util::AlreadyExists(message);
    case ErrorCode::Conflict:
    case ErrorCode::Busy:
      throw util::InvalidState(message);
    case ErrorCode::ConstraintViolation:
      throw util::ValidationError("", message);
    case ErrorCode::Corruption:
      throw util::CorruptionError(message);
    case ErrorCode::IOError:
      throw util::StorageIOError(message);
    case ErrorCode::OK:
      return;
    case ErrorCode::Unsupported:
    case ErrorCode::InternalError:
      break;
  }
  throw util::InvalidState(message);
}

} // namespace archstore::db
