#include "errors.hpp"

namespace archstore::util {

const char* ErrorClassName(ErrorClass error_class) {
  switch (error_class) {
    case ErrorClass::kValidation:
      return "validation";
    case ErrorClass::kConflict:
      return "conflict";
    case ErrorClass::kCorruption:
      return "corruption";
    case ErrorClass::kMigrationPathNotFound:
      return "migration_path_not_found";
    case ErrorClass::kMigration:
      return "migration";
    case ErrorClass::kIO:
      return "io";
    case ErrorClass::kRollbackFailure:
      return "rollback_failure";
    case ErrorClass::kNotFound:
      return "not_found";
    case ErrorClass::kAlreadyExists:
      return "already_exists";
    case ErrorClass::kInvalidState:
      return "invalid_state";
    case ErrorClass::kTooFrequent:
      return "too_frequent";
    case ErrorClass::kForbidden:
      return "forbidden";
    case ErrorClass::kCancelled:
      return "cancelled";
    case ErrorClass::kTimeout:
      return "timeout";
  }
  return "unknown";
}

} // namespace archstore::util
