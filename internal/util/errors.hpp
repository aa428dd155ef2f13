#pragma once

#include <stdexcept>
#include <string>

namespace archstore::util {

/*
  Central error types.

  Every error raised above the db layer derives from StoreError and carries
  its class. The CLI maps classes to exit codes; the engine treats fatal
  classes as terminal.
*/

enum class ErrorClass {
  kValidation,
  kConflict,
  kCorruption,
  kMigrationPathNotFound,
  kMigration,
  kIO,
  kRollbackFailure,
  kNotFound,
  kAlreadyExists,
  kInvalidState,
  kTooFrequent,
  kForbidden,
  kCancelled,
  kTimeout,
};

class StoreError : public std::runtime_error {
 public:
  StoreError(ErrorClass error_class, const std::string& msg) : std::runtime_error(msg), error_class_(error_class) {
  }

  ErrorClass Class() const {
    return error_class_;
  }

 private:
  ErrorClass error_class_;
};

// Bad field or relationship state on one record.
class ValidationError : public StoreError {
 public:
  ValidationError(std::string record_id, const std::string& msg)
      : StoreError(ErrorClass::kValidation, "record " + record_id + ": " + msg), record_id_(std::move(record_id)) {
  }

  const std::string& RecordId() const {
    return record_id_;
  }

 private:
  std::string record_id_;
};

class ConflictError : public StoreError {
 public:
  ConflictError(std::string record_id, std::string field)
      : StoreError(ErrorClass::kConflict, "conflicting write on record " + record_id + " field " + field),
        record_id_(std::move(record_id)),
        field_(std::move(field)) {
  }

  const std::string& RecordId() const {
    return record_id_;
  }
  const std::string& Field() const {
    return field_;
  }

 private:
  std::string record_id_;
  std::string field_;
};

class CorruptionError : public StoreError {
 public:
  explicit CorruptionError(const std::string& msg) : StoreError(ErrorClass::kCorruption, msg) {
  }
};

class MigrationPathNotFound : public StoreError {
 public:
  MigrationPathNotFound(std::string from, std::string to)
      : StoreError(ErrorClass::kMigrationPathNotFound, "no migration path from " + from + " to " + to),
        from_(std::move(from)),
        to_(std::move(to)) {
  }

  const std::string& From() const {
    return from_;
  }
  const std::string& To() const {
    return to_;
  }

 private:
  std::string from_;
  std::string to_;
};

class MigrationFailed : public StoreError {
 public:
  explicit MigrationFailed(const std::string& msg) : StoreError(ErrorClass::kMigration, msg) {
  }
};

class StorageIOError : public StoreError {
 public:
  explicit StorageIOError(const std::string& msg) : StoreError(ErrorClass::kIO, msg) {
  }
};

// Undo of a failed operation failed; store consistency is unknown.
class RollbackFailure : public StoreError {
 public:
  explicit RollbackFailure(const std::string& msg) : StoreError(ErrorClass::kRollbackFailure, msg) {
  }
};

class NotFound : public StoreError {
 public:
  explicit NotFound(const std::string& msg) : StoreError(ErrorClass::kNotFound, msg) {
  }
};

class AlreadyExists : public StoreError {
 public:
  explicit AlreadyExists(const std::string& msg) : StoreError(ErrorClass::kAlreadyExists, msg) {
  }
};

class InvalidState : public StoreError {
 public:
  explicit InvalidState(const std::string& msg) : StoreError(ErrorClass::kInvalidState, msg) {
  }
};

class TooFrequent : public StoreError {
 public:
  explicit TooFrequent(const std::string& msg) : StoreError(ErrorClass::kTooFrequent, msg) {
  }
};

class OperationForbidden : public StoreError {
 public:
  explicit OperationForbidden(const std::string& msg) : StoreError(ErrorClass::kForbidden, msg) {
  }
};

class OperationCancelled : public StoreError {
 public:
  explicit OperationCancelled(const std::string& msg) : StoreError(ErrorClass::kCancelled, msg) {
  }
};

class OperationTimedOut : public StoreError {
 public:
  explicit OperationTimedOut(const std::string& msg) : StoreError(ErrorClass::kTimeout, msg) {
  }
};

inline bool IsFatal(const StoreError& error) {
  return error.Class() == ErrorClass::kIO || error.Class() == ErrorClass::kRollbackFailure;
}

const char* ErrorClassName(ErrorClass error_class);

} // namespace archstore::util
