#pragma once

#include <functional>
#include <memory>
#include <string>

#include "internal/model/schema.hpp"

namespace archstore::storage {

/*
  Commit-time record validation against the store's schema model.

  Throws util::ValidationError naming the failing record. `exists` answers
  whether an id is live in the state being committed (durable rows plus
  pending inserts, minus pending deletes).
*/
class RecordValidator {
 public:
  using ExistsFn = std::function<bool(const std::string& id)>;

  explicit RecordValidator(std::shared_ptr<const model::SchemaModel> schema);

  void Validate(const model::Record& record, const ExistsFn& exists) const;

  const model::SchemaModel& Schema() const {
    return *schema_;
  }

 private:
  std::shared_ptr<const model::SchemaModel> schema_;
};

} // namespace archstore::storage
