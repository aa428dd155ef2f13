#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/schema.hpp"

namespace archstore::migration {

using RecordTransform = std::function<void(const model::Record& source, model::Record& target)>;

// Additions on top of an inferred mapping.
struct CustomMapping {
  // entity -> (source field -> target field)
  std::map<std::string, std::map<std::string, std::string>> renames;

  // Runs after fields are mapped; may fill derived values.
  RecordTransform transform;
};

/*
  Field-level mapping of records from one schema model to the next.

  Inferred mappings copy fields present in both models, fill new fields
  with their defaults and drop removed fields. Entities missing from the
  target model are dropped. Inference fails with util::MigrationFailed when
  a required target field has neither a source nor a default, or a field
  changes to an incompatible kind.
*/
class SchemaMapping {
 public:
  static SchemaMapping Infer(const model::SchemaModel& source, const model::SchemaModel& target);
  static SchemaMapping Custom(const model::SchemaModel& source, const model::SchemaModel& target, const CustomMapping& custom);

  // nullopt when the entity does not exist in the target model.
  std::optional<model::Record> Apply(const model::Record& source) const;

  const std::string& SourceVersion() const {
    return source_version_;
  }

  const std::string& TargetVersion() const {
    return target_version_;
  }

 private:
  struct FieldRule {
    std::string                target_field;
    std::optional<std::string> source_field;
    model::FieldValue          default_value;
  };

  static SchemaMapping Build(const model::SchemaModel& source, const model::SchemaModel& target,
                             const std::map<std::string, std::map<std::string, std::string>>& renames);

  std::string                                   source_version_;
  std::string                                   target_version_;
  std::map<std::string, std::vector<FieldRule>> entities_;
  RecordTransform                               transform_;
};

// Whether a stored value of kind `from` can be carried into kind `to`.
bool CompatibleKinds(model::FieldKind from, model::FieldKind to);

} // namespace archstore::migration
