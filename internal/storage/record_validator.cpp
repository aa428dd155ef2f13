#include "record_validator.hpp"

#include <cmath>

#include "internal/util/errors.hpp"

namespace archstore::storage {

using util::ValidationError;

RecordValidator::RecordValidator(std::shared_ptr<const model::SchemaModel> schema) : schema_(std::move(schema)) {
}

void RecordValidator::Validate(const model::Record& record, const ExistsFn& exists) const {
  if (record.id.empty()) throw ValidationError(record.id, "empty id");

  const auto* entity = schema_->FindEntity(record.entity);
  if (!entity) {
    throw ValidationError(record.id, "unknown entity '" + record.entity + "' for schema " + schema_->version);
  }

  if (record.entity == model::kProjectEntity) {
    if (record.project_id != record.id) throw ValidationError(record.id, "project must own itself");
  } else if (!entity->catalog) {
    if (record.project_id.empty()) throw ValidationError(record.id, "record does not belong to a project");
    if (!exists(record.project_id)) throw ValidationError(record.id, "project " + record.project_id + " does not exist");
  }

  for (const auto& field : entity->fields) {
    const auto* value = record.Find(field.name);
    if (!value || std::holds_alternative<std::monostate>(*value)) {
      if (field.required) throw ValidationError(record.id, "missing required field '" + field.name + "'");
      continue;
    }
    if (!model::MatchesKind(*value, field.kind)) {
      throw ValidationError(record.id, "field '" + field.name + "' expects " + model::FieldKindName(field.kind) + ", got " +
                                           db::model::DescribeValue(*value));
    }
    if (std::holds_alternative<double>(*value) && !std::isfinite(std::get<double>(*value))) {
      throw ValidationError(record.id, "field '" + field.name + "' is not a finite number");
    }
  }

  for (const auto& [name, value] : record.fields) {
    if (!entity->FindField(name)) throw ValidationError(record.id, "unknown field '" + name + "'");
  }

  for (const auto& rel : record.relationships) {
    if (rel.target_id.empty() || !exists(rel.target_id)) {
      throw ValidationError(record.id, "relationship '" + rel.name + "' points to missing record " + rel.target_id);
    }
  }
}

} // namespace archstore::storage
