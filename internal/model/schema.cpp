#include "schema.hpp"

#include "internal/util/errors.hpp"

namespace archstore::model {

const char* FieldKindName(FieldKind kind) {
  switch (kind) {
    case FieldKind::kInt:
      return "int";
    case FieldKind::kDouble:
      return "double";
    case FieldKind::kBool:
      return "bool";
    case FieldKind::kString:
      return "string";
    case FieldKind::kJson:
      return "json";
  }
  return "unknown";
}

bool MatchesKind(const FieldValue& value, FieldKind kind) {
  switch (kind) {
    case FieldKind::kInt:
      return std::holds_alternative<std::int64_t>(value);
    case FieldKind::kDouble:
      // integers are accepted where doubles are expected
      return std::holds_alternative<double>(value) || std::holds_alternative<std::int64_t>(value);
    case FieldKind::kBool:
      return std::holds_alternative<bool>(value);
    case FieldKind::kString:
    case FieldKind::kJson:
      return std::holds_alternative<std::string>(value);
  }
  return false;
}

const FieldSpec* EntitySpec::FindField(const std::string& field) const {
  for (const auto& spec : fields) {
    if (spec.name == field) return &spec;
  }
  return nullptr;
}

const EntitySpec* SchemaModel::FindEntity(const std::string& entity) const {
  for (const auto& spec : entities) {
    if (spec.name == entity) return &spec;
  }
  return nullptr;
}

void SchemaModel::ApplyDefaults(Record& record) const {
  const auto* entity = FindEntity(record.entity);
  if (!entity) return;
  for (const auto& field : entity->fields) {
    if (!record.fields.contains(field.name) && !std::holds_alternative<std::monostate>(field.default_value)) {
      record.fields[field.name] = field.default_value;
    }
  }
}

void SchemaCatalog::Register(SchemaModel model) {
  auto version     = model.version;
  models_[version] = std::make_shared<const SchemaModel>(std::move(model));
  if (current_.empty()) current_ = version;
}

bool SchemaCatalog::Has(const std::string& version) const {
  return models_.contains(version);
}

const SchemaModel& SchemaCatalog::Get(const std::string& version) const {
  return *Share(version);
}

std::shared_ptr<const SchemaModel> SchemaCatalog::Share(const std::string& version) const {
  auto it = models_.find(version);
  if (it == models_.end()) {
    throw util::NotFound("unknown schema version " + version);
  }
  return it->second;
}

std::vector<std::string> SchemaCatalog::Versions() const {
  std::vector<std::string> versions;
  versions.reserve(models_.size());
  for (const auto& [version, _] : models_) versions.push_back(version);
  return versions;
}

void SchemaCatalog::SetCurrentVersion(std::string version) {
  if (!Has(version)) {
    throw util::NotFound("unknown schema version " + version);
  }
  current_ = std::move(version);
}

} // namespace archstore::model
