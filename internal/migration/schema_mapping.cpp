#include "schema_mapping.hpp"

#include "internal/util/errors.hpp"

namespace archstore::migration {

using model::FieldKind;

bool CompatibleKinds(FieldKind from, FieldKind to) {
  if (from == to) return true;
  if (from == FieldKind::kInt && to == FieldKind::kDouble) return true;
  return (from == FieldKind::kString || from == FieldKind::kJson) && (to == FieldKind::kString || to == FieldKind::kJson);
}

SchemaMapping SchemaMapping::Build(const model::SchemaModel& source, const model::SchemaModel& target,
                                   const std::map<std::string, std::map<std::string, std::string>>& renames) {
  SchemaMapping mapping;
  mapping.source_version_ = source.version;
  mapping.target_version_ = target.version;

  const auto fail = [&](const std::string& why) {
    throw util::MigrationFailed("cannot map " + source.version + " -> " + target.version + ": " + why);
  };

  for (const auto& target_entity : target.entities) {
    const auto* source_entity = source.FindEntity(target_entity.name);
    if (!source_entity) continue;

    // target field -> source field
    std::map<std::string, std::string> renamed;
    if (auto it = renames.find(target_entity.name); it != renames.end()) {
      for (const auto& [from, to] : it->second) {
        if (!source_entity->FindField(from)) fail("renamed field " + target_entity.name + "." + from + " does not exist in the source");
        renamed[to] = from;
      }
    }

    std::vector<FieldRule> rules;
    for (const auto& field : target_entity.fields) {
      FieldRule rule;
      rule.target_field  = field.name;
      rule.default_value = field.default_value;

      std::string source_name = field.name;
      if (auto it = renamed.find(field.name); it != renamed.end()) source_name = it->second;

      const auto* source_field = source_entity->FindField(source_name);
      if (source_field) {
        if (!CompatibleKinds(source_field->kind, field.kind)) {
          fail(target_entity.name + "." + field.name + " changes kind from " + model::FieldKindName(source_field->kind) + " to " +
               model::FieldKindName(field.kind));
        }
        rule.source_field = source_name;
      } else if (field.required && std::holds_alternative<std::monostate>(field.default_value)) {
        fail("required field " + target_entity.name + "." + field.name + " has no source and no default");
      }
      rules.push_back(std::move(rule));
    }
    mapping.entities_.emplace(target_entity.name, std::move(rules));
  }
  return mapping;
}

SchemaMapping SchemaMapping::Infer(const model::SchemaModel& source, const model::SchemaModel& target) {
  return Build(source, target, {});
}

SchemaMapping SchemaMapping::Custom(const model::SchemaModel& source, const model::SchemaModel& target, const CustomMapping& custom) {
  auto mapping       = Build(source, target, custom.renames);
  mapping.transform_ = custom.transform;
  return mapping;
}

std::optional<model::Record> SchemaMapping::Apply(const model::Record& source) const {
  auto it = entities_.find(source.entity);
  if (it == entities_.end()) return std::nullopt;

  model::Record target;
  target.id            = source.id;
  target.entity        = source.entity;
  target.project_id    = source.project_id;
  target.relationships = source.relationships;
  target.revision      = source.revision;
  target.created_at_ms = source.created_at_ms;
  target.updated_at_ms = source.updated_at_ms;

  for (const auto& rule : it->second) {
    const model::FieldValue* value = rule.source_field ? source.Find(*rule.source_field) : nullptr;
    if (value && !std::holds_alternative<std::monostate>(*value)) {
      target.fields[rule.target_field] = *value;
    } else if (!std::holds_alternative<std::monostate>(rule.default_value)) {
      target.fields[rule.target_field] = rule.default_value;
    }
  }

  if (transform_) transform_(source, target);
  return target;
}

} // namespace archstore::migration
