#include <cstdint>

#include "schema.hpp"

namespace archstore::model {
namespace {

FieldSpec Required(std::string name, FieldKind kind) {
  return FieldSpec{std::move(name), kind, true, std::monostate{}};
}

FieldSpec Optional(std::string name, FieldKind kind, FieldValue default_value) {
  return FieldSpec{std::move(name), kind, false, std::move(default_value)};
}

SchemaModel Version10() {
  SchemaModel model;
  model.version = "1.0";
  model.entities.push_back({kProjectEntity,
                            false,
                            {Required("name", FieldKind::kString), Required("created_at", FieldKind::kInt)}});
  model.entities.push_back({kFurnitureEntity,
                            false,
                            {Required("name", FieldKind::kString),
                             Required("category", FieldKind::kString),
                             Required("position_x", FieldKind::kDouble),
                             Required("position_y", FieldKind::kDouble),
                             Required("position_z", FieldKind::kDouble)}});
  model.entities.push_back({kRoomEntity,
                            false,
                            {Required("room_type", FieldKind::kString),
                             Optional("width", FieldKind::kDouble, 0.0),
                             Optional("height", FieldKind::kDouble, 0.0),
                             Optional("depth", FieldKind::kDouble, 0.0)}});
  model.entities.push_back({kCatalogEntity,
                            true,
                            {Required("name", FieldKind::kString), Required("category", FieldKind::kString)}});
  return model;
}

EntitySpec& Entity(SchemaModel& model, const char* name) {
  for (auto& entity : model.entities) {
    if (entity.name == name) return entity;
  }
  model.entities.push_back({name, false, {}});
  return model.entities.back();
}

SchemaModel Version11() {
  auto model    = Version10();
  model.version = "1.1";
  Entity(model, kProjectEntity).fields.push_back(Optional("description", FieldKind::kString, std::string()));
  auto& furniture = Entity(model, kFurnitureEntity);
  furniture.fields.push_back(Optional("rotation", FieldKind::kDouble, 0.0));
  furniture.fields.push_back(Optional("scale_x", FieldKind::kDouble, 1.0));
  furniture.fields.push_back(Optional("scale_y", FieldKind::kDouble, 1.0));
  furniture.fields.push_back(Optional("scale_z", FieldKind::kDouble, 1.0));
  return model;
}

SchemaModel Version12() {
  auto model    = Version11();
  model.version = "1.2";
  auto& project = Entity(model, kProjectEntity);
  project.fields.push_back(Optional("tags", FieldKind::kString, std::string()));
  project.fields.push_back(Optional("settings", FieldKind::kJson, std::string("{}")));
  Entity(model, kFurnitureEntity).fields.push_back(Optional("metadata", FieldKind::kJson, std::string("{}")));
  Entity(model, kRoomEntity).fields.push_back(Optional("features", FieldKind::kString, std::string()));
  return model;
}

SchemaModel Version20() {
  auto model    = Version12();
  model.version = "2.0";
  auto& project = Entity(model, kProjectEntity);
  project.fields.push_back(Optional("modified_at", FieldKind::kInt, std::int64_t{0}));
  project.fields.push_back(Optional("is_template", FieldKind::kBool, false));
  project.fields.push_back(Optional("template_category", FieldKind::kString, std::string()));

  // room_type became kind
  auto& room = Entity(model, kRoomEntity);
  for (auto& field : room.fields) {
    if (field.name == "room_type") field.name = "kind";
  }
  return model;
}

} // namespace

SchemaCatalog BuiltInSchemas() {
  SchemaCatalog catalog;
  catalog.Register(Version10());
  catalog.Register(Version11());
  catalog.Register(Version12());
  catalog.Register(Version20());
  catalog.SetCurrentVersion("2.0");
  return catalog;
}

} // namespace archstore::model
