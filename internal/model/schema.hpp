#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/model/record.hpp"

namespace archstore::model {

using db::model::FieldMap;
using db::model::FieldValue;
using db::model::Record;

enum class FieldKind : std::uint8_t {
  kInt,
  kDouble,
  kBool,
  kString,
  kJson,  // string holding a JSON document
};

const char* FieldKindName(FieldKind kind);

// True when value has the representation kind expects. Null never matches.
bool MatchesKind(const FieldValue& value, FieldKind kind);

struct FieldSpec {
  std::string name;
  FieldKind   kind     = FieldKind::kString;
  bool        required = false;
  FieldValue  default_value;
};

struct EntitySpec {
  std::string            name;
  bool                   catalog = false;
  std::vector<FieldSpec> fields;

  const FieldSpec* FindField(const std::string& field) const;
};

/*
  Explicit schema model for one stored schema version.

  Records are checked against the model of the version the store is
  tagged with; migrations transform records between two models.
*/
struct SchemaModel {
  std::string             version;
  std::vector<EntitySpec> entities;

  const EntitySpec* FindEntity(const std::string& entity) const;

  // Fills absent fields with their defaults.
  void ApplyDefaults(Record& record) const;
};

inline constexpr const char* kProjectEntity   = "project";
inline constexpr const char* kFurnitureEntity = "furniture_item";
inline constexpr const char* kRoomEntity      = "room_data";
inline constexpr const char* kCatalogEntity   = "catalog_item";

/*
  Known schema models keyed by version string.
*/
class SchemaCatalog {
 public:
  void Register(SchemaModel model);

  bool                             Has(const std::string& version) const;
  const SchemaModel&               Get(const std::string& version) const;
  std::shared_ptr<const SchemaModel> Share(const std::string& version) const;
  std::vector<std::string>         Versions() const;

  const std::string& CurrentVersion() const {
    return current_;
  }
  void SetCurrentVersion(std::string version);

  const SchemaModel& Current() const {
    return Get(current_);
  }

 private:
  std::map<std::string, std::shared_ptr<const SchemaModel>> models_;
  std::string                                               current_;
};

// Models 1.0, 1.1, 1.2 and 2.0; current is 2.0.
SchemaCatalog BuiltInSchemas();

} // namespace archstore::model
