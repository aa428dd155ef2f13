#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace archstore::db::model {

/*
  Persistent record row.

  Records live in one flat table keyed by id. Relationships are id
  references, never pointers, so there are no back-reference cycles.

  - project records carry project_id == id
  - catalog records carry an empty project_id
  - revision is bumped on every durable write and drives conflict detection
*/

using FieldValue = std::variant<std::monostate, std::int64_t, double, bool, std::string>;

// Ordered so that serialization and diffs are deterministic.
using FieldMap = std::map<std::string, FieldValue>;

struct Relationship {
  std::string name;
  std::string target_id;
  bool        owning = false;

  bool operator==(const Relationship&) const = default;
};

struct Record {
  std::string               id;
  std::string               entity;
  std::string               project_id;
  FieldMap                  fields;
  std::vector<Relationship> relationships;

  uint64_t revision      = 0;
  uint64_t created_at_ms = 0;
  uint64_t updated_at_ms = 0;

  const FieldValue* Find(const std::string& name) const {
    auto it = fields.find(name);
    return it == fields.end() ? nullptr : &it->second;
  }

  std::optional<std::string> GetString(const std::string& name) const {
    const auto* value = Find(name);
    if (value && std::holds_alternative<std::string>(*value)) return std::get<std::string>(*value);
    return std::nullopt;
  }

  std::optional<double> GetDouble(const std::string& name) const {
    const auto* value = Find(name);
    if (!value) return std::nullopt;
    if (std::holds_alternative<double>(*value)) return std::get<double>(*value);
    if (std::holds_alternative<std::int64_t>(*value)) return static_cast<double>(std::get<std::int64_t>(*value));
    return std::nullopt;
  }

  std::optional<std::int64_t> GetInt(const std::string& name) const {
    const auto* value = Find(name);
    if (value && std::holds_alternative<std::int64_t>(*value)) return std::get<std::int64_t>(*value);
    return std::nullopt;
  }

  std::optional<bool> GetBool(const std::string& name) const {
    const auto* value = Find(name);
    if (value && std::holds_alternative<bool>(*value)) return std::get<bool>(*value);
    return std::nullopt;
  }

  // Content equality; ignores revision and timestamps.
  bool SameContent(const Record& other) const {
    return id == other.id && entity == other.entity && project_id == other.project_id && fields == other.fields &&
           relationships == other.relationships;
  }
};

std::string DescribeValue(const FieldValue& value);

} // namespace archstore::db::model
