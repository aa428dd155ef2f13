#pragma once

#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "internal/migration/schema_mapping.hpp"
#include "internal/migration/version_graph.hpp"
#include "internal/model/schema.hpp"

namespace archstore::migration {

/*
  Available version-to-version mappings and the graph they form.
*/
class MigrationRegistry {
 public:
  void RegisterInferred(const std::string& source, const std::string& target);
  void RegisterCustom(const std::string& source, const std::string& target, CustomMapping custom);

  const VersionGraph& Graph() const {
    return graph_;
  }

  SchemaMapping MappingFor(const MigrationStep& step, const model::SchemaCatalog& catalog) const;

  // Maps records stored under `from` to `to` along the shortest path.
  // Records whose entity disappears along the way are dropped.
  std::vector<model::Record> MapRecords(std::vector<model::Record> records, const std::string& from, const std::string& to,
                                        const model::SchemaCatalog& catalog) const;

 private:
  VersionGraph                                                 graph_;
  std::map<std::pair<std::string, std::string>, CustomMapping> custom_;
};

// 1.0->1.1, 1.1->1.2 inferred; 1.2->2.0, 1.1->2.0 custom.
std::shared_ptr<const MigrationRegistry> BuiltInMigrations();

} // namespace archstore::migration
