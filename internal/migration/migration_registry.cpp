#include "migration_registry.hpp"

#include "internal/util/errors.hpp"

namespace archstore::migration {

void MigrationRegistry::RegisterInferred(const std::string& source, const std::string& target) {
  graph_.AddEdge(source, target, MappingStrategy::kInferred);
  custom_.erase({source, target});
}

void MigrationRegistry::RegisterCustom(const std::string& source, const std::string& target, CustomMapping custom) {
  graph_.AddEdge(source, target, MappingStrategy::kCustom);
  custom_[{source, target}] = std::move(custom);
}

SchemaMapping MigrationRegistry::MappingFor(const MigrationStep& step, const model::SchemaCatalog& catalog) const {
  const auto& source = catalog.Get(step.source);
  const auto& target = catalog.Get(step.target);

  if (step.strategy == MappingStrategy::kCustom) {
    auto it = custom_.find({step.source, step.target});
    if (it == custom_.end()) throw util::MigrationFailed("no custom mapping registered for " + step.source + " -> " + step.target);
    return SchemaMapping::Custom(source, target, it->second);
  }
  return SchemaMapping::Infer(source, target);
}

std::vector<model::Record> MigrationRegistry::MapRecords(std::vector<model::Record> records, const std::string& from, const std::string& to,
                                                         const model::SchemaCatalog& catalog) const {
  if (from == to) return records;

  const auto plan = graph_.ShortestPath(from, to);
  for (const auto& step : plan.steps) {
    const auto                 mapping = MappingFor(step, catalog);
    std::vector<model::Record> mapped;
    mapped.reserve(records.size());
    for (const auto& record : records) {
      if (auto next = mapping.Apply(record)) mapped.push_back(std::move(*next));
    }
    records = std::move(mapped);
  }
  return records;
}

namespace {

// created_at seeds modified_at for stores that never tracked it.
void DeriveModifiedAt(const model::Record& source, model::Record& target) {
  if (target.entity != model::kProjectEntity) return;
  const auto modified = target.GetInt("modified_at");
  if (modified && *modified != 0) return;
  if (auto created = source.GetInt("created_at")) target.fields["modified_at"] = *created;
}

CustomMapping To20() {
  CustomMapping custom;
  custom.renames[model::kRoomEntity]["room_type"] = "kind";
  custom.transform                                = DeriveModifiedAt;
  return custom;
}

} // namespace

std::shared_ptr<const MigrationRegistry> BuiltInMigrations() {
  auto registry = std::make_shared<MigrationRegistry>();
  registry->RegisterInferred("1.0", "1.1");
  registry->RegisterInferred("1.1", "1.2");
  registry->RegisterCustom("1.2", "2.0", To20());
  registry->RegisterCustom("1.1", "2.0", To20());
  return registry;
}

} // namespace archstore::migration
