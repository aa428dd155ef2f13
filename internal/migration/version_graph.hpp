#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace archstore::migration {

enum class MappingStrategy {
  kInferred,
  kCustom,
};

const char* MappingStrategyName(MappingStrategy strategy);

struct MigrationStep {
  std::string     source;
  std::string     target;
  MappingStrategy strategy = MappingStrategy::kInferred;
};

/*
  Ordered, non-empty chain of steps. step[i].target == step[i+1].source and
  the last target equals the plan target.
*/
struct MigrationPlan {
  std::string                source;
  std::string                target;
  std::vector<MigrationStep> steps;

  // Throws util::InvalidState when the chain is broken.
  void Validate() const;

  // source, each intermediate version, target
  std::vector<std::string> Path() const;
};

/*
  Directed graph of schema versions; an edge is an available mapping.
  Neighbours are visited in version order so equal-length paths resolve
  deterministically.
*/
class VersionGraph {
 public:
  void AddVersion(const std::string& version);
  void AddEdge(const std::string& source, const std::string& target, MappingStrategy strategy);

  bool                           HasVersion(const std::string& version) const;
  std::optional<MappingStrategy> Edge(const std::string& source, const std::string& target) const;
  std::vector<std::string>       Versions() const;

  // Breadth-first search for the minimal-step path. Throws
  // util::MigrationPathNotFound when target is unreachable and
  // util::InvalidState when source == target.
  MigrationPlan ShortestPath(const std::string& source, const std::string& target) const;

 private:
  std::set<std::string>                                         versions_;
  std::map<std::string, std::map<std::string, MappingStrategy>> edges_;
};

} // namespace archstore::migration
