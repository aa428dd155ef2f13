#include "version_graph.hpp"

#include <algorithm>
#include <deque>

#include "internal/util/errors.hpp"

namespace archstore::migration {

const char* MappingStrategyName(MappingStrategy strategy) {
  return strategy == MappingStrategy::kCustom ? "custom" : "inferred";
}

void MigrationPlan::Validate() const {
  if (steps.empty()) throw util::InvalidState("migration plan " + source + " -> " + target + " has no steps");
  if (steps.front().source != source) throw util::InvalidState("migration plan does not start at " + source);
  for (std::size_t i = 0; i + 1 < steps.size(); ++i) {
    if (steps[i].target != steps[i + 1].source) {
      throw util::InvalidState("migration plan breaks between " + steps[i].target + " and " + steps[i + 1].source);
    }
  }
  if (steps.back().target != target) throw util::InvalidState("migration plan does not end at " + target);
}

std::vector<std::string> MigrationPlan::Path() const {
  std::vector<std::string> path;
  if (steps.empty()) return path;
  path.push_back(steps.front().source);
  for (const auto& step : steps) path.push_back(step.target);
  return path;
}

void VersionGraph::AddVersion(const std::string& version) {
  versions_.insert(version);
}

void VersionGraph::AddEdge(const std::string& source, const std::string& target, MappingStrategy strategy) {
  versions_.insert(source);
  versions_.insert(target);
  edges_[source][target] = strategy;
}

bool VersionGraph::HasVersion(const std::string& version) const {
  return versions_.contains(version);
}

std::optional<MappingStrategy> VersionGraph::Edge(const std::string& source, const std::string& target) const {
  auto from = edges_.find(source);
  if (from == edges_.end()) return std::nullopt;
  auto to = from->second.find(target);
  if (to == from->second.end()) return std::nullopt;
  return to->second;
}

std::vector<std::string> VersionGraph::Versions() const {
  return {versions_.begin(), versions_.end()};
}

MigrationPlan VersionGraph::ShortestPath(const std::string& source, const std::string& target) const {
  if (source == target) throw util::InvalidState("store is already at schema version " + source);
  if (!HasVersion(source) || !HasVersion(target)) throw util::MigrationPathNotFound(source, target);

  std::map<std::string, std::string> parent;
  std::deque<std::string>            queue{source};
  parent[source] = source;

  while (!queue.empty() && !parent.contains(target)) {
    const auto current = queue.front();
    queue.pop_front();

    auto it = edges_.find(current);
    if (it == edges_.end()) continue;
    for (const auto& [next, _] : it->second) {
      if (parent.contains(next)) continue;
      parent[next] = current;
      queue.push_back(next);
    }
  }

  if (!parent.contains(target)) throw util::MigrationPathNotFound(source, target);

  MigrationPlan plan;
  plan.source = source;
  plan.target = target;
  for (auto node = target; node != source; node = parent[node]) {
    const auto& prev = parent[node];
    plan.steps.push_back({prev, node, *Edge(prev, node)});
  }
  std::reverse(plan.steps.begin(), plan.steps.end());
  plan.Validate();
  return plan;
}

} // namespace archstore::migration
