#include "internal/migration/version_graph.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "internal/migration/migration_registry.hpp"
#include "internal/util/errors.hpp"

namespace {

using archstore::migration::MappingStrategy;
using archstore::migration::MigrationPlan;
using archstore::migration::VersionGraph;

void TestBuiltInPathUsesFewestSteps() {
  const auto registry = archstore::migration::BuiltInMigrations();

  const auto plan = registry->Graph().ShortestPath("1.0", "2.0");
  assert(plan.steps.size() == 2);
  assert((plan.Path() == std::vector<std::string>{"1.0", "1.1", "2.0"}));
  assert(plan.steps[0].strategy == MappingStrategy::kInferred);
  assert(plan.steps[1].strategy == MappingStrategy::kCustom);

  const auto direct = registry->Graph().ShortestPath("1.2", "2.0");
  assert(direct.steps.size() == 1);
  assert(direct.steps[0].source == "1.2");
  assert(direct.steps[0].target == "2.0");
}

void TestDirectEdgeBeatsLongerChain() {
  VersionGraph graph;
  graph.AddEdge("1.0", "1.1", MappingStrategy::kInferred);
  graph.AddEdge("1.1", "1.2", MappingStrategy::kInferred);
  graph.AddEdge("1.0", "2.0", MappingStrategy::kCustom);
  graph.AddEdge("1.1", "2.0", MappingStrategy::kCustom);

  const auto plan = graph.ShortestPath("1.0", "2.0");
  assert(plan.steps.size() == 1);
  assert((plan.Path() == std::vector<std::string>{"1.0", "2.0"}));
}

void TestEqualLengthPathsResolveInVersionOrder() {
  VersionGraph graph;
  graph.AddEdge("a", "c", MappingStrategy::kInferred);
  graph.AddEdge("a", "b", MappingStrategy::kInferred);
  graph.AddEdge("c", "d", MappingStrategy::kInferred);
  graph.AddEdge("b", "d", MappingStrategy::kCustom);

  for (int i = 0; i < 3; ++i) {
    const auto plan = graph.ShortestPath("a", "d");
    assert((plan.Path() == std::vector<std::string>{"a", "b", "d"}));
    assert(plan.steps[1].strategy == MappingStrategy::kCustom);
  }
}

void TestUnreachableTargetThrows() {
  const auto registry = archstore::migration::BuiltInMigrations();

  bool backwards = false;
  try {
    (void)registry->Graph().ShortestPath("2.0", "1.0");
  } catch (const archstore::util::MigrationPathNotFound& e) {
    backwards = e.From() == "2.0" && e.To() == "1.0";
  }
  assert(backwards);

  bool unknown = false;
  try {
    (void)registry->Graph().ShortestPath("0.9", "2.0");
  } catch (const archstore::util::MigrationPathNotFound&) {
    unknown = true;
  }
  assert(unknown);
}

void TestSameVersionIsNotAPath() {
  VersionGraph graph;
  graph.AddVersion("1.0");

  bool threw = false;
  try {
    (void)graph.ShortestPath("1.0", "1.0");
  } catch (const archstore::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
}

void TestBrokenPlanFailsValidation() {
  MigrationPlan plan;
  plan.source = "1.0";
  plan.target = "2.0";
  plan.steps  = {{"1.0", "1.1", MappingStrategy::kInferred}, {"1.2", "2.0", MappingStrategy::kCustom}};

  bool threw = false;
  try {
    plan.Validate();
  } catch (const archstore::util::InvalidState&) {
    threw = true;
  }
  assert(threw);

  plan.steps[1].source = "1.1";
  plan.Validate();

  MigrationPlan empty;
  empty.source = "1.0";
  empty.target = "1.1";
  threw        = false;
  try {
    empty.Validate();
  } catch (const archstore::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestBuiltInPathUsesFewestSteps();
  TestDirectEdgeBeatsLongerChain();
  TestEqualLengthPathsResolveInVersionOrder();
  TestUnreachableTargetThrows();
  TestSameVersionIsNotAPath();
  TestBrokenPlanFailsValidation();

  std::cout << "archstore_unit_version_graph: pass\n";
  return 0;
}
