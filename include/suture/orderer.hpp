#pragma once

#include <suture/dependency_graph.hpp>
#include <string>
#include <vector>

namespace suture {

// Dependencies-first ordering of every package in graph, each exactly once.
//
// Tie-break: packages are tried in graph insertion order and each package's
// dependencies in declaration order; a package is emitted as soon as all of
// its dependencies have been. Two packages with no path between them thus
// keep the relative order in which the traversal first reaches them, which
// for independent packages is insertion order.
//
// Fails with Cycle, naming the cycle, when no order exists.
Result<std::vector<std::string>> topological_order(const DependencyGraph& graph);

// Checks that order lists every package of graph exactly once and that
// every dependency precedes its dependents. Duplicate, NotFound or Cycle
// error describing the first violation otherwise.
Status verify_order(const DependencyGraph& graph,
                    const std::vector<std::string>& order);

} // namespace suture
