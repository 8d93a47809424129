#pragma once

#include "category.hpp"

#include <utility>
#include <vector>

struct DependencyGraph {
    // Every category reached from the request, in discovery order
    std::vector<const Category*> nodes;
    // (prerequisite, dependent): the first must be processed before the second
    std::vector<std::pair<const Category*, const Category*>> edges;
};

// Pulls in the transitive prerequisites of the requested categories.
DependencyGraph collect_dependency_graph(const CategoryRegistry& registry, const std::vector<std::string>& names);

// Orders the graph so that prerequisites come first. Independent categories keep
// their declaration order. Throws CyclicDependencyError.
std::vector<const Category*> topological_order(const CategoryRegistry& registry, const DependencyGraph& graph);
