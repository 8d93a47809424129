#include "dependency.hpp"

#include "exception.hpp"
#include "localization.hpp"

#include <map>
#include <set>
#include <unordered_set>

DependencyGraph collect_dependency_graph(const CategoryRegistry& registry, const std::vector<std::string>& names) {
    DependencyGraph graph;
    std::unordered_set<const Category*> visited;
    std::vector<const Category*> to_visit = registry.expand(names);

    while (!to_visit.empty()) {
        const Category* category = to_visit.back();
        to_visit.pop_back();
        if (!visited.insert(category).second) continue;
        graph.nodes.push_back(category);

        for (const auto& name : category->descriptor().prerequisites) {
            const Category* prerequisite = &registry.lookup(name);
            graph.edges.emplace_back(prerequisite, category);
            if (!visited.contains(prerequisite)) {
                to_visit.push_back(prerequisite);
            }
        }
    }
    return graph;
}

std::vector<const Category*> topological_order(const CategoryRegistry& registry, const DependencyGraph& graph) {
    std::map<size_t, const Category*> by_index;
    std::map<size_t, size_t> pending;
    std::map<size_t, std::set<size_t>> dependents;

    for (const Category* category : graph.nodes) {
        const size_t index = registry.index_of(*category);
        by_index[index] = category;
        pending.try_emplace(index, 0);
    }
    for (const auto& [prerequisite, dependent] : graph.edges) {
        const size_t from = registry.index_of(*prerequisite);
        const size_t to = registry.index_of(*dependent);
        by_index[from] = prerequisite;
        pending.try_emplace(from, 0);
        if (dependents[from].insert(to).second) {
            ++pending[to];
        }
    }

    std::set<size_t> ready;
    for (const auto& [index, count] : pending) {
        if (count == 0) ready.insert(index);
    }

    std::vector<const Category*> order;
    while (!ready.empty()) {
        const size_t index = *ready.begin();
        ready.erase(ready.begin());
        order.push_back(by_index.at(index));

        for (size_t dependent : dependents[index]) {
            if (--pending[dependent] == 0) ready.insert(dependent);
        }
    }

    if (order.size() != by_index.size()) {
        std::string cycle;
        for (const auto& [index, count] : pending) {
            if (count == 0) continue;
            if (!cycle.empty()) cycle += ", ";
            cycle += by_index.at(index)->name();
        }
        throw CyclicDependencyError(string_format("error.cyclic_dependency", cycle));
    }
    return order;
}
