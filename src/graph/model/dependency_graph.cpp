#include <graph/model/dependency_graph.h>

namespace wsm {
namespace graph {

namespace {

const PackageIdSet kEmptySet;

PackageIdSet Reach(const std::map<PackageId, PackageIdSet>& adjacency, const PackageIdSet& seeds) {
    // Seeds are always part of the result; unknown ones have no edges to follow.
    PackageIdSet visited = seeds;
    std::vector<PackageId> stack(seeds.begin(), seeds.end());
    while (!stack.empty()) {
        PackageId current = std::move(stack.back());
        stack.pop_back();
        auto it = adjacency.find(current);
        if (it == adjacency.end()) continue;

        for (const auto& next : it->second) {
            if (visited.insert(next).second) {
                stack.push_back(next);
            }
        }
    }
    return visited;
}

} // anonymous namespace

void DependencyGraph::Build(const std::map<PackageId, PackageIdSet>& packages) {
    forward_.clear();
    reverse_.clear();

    for (const auto& entry : packages) {
        forward_[entry.first];
        reverse_[entry.first];
    }

    for (const auto& [id, deps] : packages) {
        for (const auto& dep : deps) {
            if (dep == id) continue;
            if (packages.find(dep) == packages.end()) continue;
            forward_[id].insert(dep);
            reverse_[dep].insert(id);
        }
    }
}

bool DependencyGraph::Contains(const PackageId& id) const {
    return forward_.find(id) != forward_.end();
}

std::vector<PackageId> DependencyGraph::Packages() const {
    std::vector<PackageId> ids;
    ids.reserve(forward_.size());
    for (const auto& entry : forward_) {
        ids.push_back(entry.first);
    }
    return ids;
}

const PackageIdSet& DependencyGraph::Dependencies(const PackageId& id) const {
    auto it = forward_.find(id);
    return it != forward_.end() ? it->second : kEmptySet;
}

const PackageIdSet& DependencyGraph::Dependents(const PackageId& id) const {
    auto it = reverse_.find(id);
    return it != reverse_.end() ? it->second : kEmptySet;
}

PackageIdSet DependencyGraph::Closure(const PackageIdSet& seeds) const {
    return Reach(forward_, seeds);
}

PackageIdSet DependencyGraph::ReverseClosure(const PackageIdSet& seeds) const {
    return Reach(reverse_, seeds);
}

EdgeSet DependencyGraph::InducedEdges(const PackageIdSet& nodes) const {
    EdgeSet edges;
    for (const auto& src : nodes) {
        for (const auto& dst : Dependencies(src)) {
            if (nodes.find(dst) != nodes.end()) {
                edges.emplace(src, dst);
            }
        }
    }
    return edges;
}

Layers DependencyGraph::TopologicalLayers(const PackageIdSet& nodes) const {
    return graph::TopologicalLayers(nodes, InducedEdges(nodes));
}

Layers TopologicalLayers(const PackageIdSet& nodes, const EdgeSet& edges) {
    std::map<PackageId, int> in_degree;
    std::map<PackageId, PackageIdSet> successors;
    for (const auto& node : nodes) {
        in_degree[node] = 0;
    }
    for (const auto& [src, dst] : edges) {
        if (nodes.find(src) == nodes.end() || nodes.find(dst) == nodes.end()) continue;
        if (successors[src].insert(dst).second) {
            ++in_degree[dst];
        }
    }

    Layers layers;
    PackageIdSet current;
    for (const auto& [node, degree] : in_degree) {
        if (degree == 0) current.insert(node);
    }

    PackageIdSet peeled;
    while (!current.empty()) {
        PackageIdSet next;
        for (const auto& node : current) {
            peeled.insert(node);
            auto it = successors.find(node);
            if (it == successors.end()) continue;
            for (const auto& succ : it->second) {
                if (--in_degree[succ] == 0) {
                    next.insert(succ);
                }
            }
        }
        layers.push_back(std::move(current));
        current = std::move(next);
    }

    PackageIdSet remaining;
    for (const auto& node : nodes) {
        if (peeled.find(node) == peeled.end()) remaining.insert(node);
    }
    if (!remaining.empty()) {
        layers.push_back(std::move(remaining));
    }
    return layers;
}

} // namespace graph
} // namespace wsm
