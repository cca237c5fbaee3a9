#ifndef DEPENDENCY_GRAPH_H
#define DEPENDENCY_GRAPH_H

#include <core/id_types.h>

#include <map>
#include <vector>

namespace wsm {
namespace graph {

using Layers = std::vector<PackageIdSet>;

/*
 * Package dependency graph of one workspace scan.
 *
 * Forward edges point from a package to its dependencies, reverse edges from
 * a package to its dependents. Only packages known to the workspace take part:
 * external dependencies and self-dependencies are dropped by Build(). Both maps
 * always hold an entry (possibly empty) for every known package.
 *
 * The graph is rebuilt from scratch on every rescan; it is never patched.
 */
class DependencyGraph {
public:
    DependencyGraph() = default;

    // Replaces the whole graph.
    void Build(const std::map<PackageId, PackageIdSet>& packages);

    bool Contains(const PackageId& id) const;
    bool Empty() const { return forward_.empty(); }
    size_t Size() const { return forward_.size(); }

    // Sorted list of every known package.
    std::vector<PackageId> Packages() const;

    // Direct dependencies / dependents; empty for unknown ids.
    const PackageIdSet& Dependencies(const PackageId& id) const;
    const PackageIdSet& Dependents(const PackageId& id) const;

    // Everything reachable from `seeds` through forward edges, seeds included.
    PackageIdSet Closure(const PackageIdSet& seeds) const;

    // Everything reachable from `seeds` through reverse edges, seeds included.
    PackageIdSet ReverseClosure(const PackageIdSet& seeds) const;

    // Forward edges with both endpoints inside `nodes`.
    EdgeSet InducedEdges(const PackageIdSet& nodes) const;

    // Kahn layering of the subgraph induced by `nodes`.
    Layers TopologicalLayers(const PackageIdSet& nodes) const;

private:
    std::map<PackageId, PackageIdSet> forward_;
    std::map<PackageId, PackageIdSet> reverse_;
};

/*
 * Kahn layering over an explicit edge set. Layer 0 holds the nodes with no
 * incoming edge; every following layer holds the nodes whose last incoming
 * edge was removed by peeling the previous one. Nodes never peeled (members of
 * a cycle and everything only reachable through one) form a single final
 * layer. Edges with an endpoint outside `nodes` are ignored.
 */
Layers TopologicalLayers(const PackageIdSet& nodes, const EdgeSet& edges);

} // namespace graph
} // namespace wsm

#endif // DEPENDENCY_GRAPH_H
