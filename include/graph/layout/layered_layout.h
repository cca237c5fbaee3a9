#ifndef LAYERED_LAYOUT_H
#define LAYERED_LAYOUT_H

#include <core/id_types.h>
#include <graph/model/dependency_graph.h>

#include <imgui.h>

#include <array>
#include <map>
#include <vector>

namespace wsm {
namespace graph {

// Node rectangle in world coordinates.
struct NodeBox {
    ImVec2 min;
    ImVec2 max;
    int layer = 0;

    ImVec2 RightAnchor() const { return ImVec2(max.x, (min.y + max.y) * 0.5f); }
    ImVec2 LeftAnchor() const { return ImVec2(min.x, (min.y + max.y) * 0.5f); }
    bool Contains(const ImVec2& p) const { return p.x >= min.x && p.x <= max.x && p.y >= min.y && p.y <= max.y; }
};

struct EdgeGeometry {
    Edge edge;
    ImVec2 start;
    ImVec2 end;
    bool has_arrow = false;           // false for zero-length edges
    std::array<ImVec2, 3> arrow{};    // tip first
};

struct GraphLayout {
    Layers layers;
    std::map<PackageId, NodeBox> nodes;
    std::vector<EdgeGeometry> edges;
    ImVec2 bounds_min;
    ImVec2 bounds_max;
};

/*
 * Deterministic layered layout for dependency graphs.
 * Layer i is placed at x = i * layer_spacing; inside a layer nodes are sorted
 * lexicographically and stacked at y = row * row_spacing. Same input, same
 * output.
 */
class LayeredLayout {
public:
    struct LayoutParams {
        float layer_spacing;
        float row_spacing;
        ImVec2 node_size;
        float arrow_size;

        LayoutParams();
    };

    explicit LayeredLayout(const LayoutParams& params = LayoutParams());

    // Top-left corner of every node.
    std::map<PackageId, ImVec2> ComputePositions(const PackageIdSet& nodes, const EdgeSet& edges) const;

    // Positions, rectangles, edge segments and bounds in one pass.
    GraphLayout ComputeLayout(const PackageIdSet& nodes, const EdgeSet& edges) const;

    // Segment from the source's right anchor to the destination's left anchor.
    EdgeGeometry ComputeEdgeGeometry(const NodeBox& src, const NodeBox& dst) const;

    const LayoutParams& GetParams() const { return params_; }

private:
    LayoutParams params_;
};

} // namespace graph
} // namespace wsm

#endif // LAYERED_LAYOUT_H
