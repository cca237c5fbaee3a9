#include <graph/layout/layered_layout.h>

#include <algorithm>
#include <cmath>

namespace wsm {
namespace graph {

namespace {
// Anchors closer than this are treated as the same point.
constexpr float kMinEdgeLength = 1e-4f;
} // anonymous namespace

LayeredLayout::LayoutParams::LayoutParams()
    : layer_spacing(240.0f),
      row_spacing(80.0f),
      node_size(140.0f, 36.0f),
      arrow_size(8.0f) {}

LayeredLayout::LayeredLayout(const LayoutParams& params) : params_(params) {}

std::map<PackageId, ImVec2> LayeredLayout::ComputePositions(const PackageIdSet& nodes, const EdgeSet& edges) const {
    std::map<PackageId, ImVec2> positions;
    for (const auto& [id, box] : ComputeLayout(nodes, edges).nodes) {
        positions.emplace(id, box.min);
    }
    return positions;
}

GraphLayout LayeredLayout::ComputeLayout(const PackageIdSet& nodes, const EdgeSet& edges) const {
    GraphLayout layout;
    layout.layers = TopologicalLayers(nodes, edges);

    bool first = true;
    for (size_t i = 0; i < layout.layers.size(); ++i) {
        int row = 0;
        for (const auto& node : layout.layers[i]) {
            NodeBox box;
            box.min = ImVec2(static_cast<float>(i) * params_.layer_spacing,
                             static_cast<float>(row) * params_.row_spacing);
            box.max = ImVec2(box.min.x + params_.node_size.x, box.min.y + params_.node_size.y);
            box.layer = static_cast<int>(i);
            ++row;

            if (first) {
                layout.bounds_min = box.min;
                layout.bounds_max = box.max;
                first = false;
            } else {
                layout.bounds_min = ImVec2(std::min(layout.bounds_min.x, box.min.x), std::min(layout.bounds_min.y, box.min.y));
                layout.bounds_max = ImVec2(std::max(layout.bounds_max.x, box.max.x), std::max(layout.bounds_max.y, box.max.y));
            }
            layout.nodes.emplace(node, box);
        }
    }

    for (const auto& edge : edges) {
        auto src = layout.nodes.find(edge.first);
        auto dst = layout.nodes.find(edge.second);
        if (src == layout.nodes.end() || dst == layout.nodes.end()) continue;
        EdgeGeometry geometry = ComputeEdgeGeometry(src->second, dst->second);
        geometry.edge = edge;
        layout.edges.push_back(geometry);
    }
    return layout;
}

EdgeGeometry LayeredLayout::ComputeEdgeGeometry(const NodeBox& src, const NodeBox& dst) const {
    EdgeGeometry geometry;
    geometry.start = src.RightAnchor();
    geometry.end = dst.LeftAnchor();

    const float dx = geometry.end.x - geometry.start.x;
    const float dy = geometry.end.y - geometry.start.y;
    const float length = std::sqrt(dx * dx + dy * dy);
    if (length < kMinEdgeLength) {
        geometry.has_arrow = false;
        geometry.arrow.fill(geometry.end);
        return geometry;
    }

    const float ux = dx / length;
    const float uy = dy / length;
    const float size = params_.arrow_size;
    const ImVec2& tip = geometry.end;
    geometry.arrow[0] = tip;
    geometry.arrow[1] = ImVec2(tip.x - ux * size - uy * size * 0.5f, tip.y - uy * size + ux * size * 0.5f);
    geometry.arrow[2] = ImVec2(tip.x - ux * size + uy * size * 0.5f, tip.y - uy * size - ux * size * 0.5f);
    geometry.has_arrow = true;
    return geometry;
}

} // namespace graph
} // namespace wsm
