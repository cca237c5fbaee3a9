#ifndef GRAPH_RENDERER_H
#define GRAPH_RENDERER_H

#include <config/app_config.h>
#include <core/id_types.h>
#include <graph/layout/layered_layout.h>
#include <graph/model/highlight_engine.h>
#include <gui/views/graph_types.h>

#include <imgui.h>

#include <cstdint>
#include <map>

namespace wsm {

struct GraphScope;
class WorkspaceManager;

namespace graph {

/*
 * Interactive view of a dependency subgraph: layered layout, click-to-focus
 * highlighting, middle-drag panning and wheel zooming. All graph logic lives
 * in the layout and highlight modules; this class only maps their output to
 * ImDrawList primitives.
 */
class GraphEditor {
public:
    GraphEditor() = default;

    // Replaces the displayed subgraph. Keeps the focus if its node survives.
    void SetScope(const GraphScope& scope);

    // Rebuilds from the manager when its revision changed since the last call.
    void SyncWith(const WorkspaceManager& manager);

    void Render(ImDrawList* draw_list, const ImVec2& canvas_pos, const ImVec2& canvas_size, GraphViewState& view_state);

    // Interaction Handlers
    void HandlePanning(const ImVec2& canvas_pos, const ImVec2& canvas_size, GraphViewState& view_state);
    void HandleZooming(const ImVec2& canvas_pos, const ImVec2& canvas_size, GraphViewState& view_state);
    void HandleNodeSelection(const ImVec2& canvas_pos, const ImVec2& canvas_size, GraphViewState& view_state);
    void DisplaySelectedNodeDetails(const WorkspaceManager& manager);

    // Theme management
    void SetCurrentTheme(ThemeType theme) { current_theme_ = theme; }
    ThemeType GetCurrentTheme() const { return current_theme_; }

    const GraphLayout& GetLayout() const { return layout_; }
    const FocusState& GetFocus() const { return focus_; }
    const std::map<PackageId, HighlightTag>& GetNodeTags() const { return node_tags_; }

    // Focus toggle as done by a left click on a node.
    void ClickNode(const PackageId& id);

private:
    void UpdateHighlights();
    void RenderEdge(ImDrawList* draw_list, const EdgeGeometry& edge, const ImVec2& canvas_pos, const GraphViewState& view_state);
    void RenderNode(ImDrawList* draw_list, const PackageId& id, const NodeBox& box, const ImVec2& canvas_pos, const GraphViewState& view_state);

    LayeredLayout layout_engine_;
    GraphLayout layout_;
    PackageIdSet nodes_;
    EdgeSet edges_;
    PackageIdSet initially_selected_;

    FocusState focus_;
    std::map<PackageId, HighlightTag> node_tags_;
    std::map<Edge, HighlightTag> edge_tags_;

    std::uint64_t synced_revision_ = 0;
    bool synced_once_ = false;
    ThemeType current_theme_ = ThemeType::DARK; // Current theme for color selection
};

} // namespace graph
} // namespace wsm

#endif // GRAPH_RENDERER_H
