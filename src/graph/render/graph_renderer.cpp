#include <graph/render/graph_renderer.h>
#include <graph/render/camera_utils.h>
#include <graph/utils/graph_drawing_utils.h>
#include <gui/render/theme_utils.h>
#include <core/workspace_manager.h>

#include <imgui.h>

#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

namespace wsm {
namespace graph {

namespace {
constexpr float kGridStep = 64.0f;
} // anonymous namespace

void GraphEditor::SetScope(const GraphScope& scope) {
    nodes_ = scope.nodes;
    edges_ = scope.edges;
    initially_selected_ = scope.initially_selected;
    layout_ = layout_engine_.ComputeLayout(nodes_, edges_);
    focus_.Retain(nodes_);
    UpdateHighlights();
}

void GraphEditor::SyncWith(const WorkspaceManager& manager) {
    if (synced_once_ && synced_revision_ == manager.revision()) return;
    SetScope(manager.ComputeGraphScope());
    synced_revision_ = manager.revision();
    synced_once_ = true;
}

void GraphEditor::ClickNode(const PackageId& id) {
    focus_.Click(id);
    UpdateHighlights();
}

void GraphEditor::UpdateHighlights() {
    node_tags_ = ClassifyNodes(focus_.Focused(), nodes_, edges_);
    edge_tags_ = ClassifyEdges(focus_.Focused(), nodes_, edges_);
}

void GraphEditor::HandlePanning(const ImVec2&, const ImVec2&, GraphViewState& view_state) {
    // Called right after the canvas InvisibleButton, so the item queries refer to it.
    if (!ImGui::IsItemActive()) return;
    if (ImGui::IsMouseDragging(ImGuiMouseButton_Middle) || ImGui::IsMouseDragging(ImGuiMouseButton_Left)) {
        ImGuiIO& io = ImGui::GetIO();
        view_state.pan_offset.x += io.MouseDelta.x;
        view_state.pan_offset.y += io.MouseDelta.y;
    }
}

void GraphEditor::HandleZooming(const ImVec2& canvas_pos, const ImVec2&, GraphViewState& view_state) {
    if (!ImGui::IsItemHovered()) return;
    float wheel = ImGui::GetIO().MouseWheel;
    if (wheel == 0.0f) return;

    const float zoom_factor = wheel > 0.0f ? 1.15f : 1.0f / 1.15f;
    ImVec2 mouse = ImGui::GetMousePos();
    ImVec2 pivot(mouse.x - canvas_pos.x, mouse.y - canvas_pos.y);
    CameraUtils::ZoomAt(view_state, pivot, zoom_factor);
}

void GraphEditor::HandleNodeSelection(const ImVec2& canvas_pos, const ImVec2&, GraphViewState& view_state) {
    if (!ImGui::IsItemHovered() || !ImGui::IsMouseReleased(ImGuiMouseButton_Left)) return;

    // A left drag pans the canvas; only a click changes the focus.
    ImVec2 drag = ImGui::GetMouseDragDelta(ImGuiMouseButton_Left, 0.0f);
    if (std::fabs(drag.x) > 3.0f || std::fabs(drag.y) > 3.0f) return;

    ImVec2 world = CameraUtils::ScreenToWorld(ImGui::GetMousePos(), canvas_pos, view_state);
    for (const auto& [id, box] : layout_.nodes) {
        if (box.Contains(world)) {
            ClickNode(id);
            return;
        }
    }
    focus_.Clear();
    UpdateHighlights();
}

void GraphEditor::Render(ImDrawList* draw_list, const ImVec2& canvas_pos, const ImVec2& canvas_size, GraphViewState& view_state) {
    if (canvas_size.x < 1.0f || canvas_size.y < 1.0f) return;

    ImGui::SetCursorScreenPos(canvas_pos);
    ImGui::InvisibleButton("##dependency_graph_canvas", canvas_size,
                           ImGuiButtonFlags_MouseButtonLeft | ImGuiButtonFlags_MouseButtonMiddle);
    HandleNodeSelection(canvas_pos, canvas_size, view_state);
    HandlePanning(canvas_pos, canvas_size, view_state);
    HandleZooming(canvas_pos, canvas_size, view_state);

    if (view_state.fit_requested && !layout_.nodes.empty()) {
        CameraUtils::FitToBounds(view_state, layout_.bounds_min, layout_.bounds_max, canvas_size);
        view_state.fit_requested = false;
    }

    const ImVec2 canvas_max(canvas_pos.x + canvas_size.x, canvas_pos.y + canvas_size.y);
    draw_list->PushClipRect(canvas_pos, canvas_max, true);
    draw_list->AddRectFilled(canvas_pos, canvas_max, ThemeUtils::GetThemeBackgroundColor(current_theme_));

    const float grid = kGridStep * view_state.zoom_scale;
    if (grid > 8.0f) {
        const ImU32 grid_col = ThemeUtils::GetThemeGridColor(current_theme_);
        for (float x = std::fmod(view_state.pan_offset.x, grid); x < canvas_size.x; x += grid)
            draw_list->AddLine(ImVec2(canvas_pos.x + x, canvas_pos.y), ImVec2(canvas_pos.x + x, canvas_max.y), grid_col);
        for (float y = std::fmod(view_state.pan_offset.y, grid); y < canvas_size.y; y += grid)
            draw_list->AddLine(ImVec2(canvas_pos.x, canvas_pos.y + y), ImVec2(canvas_max.x, canvas_pos.y + y), grid_col);
    }

    // Highlighted edges last so they stay on top of neutral ones.
    for (const auto& edge : layout_.edges) {
        if (edge_tags_[edge.edge] == HighlightTag::NONE)
            RenderEdge(draw_list, edge, canvas_pos, view_state);
    }
    for (const auto& edge : layout_.edges) {
        if (edge_tags_[edge.edge] != HighlightTag::NONE)
            RenderEdge(draw_list, edge, canvas_pos, view_state);
    }

    for (const auto& [id, box] : layout_.nodes) {
        RenderNode(draw_list, id, box, canvas_pos, view_state);
    }

    if (layout_.nodes.empty()) {
        const char* hint = "No packages to display. Select a workspace first.";
        draw_list->AddText(ImVec2(canvas_pos.x + 16.0f, canvas_pos.y + 16.0f),
                           ThemeUtils::GetThemeNodeColors(current_theme_, ThemeUtils::NodeVisualState::NEUTRAL).text, hint);
    }

    draw_list->PopClipRect();
}

void GraphEditor::RenderEdge(ImDrawList* draw_list, const EdgeGeometry& edge, const ImVec2& canvas_pos, const GraphViewState& view_state) {
    const HighlightTag tag = edge_tags_[edge.edge];
    const ImU32 color = ThemeUtils::GetThemeEdgeColor(current_theme_, tag);
    const float thickness = ThemeUtils::GetThemeEdgeThickness(tag);

    auto to_screen = [&](const ImVec2& world) {
        ImVec2 p = CameraUtils::WorldToScreen(world, view_state);
        return ImVec2(canvas_pos.x + p.x, canvas_pos.y + p.y);
    };

    const ImVec2 start = to_screen(edge.start);
    const ImVec2 end = to_screen(edge.end);
    if (!edge.has_arrow) {
        draw_list->AddCircleFilled(end, thickness, color);
        return;
    }
    draw_list->AddLine(start, end, color, thickness);
    draw_list->AddTriangleFilled(to_screen(edge.arrow[0]), to_screen(edge.arrow[1]), to_screen(edge.arrow[2]), color);
}

void GraphEditor::RenderNode(ImDrawList* draw_list, const PackageId& id, const NodeBox& box, const ImVec2& canvas_pos, const GraphViewState& view_state) {
    ImVec2 min = CameraUtils::WorldToScreen(box.min, view_state);
    ImVec2 max = CameraUtils::WorldToScreen(box.max, view_state);
    min = ImVec2(canvas_pos.x + min.x, canvas_pos.y + min.y);
    max = ImVec2(canvas_pos.x + max.x, canvas_pos.y + max.y);

    auto tag_it = node_tags_.find(id);
    const HighlightTag tag = tag_it != node_tags_.end() ? tag_it->second : HighlightTag::NONE;
    const bool initially_selected = initially_selected_.count(id) > 0;
    const ThemeUtils::NodeColors colors =
        ThemeUtils::GetThemeNodeColors(current_theme_, ThemeUtils::ResolveNodeState(tag, initially_selected));

    const float rounding = 4.0f * view_state.zoom_scale;
    draw_list->AddRectFilled(min, max, colors.fill, rounding);
    draw_list->AddRect(min, max, colors.border, rounding, 0, colors.border_thickness);

    // Label scales with the camera; skip when too small to read.
    const float font_size = ImGui::GetFontSize() * std::min(view_state.zoom_scale, 1.5f);
    if (font_size < 5.0f) return;
    const ImVec2 center((min.x + max.x) * 0.5f, (min.y + max.y) * 0.5f);
    GraphDraw::AddCenteredText(draw_list, ImGui::GetFont(), font_size, center, colors.text, id, (max.x - min.x) - 8.0f);
}

void GraphEditor::DisplaySelectedNodeDetails(const WorkspaceManager& manager) {
    ImGui::Begin("Node Details");
    const auto& focused = focus_.Focused();
    if (!focused) {
        ImGui::TextWrapped("Click a package in the dependency graph to view its details.");
        ImGui::End();
        return;
    }

    const PackageId& id = *focused;
    ImGui::Text("Package: %s", id.c_str());
    auto package_it = manager.scan().packages.find(id);
    if (package_it != manager.scan().packages.end()) {
        ImGui::TextWrapped("Manifest: %s", package_it->second.manifest_path.string().c_str());
    }

    const ImVec4 incoming_col = ImGui::ColorConvertU32ToFloat4(ThemeUtils::GetThemeEdgeColor(current_theme_, HighlightTag::INCOMING));
    const ImVec4 outgoing_col = ImGui::ColorConvertU32ToFloat4(ThemeUtils::GetThemeEdgeColor(current_theme_, HighlightTag::OUTGOING));

    ImGui::Separator();
    ImGui::TextColored(outgoing_col, "Depends on (%zu):", manager.graph().Dependencies(id).size());
    for (const auto& dep : manager.graph().Dependencies(id)) {
        ImGui::BulletText("%s", dep.c_str());
    }
    ImGui::TextColored(incoming_col, "Required by (%zu):", manager.graph().Dependents(id).size());
    for (const auto& dependent : manager.graph().Dependents(id)) {
        ImGui::BulletText("%s", dependent.c_str());
    }
    if (package_it != manager.scan().packages.end()) {
        const auto& known = manager.graph().Dependencies(id);
        std::vector<PackageId> external;
        for (const auto& dep : package_it->second.dependencies) {
            if (dep != id && known.find(dep) == known.end()) external.push_back(dep);
        }
        if (ImGui::CollapsingHeader(("External dependencies (" + std::to_string(external.size()) + ")").c_str())) {
            for (const auto& dep : external) {
                ImGui::BulletText("%s", dep.c_str());
            }
        }
    }
    ImGui::End();
}

} // namespace graph
} // namespace wsm
