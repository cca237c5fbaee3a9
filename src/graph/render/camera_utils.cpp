#include <graph/render/camera_utils.h>
#include <gui/views/graph_types.h> // full definition for GraphViewState

#include <algorithm>

namespace wsm {
namespace graph {

ImVec2 CameraUtils::WorldToScreen(const ImVec2& world_pos, const GraphViewState& view_state) {
    return ImVec2((world_pos.x * view_state.zoom_scale) + view_state.pan_offset.x,
                  (world_pos.y * view_state.zoom_scale) + view_state.pan_offset.y);
}

ImVec2 CameraUtils::ScreenToWorld(const ImVec2& screen_pos_absolute, const ImVec2& canvas_screen_pos_absolute, const GraphViewState& view_state) {
    ImVec2 mouse_relative_to_canvas_origin = ImVec2(screen_pos_absolute.x - canvas_screen_pos_absolute.x,
                                                   screen_pos_absolute.y - canvas_screen_pos_absolute.y);

    if (view_state.zoom_scale == 0.0f) return ImVec2(0,0); // Avoid division by zero
    return ImVec2((mouse_relative_to_canvas_origin.x - view_state.pan_offset.x) / view_state.zoom_scale,
                  (mouse_relative_to_canvas_origin.y - view_state.pan_offset.y) / view_state.zoom_scale);
}

void CameraUtils::ZoomAt(GraphViewState& view_state, const ImVec2& pivot, float zoom_factor) {
    float new_zoom = std::clamp(view_state.zoom_scale * zoom_factor, kMinZoom, kMaxZoom);
    float applied = new_zoom / view_state.zoom_scale;
    view_state.pan_offset.x = (view_state.pan_offset.x - pivot.x) * applied + pivot.x;
    view_state.pan_offset.y = (view_state.pan_offset.y - pivot.y) * applied + pivot.y;
    view_state.zoom_scale = new_zoom;
}

void CameraUtils::FitToBounds(GraphViewState& view_state, const ImVec2& world_min, const ImVec2& world_max,
                              const ImVec2& canvas_size, float margin) {
    const float world_w = std::max(world_max.x - world_min.x, 1.0f);
    const float world_h = std::max(world_max.y - world_min.y, 1.0f);
    const float avail_w = std::max(canvas_size.x - 2.0f * margin, 1.0f);
    const float avail_h = std::max(canvas_size.y - 2.0f * margin, 1.0f);

    float zoom = std::min(avail_w / world_w, avail_h / world_h);
    zoom = std::clamp(zoom, kMinZoom, 1.0f);

    view_state.zoom_scale = zoom;
    view_state.pan_offset.x = (canvas_size.x - world_w * zoom) * 0.5f - world_min.x * zoom;
    view_state.pan_offset.y = (canvas_size.y - world_h * zoom) * 0.5f - world_min.y * zoom;
}

} // namespace graph
} // namespace wsm
