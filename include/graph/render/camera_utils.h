#ifndef CAMERA_UTILS_H
#define CAMERA_UTILS_H

#include <imgui.h>

namespace wsm {

// Forward declarations
struct GraphViewState;

namespace graph {

/*
 * Utility helpers for camera transformations in the graph view.
 * All methods are static; an instance of CameraUtils is never created.
 */
class CameraUtils {
public:
    static constexpr float kMinZoom = 0.1f;
    static constexpr float kMaxZoom = 10.0f;

    // Converts world coordinates to screen coordinates.
    static ImVec2 WorldToScreen(const ImVec2& world_pos, const GraphViewState& view_state);

    // Converts screen coordinates to world coordinates.
    static ImVec2 ScreenToWorld(const ImVec2& screen_pos_absolute,
                                const ImVec2& canvas_screen_pos_absolute,
                                const GraphViewState& view_state);

    // Zooms by `zoom_factor` keeping `pivot` (canvas-relative) fixed on screen.
    static void ZoomAt(GraphViewState& view_state, const ImVec2& pivot, float zoom_factor);

    // Pan/zoom so that the world rectangle fits the canvas with `margin` pixels
    // on each side. Never zooms in beyond 1.0.
    static void FitToBounds(GraphViewState& view_state, const ImVec2& world_min, const ImVec2& world_max,
                            const ImVec2& canvas_size, float margin = 40.0f);
};

} // namespace graph
} // namespace wsm


#endif // CAMERA_UTILS_H
