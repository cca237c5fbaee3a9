#pragma once

#include <imgui.h> // For ImVec2

namespace wsm {

// Camera of the dependency graph canvas.
struct GraphViewState {
    ImVec2 pan_offset;
    float zoom_scale;
    bool fit_requested; // re-center on the next frame (graph opened or rebuilt)

    GraphViewState() : pan_offset(0.0f, 0.0f), zoom_scale(1.0f), fit_requested(true) {}
};

} // namespace wsm
