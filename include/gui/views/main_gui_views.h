#pragma once

#include <gui/views/graph_types.h>

namespace wsm {

// Forward declarations to avoid including heavy headers
class WorkspaceManager;
class GuiInterface;

namespace graph {
class GraphEditor;
}

/*
 * @brief Renders all ImGui views for the application.
 *
 * Draws the main window (toolbar, package table, log panel, build options,
 * status line) and, when open, the dependency graph window with its node
 * details panel. It is called once per frame from the main loop.
 *
 * @param manager    Application state the views read and mutate.
 * @param gui        The GuiInterface, for theme and window attributes.
 * @param editor     The dependency graph view.
 * @param view_state Camera of the dependency graph canvas.
 */
void drawAllViews(WorkspaceManager& manager, GuiInterface& gui, graph::GraphEditor& editor, GraphViewState& view_state);

} // namespace wsm
