#pragma once

#include <config/app_config.h>
#include <graph/model/highlight_engine.h>

#include <imgui.h> // For ImU32

namespace wsm {

class GuiInterface;

namespace ThemeUtils {

// Visual state of a node in the dependency graph, in drawing priority order.
enum class NodeVisualState {
    FOCUSED,
    INCOMING,
    OUTGOING,
    INITIALLY_SELECTED,
    NEUTRAL
};

struct NodeColors {
    ImU32 fill;
    ImU32 border;
    ImU32 text;
    float border_thickness;
};

void applyDarkTheme();
void applyLightTheme();
void setTheme(GuiInterface& gui, ThemeType theme);

NodeVisualState ResolveNodeState(graph::HighlightTag tag, bool initially_selected);

// Graph-specific theme colors
NodeColors GetThemeNodeColors(ThemeType theme, NodeVisualState state);
ImU32 GetThemeEdgeColor(ThemeType theme, graph::HighlightTag tag);
float GetThemeEdgeThickness(graph::HighlightTag tag);
ImU32 GetThemeBackgroundColor(ThemeType theme);
ImU32 GetThemeGridColor(ThemeType theme);

} // namespace ThemeUtils
} // namespace wsm
