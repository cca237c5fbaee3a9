#include <gui/render/theme_utils.h>
#include <gui/views/gui_interface.h>

#include <imgui.h>

namespace wsm {
namespace ThemeUtils {

void applyDarkTheme() {
    ImGui::StyleColorsDark();
    ImGuiStyle& style = ImGui::GetStyle();
    style.WindowRounding = 4.0f;
    style.FrameRounding = 3.0f;
    style.Colors[ImGuiCol_WindowBg] = ImVec4(0.16f, 0.18f, 0.23f, 1.0f);
    style.Colors[ImGuiCol_ChildBg] = ImVec4(0.14f, 0.16f, 0.20f, 1.0f);
    style.Colors[ImGuiCol_Header] = ImVec4(0.37f, 0.51f, 0.67f, 0.55f);
    style.Colors[ImGuiCol_CheckMark] = ImVec4(0.53f, 0.75f, 0.82f, 1.0f);
}

void applyLightTheme() {
    ImGui::StyleColorsLight();
    ImGuiStyle& style = ImGui::GetStyle();
    style.WindowRounding = 4.0f;
    style.FrameRounding = 3.0f;
    style.Colors[ImGuiCol_WindowBg] = ImVec4(0.97f, 0.97f, 0.97f, 1.0f);
    style.Colors[ImGuiCol_Header] = ImVec4(0.10f, 0.46f, 0.82f, 0.35f);
}

void setTheme(GuiInterface& gui, ThemeType theme) {
    switch (theme) {
        case ThemeType::LIGHT:
            applyLightTheme();
            break;
        case ThemeType::DARK:
        default:
            applyDarkTheme();
            break;
    }
    gui.current_theme = theme;
}

NodeVisualState ResolveNodeState(graph::HighlightTag tag, bool initially_selected) {
    switch (tag) {
        case graph::HighlightTag::FOCUSED: return NodeVisualState::FOCUSED;
        case graph::HighlightTag::INCOMING: return NodeVisualState::INCOMING;
        case graph::HighlightTag::OUTGOING: return NodeVisualState::OUTGOING;
        case graph::HighlightTag::NONE:
        default:
            return initially_selected ? NodeVisualState::INITIALLY_SELECTED : NodeVisualState::NEUTRAL;
    }
}

NodeColors GetThemeNodeColors(ThemeType theme, NodeVisualState state) {
    const ImU32 white = IM_COL32(255, 255, 255, 255);
    switch (state) {
        case NodeVisualState::FOCUSED:
            return {IM_COL32(50, 180, 50, 255), IM_COL32(100, 220, 100, 255), white, 3.0f};
        case NodeVisualState::INCOMING:
            return {IM_COL32(220, 180, 30, 255), IM_COL32(255, 220, 80, 255), white, 2.0f};
        case NodeVisualState::OUTGOING:
            return {IM_COL32(220, 60, 60, 255), IM_COL32(255, 100, 100, 255), white, 2.0f};
        case NodeVisualState::INITIALLY_SELECTED:
            if (theme == ThemeType::LIGHT) {
                return {IM_COL32(25, 118, 210, 255), IM_COL32(208, 208, 208, 255), white, 1.0f};
            }
            return {IM_COL32(94, 129, 172, 255), IM_COL32(59, 66, 82, 255), white, 1.0f};
        case NodeVisualState::NEUTRAL:
        default:
            if (theme == ThemeType::LIGHT) {
                return {IM_COL32(255, 255, 255, 255), IM_COL32(208, 208, 208, 255), IM_COL32(33, 33, 33, 255), 1.0f};
            }
            return {IM_COL32(42, 47, 58, 255), IM_COL32(59, 66, 82, 255), IM_COL32(230, 230, 230, 255), 1.0f};
    }
}

ImU32 GetThemeEdgeColor(ThemeType theme, graph::HighlightTag tag) {
    switch (tag) {
        case graph::HighlightTag::INCOMING: return IM_COL32(255, 220, 80, 255);
        case graph::HighlightTag::OUTGOING: return IM_COL32(255, 100, 100, 255);
        default:
            return theme == ThemeType::DARK ? IM_COL32(136, 192, 208, 255) : IM_COL32(100, 100, 100, 255);
    }
}

float GetThemeEdgeThickness(graph::HighlightTag tag) {
    return tag == graph::HighlightTag::NONE ? 1.0f : 2.0f;
}

ImU32 GetThemeBackgroundColor(ThemeType theme) {
    return theme == ThemeType::DARK ? IM_COL32(30, 34, 42, 255) : IM_COL32(245, 245, 245, 255);
}

ImU32 GetThemeGridColor(ThemeType theme) {
    return theme == ThemeType::DARK ? IM_COL32(50, 56, 68, 255) : IM_COL32(225, 225, 225, 255);
}

} // namespace ThemeUtils
} // namespace wsm
