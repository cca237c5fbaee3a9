#include <gui/views/main_gui_views.h>
#include <gui/views/gui_interface.h>
#include <graph/render/graph_renderer.h>
#include <core/workspace_manager.h>
#include <config/app_config.h>

#include <imgui.h>

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <string>
#include <thread>
#include <vector>

namespace wsm {

// --- View-specific state ---
static bool s_is_graph_view_visible = false;
static bool s_scroll_log_to_bottom = false;
static std::uint64_t s_last_log_count = 0;
static char s_workspace_buf[1024] = "";
static bool s_workspace_buf_initialized = false;
static char s_filter_buf[256] = "";
static PackageId s_details_package;

static const char* kBuildTypeLabels[] = {"auto", "Release", "Debug"};
static const char* kThemeLabels[] = {"Dark", "Light"};

// --- Helper Functions for UI Rendering ---

static int MaxParallelWorkers() {
    unsigned int hw = std::thread::hardware_concurrency();
    return hw == 0 ? 8 : static_cast<int>(hw);
}

static void DrawToolbar(WorkspaceManager& manager) {
    if (!s_workspace_buf_initialized) {
        std::strncpy(s_workspace_buf, manager.config().workspace_path.c_str(), sizeof(s_workspace_buf) - 1);
        s_workspace_buf_initialized = true;
    }

    ImGui::Text("Workspace:");
    ImGui::SameLine();
    ImGui::SetNextItemWidth(ImGui::GetContentRegionAvail().x * 0.45f);
    bool open_requested = ImGui::InputTextWithHint("##workspace", "/path/to/ros2_ws", s_workspace_buf,
                                                   sizeof(s_workspace_buf), ImGuiInputTextFlags_EnterReturnsTrue);
    ImGui::SameLine();
    open_requested |= ImGui::Button("Open");
    if (open_requested) {
        manager.LoadWorkspace(s_workspace_buf);
    }

    ImGui::SameLine();
    if (ImGui::Button("Refresh")) {
        manager.Refresh();
    }
    ImGui::SameLine();
    if (ImGui::Button("Select All")) {
        manager.SelectAll();
    }
    ImGui::SameLine();
    if (ImGui::Button("Deselect All")) {
        manager.DeselectAll();
    }
    ImGui::SameLine();
    if (ImGui::Button(s_is_graph_view_visible ? "Hide Dependency Graph" : "Dependency Graph")) {
        s_is_graph_view_visible = !s_is_graph_view_visible;
    }
}

static void DrawPackageDetailsPopup(const WorkspaceManager& manager) {
    if (!ImGui::BeginPopup("PackageDetails")) return;

    auto it = manager.scan().packages.find(s_details_package);
    if (it == manager.scan().packages.end()) {
        ImGui::TextUnformatted("Package no longer present.");
    } else {
        const workspace::Package& pkg = it->second;
        ImGui::Text("Package: %s", pkg.name.c_str());
        ImGui::Text("Path: %s", pkg.directory.string().c_str());
        ImGui::Text("Manifest: %s", pkg.manifest_path.string().c_str());
        ImGui::Separator();
        ImGui::Text("Workspace dependencies: %zu", manager.graph().Dependencies(pkg.name).size());
        ImGui::Text("Dependents: %zu", manager.graph().Dependents(pkg.name).size());
        if (ImGui::Button("Copy Path")) {
            ImGui::SetClipboardText(pkg.directory.string().c_str());
            ImGui::CloseCurrentPopup();
        }
    }
    ImGui::EndPopup();
}

static void DrawPackageTable(WorkspaceManager& manager, float height) {
    ImGui::SetNextItemWidth(-1.0f);
    ImGui::InputTextWithHint("##filter", "Search packages...", s_filter_buf, sizeof(s_filter_buf));

    const std::vector<PackageId> visible = manager.FilteredPackages(s_filter_buf);
    const ImGuiTableFlags flags = ImGuiTableFlags_RowBg | ImGuiTableFlags_BordersOuter | ImGuiTableFlags_ScrollY;
    if (!ImGui::BeginTable("Packages", 3, flags, ImVec2(0.0f, height))) return;

    ImGui::TableSetupScrollFreeze(0, 1);
    ImGui::TableSetupColumn("Build", ImGuiTableColumnFlags_WidthFixed, 48.0f);
    ImGui::TableSetupColumn("Package", ImGuiTableColumnFlags_WidthStretch);
    ImGui::TableSetupColumn("Dependencies", ImGuiTableColumnFlags_WidthFixed, 100.0f);
    ImGui::TableHeadersRow();

    for (const auto& id : visible) {
        ImGui::TableNextRow();
        ImGui::PushID(id.c_str());

        ImGui::TableSetColumnIndex(0);
        bool checked = manager.selection().IsSelected(id);
        if (ImGui::Checkbox("##selected", &checked)) {
            manager.ToggleSelection(id, checked);
        }

        ImGui::TableSetColumnIndex(1);
        ImGui::Selectable(id.c_str(), false, ImGuiSelectableFlags_SpanAllColumns | ImGuiSelectableFlags_AllowItemOverlap);
        if (ImGui::IsItemClicked(ImGuiMouseButton_Right)) {
            s_details_package = id;
            ImGui::OpenPopup("PackageDetails");
        }
        DrawPackageDetailsPopup(manager);

        ImGui::TableSetColumnIndex(2);
        ImGui::Text("%zu", manager.graph().Dependencies(id).size());

        ImGui::PopID();
    }
    ImGui::EndTable();
}

static void DrawLogPanel(WorkspaceManager& manager, float height) {
    ImGui::Text("Log");
    ImGui::SameLine();
    if (ImGui::SmallButton("Clear")) {
        manager.ClearLog();
    }
    ImGui::SameLine();
    if (ImGui::SmallButton("Copy")) {
        std::string all;
        for (const auto& line : manager.log()) {
            all += line;
            all += '\n';
        }
        ImGui::SetClipboardText(all.c_str());
    }

    if (manager.log_appended() != s_last_log_count) {
        s_scroll_log_to_bottom = true;
        s_last_log_count = manager.log_appended();
    }

    ImGui::BeginChild("LogOutput", ImVec2(0.0f, height), true, ImGuiWindowFlags_HorizontalScrollbar);
    for (const auto& line : manager.log()) {
        const bool is_error = line.rfind("[error]", 0) == 0;
        const bool is_warning = line.rfind("[warn]", 0) == 0;
        if (is_error) ImGui::PushStyleColor(ImGuiCol_Text, ImVec4(0.95f, 0.35f, 0.35f, 1.0f));
        else if (is_warning) ImGui::PushStyleColor(ImGuiCol_Text, ImVec4(0.95f, 0.75f, 0.25f, 1.0f));
        ImGui::TextUnformatted(line.c_str());
        if (is_error || is_warning) ImGui::PopStyleColor();
    }
    if (s_scroll_log_to_bottom) {
        ImGui::SetScrollHereY(1.0f);
        s_scroll_log_to_bottom = false;
    }
    ImGui::EndChild();
}

static void DrawOptions(WorkspaceManager& manager, GuiInterface& gui, graph::GraphEditor& editor) {
    AppConfig& config = manager.mutableConfig();
    bool changed = false;

    changed |= ImGui::Checkbox("Symlink install", &config.symlink_install);

    ImGui::SameLine();
    ImGui::SetNextItemWidth(110.0f);
    int build_type_idx = static_cast<int>(config.build_type);
    if (ImGui::Combo("Build type", &build_type_idx, kBuildTypeLabels, IM_ARRAYSIZE(kBuildTypeLabels))) {
        config.build_type = static_cast<BuildType>(build_type_idx);
        changed = true;
    }

    ImGui::SameLine();
    if (ImGui::Checkbox("Always on top", &config.always_on_top)) {
        gui.setAlwaysOnTop(config.always_on_top);
        changed = true;
    }

    ImGui::SameLine();
    ImGui::SetNextItemWidth(120.0f);
    if (ImGui::SliderInt("Workers", &config.parallel_workers, 1, MaxParallelWorkers())) {
        config.parallel_workers = std::clamp(config.parallel_workers, 1, MaxParallelWorkers());
        changed = true;
    }

    ImGui::SameLine();
    ImGui::SetNextItemWidth(90.0f);
    int theme_idx = static_cast<int>(config.theme);
    if (ImGui::Combo("Theme", &theme_idx, kThemeLabels, IM_ARRAYSIZE(kThemeLabels))) {
        config.theme = static_cast<ThemeType>(theme_idx);
        gui.setTheme(config.theme);
        editor.SetCurrentTheme(config.theme);
        changed = true;
    }

    ImGui::SameLine();
    const char* distro = std::getenv("ROS_DISTRO");
    ImGui::Text("ROS_DISTRO: %s", distro ? distro : "not set");

    if (changed) {
        manager.saveConfig();
    }
}

static void DrawActions(WorkspaceManager& manager) {
    if (ImGui::Button("Clean Workspace")) {
        ImGui::OpenPopup("Confirm Clean");
    }
    if (ImGui::BeginPopupModal("Confirm Clean", nullptr, ImGuiWindowFlags_AlwaysAutoResize)) {
        ImGui::Text("Remove the contents of build/ and install/ in\n%s ?", manager.config().workspace_path.c_str());
        if (ImGui::Button("Clean", ImVec2(120.0f, 0.0f))) {
            manager.CleanWorkspace();
            ImGui::CloseCurrentPopup();
        }
        ImGui::SameLine();
        if (ImGui::Button("Cancel", ImVec2(120.0f, 0.0f))) {
            ImGui::CloseCurrentPopup();
        }
        ImGui::EndPopup();
    }

    ImGui::SameLine();
    if (ImGui::Button("Build Selected")) {
        if (auto line = manager.ComposeBuildCommand()) {
            ImGui::SetClipboardText(line->c_str());
        }
    }
    ImGui::SameLine();
    ImGui::Text("%zu selected", manager.selection().SelectedSet().size());
}

static void DrawGraphWindow(WorkspaceManager& manager, graph::GraphEditor& editor, GraphViewState& view_state) {
    static bool was_visible = false;
    if (!s_is_graph_view_visible) {
        was_visible = false;
        return;
    }
    if (!was_visible) {
        view_state.fit_requested = true;
        was_visible = true;
    }

    editor.SyncWith(manager);

    ImGui::SetNextWindowSize(ImVec2(900.0f, 600.0f), ImGuiCond_FirstUseEver);
    if (ImGui::Begin("Dependency Graph", &s_is_graph_view_visible)) {
        ImGui::Text("Packages: %zu  Dependencies: %zu", editor.GetLayout().nodes.size(), editor.GetLayout().edges.size());
        ImGui::SameLine();
        if (ImGui::Button("Fit")) {
            view_state.fit_requested = true;
        }
        ImGui::SameLine();
        ImGui::TextDisabled("(click: focus, drag: pan, wheel: zoom)");

        ImGui::BeginChild("GraphCanvas", ImVec2(0.0f, 0.0f), true, ImGuiWindowFlags_NoScrollbar | ImGuiWindowFlags_NoScrollWithMouse);
        editor.Render(ImGui::GetWindowDrawList(), ImGui::GetCursorScreenPos(), ImGui::GetContentRegionAvail(), view_state);
        ImGui::EndChild();
    }
    ImGui::End();

    if (s_is_graph_view_visible) {
        editor.DisplaySelectedNodeDetails(manager);
    }
}

// --- Main Drawing Function ---
void drawAllViews(WorkspaceManager& manager, GuiInterface& gui, graph::GraphEditor& editor, GraphViewState& view_state) {
    const ImVec2 display_size = ImGui::GetIO().DisplaySize;
    ImGui::SetNextWindowPos(ImVec2(0.0f, 0.0f));
    ImGui::SetNextWindowSize(display_size);
    ImGui::Begin("Main", nullptr, ImGuiWindowFlags_NoTitleBar | ImGuiWindowFlags_NoResize | ImGuiWindowFlags_NoMove |
                                      ImGuiWindowFlags_NoCollapse | ImGuiWindowFlags_NoBringToFrontOnFocus);

    DrawToolbar(manager);
    ImGui::Separator();

    // Bottom area: options row, actions row, status line.
    const float line_h = ImGui::GetFrameHeightWithSpacing();
    const float bottom_h = line_h * 3.0f + ImGui::GetStyle().ItemSpacing.y * 2.0f;
    const float avail = ImGui::GetContentRegionAvail().y - bottom_h;
    const float table_h = std::max(120.0f, avail * 0.6f - line_h);
    const float log_h = std::max(80.0f, avail * 0.4f - line_h * 1.5f);

    DrawPackageTable(manager, table_h);
    DrawLogPanel(manager, log_h);
    ImGui::Separator();
    DrawOptions(manager, gui, editor);
    DrawActions(manager);
    ImGui::Separator();
    ImGui::TextUnformatted(manager.status().c_str());

    ImGui::End();

    DrawGraphWindow(manager, editor, view_state);
}

} // namespace wsm
