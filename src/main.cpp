#include <gui/views/gui_interface.h>
#include <gui/views/main_gui_views.h>
#include <gui/views/graph_types.h>
#include <graph/render/graph_renderer.h>
#include <core/workspace_manager.h>
#include <db/sqlite_connection.h>
#include <db/settings_store.h>

#include <GLFW/glfw3.h>
#include <imgui.h>
#include <backends/imgui_impl_glfw.h>
#include <backends/imgui_impl_opengl3.h>

#include <iostream>

namespace {

int run() {
    wsm::db::SQLiteConnection connection;
    wsm::db::SettingsStore settings(connection);
    wsm::WorkspaceManager manager(settings);

    wsm::GuiInterface gui_ui;
    try {
        gui_ui.initialize(manager.config().theme);
    } catch (const std::exception& e) {
        std::cerr << "GUI Initialization failed: " << e.what() << std::endl;
        return 1;
    }
    gui_ui.setAlwaysOnTop(manager.config().always_on_top);

    wsm::graph::GraphEditor editor;
    editor.SetCurrentTheme(manager.config().theme);
    wsm::GraphViewState view_state;

    GLFWwindow* window = gui_ui.getWindow();

    // --- Main Render Loop ---
    while (!glfwWindowShouldClose(window)) {
        glfwPollEvents();

        ImGui_ImplOpenGL3_NewFrame();
        ImGui_ImplGlfw_NewFrame();
        ImGui::NewFrame();

        wsm::drawAllViews(manager, gui_ui, editor, view_state);

        // Rendering
        ImGui::Render();
        int display_w, display_h;
        glfwGetFramebufferSize(window, &display_w, &display_h);
        glViewport(0, 0, display_w, display_h);
        ImVec4 clear_color = ImGui::GetStyle().Colors[ImGuiCol_WindowBg];
        glClearColor(clear_color.x, clear_color.y, clear_color.z, clear_color.w);
        glClear(GL_COLOR_BUFFER_BIT);
        ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());

        glfwSwapBuffers(window);
    }

    // --- Cleanup ---
    manager.saveConfig();
    gui_ui.shutdown();
    return 0;
}

} // anonymous namespace

int main(int, char**) {
    try {
        return run();
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
