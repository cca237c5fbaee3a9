#pragma once

#include <config/app_config.h>

// Forward declaration for GLFW window handle
struct GLFWwindow;

namespace wsm {

/*
 * Owns the GLFW window and the Dear ImGui context. The main loop in main.cpp
 * drives frames; this class only sets up and tears down the platform side.
 */
class GuiInterface {
public:
    GuiInterface() = default;
    ~GuiInterface();

    // Prevent copying/moving
    GuiInterface(const GuiInterface&)            = delete;
    GuiInterface& operator=(const GuiInterface&) = delete;
    GuiInterface(GuiInterface&&)                 = delete;
    GuiInterface& operator=(GuiInterface&&)      = delete;

    // Throws std::runtime_error if GLFW or an ImGui backend fails to start.
    void initialize(ThemeType theme);
    void shutdown();

    GLFWwindow* getWindow() const;

    void setTheme(ThemeType theme);
    void setAlwaysOnTop(bool on_top);

public: // Accessed from ThemeUtils
    GLFWwindow* window = nullptr;
    ThemeType current_theme = ThemeType::DARK;

private:
    bool imgui_init_done_ = false;
};

} // namespace wsm
