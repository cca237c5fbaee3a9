#pragma once

#include <GLFW/glfw3.h>

namespace wsm {
namespace EventDispatch {

void glfw_error_callback(int error, const char* description);
void window_close_callback(GLFWwindow* window);

} // namespace EventDispatch
} // namespace wsm
