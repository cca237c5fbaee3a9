#include <core/event_dispatch.h>
#include <iostream>

namespace wsm {
namespace EventDispatch {

void glfw_error_callback(int error, const char* description) {
    std::cerr << "GLFW Error " << error << ": " << description << std::endl;
}

void window_close_callback(GLFWwindow*) {
    std::cout << "Main window close requested." << std::endl;
}

} // namespace EventDispatch
} // namespace wsm
