#ifndef FILESYSTEM_UTILS_H
#define FILESYSTEM_UTILS_H

#include <filesystem>
#include <string>

namespace wsm {
namespace utils {
    // Get the user's home directory path
    // Returns an empty path if the home directory cannot be determined
    std::filesystem::path get_home_directory_path();

    // ~/.ws-manager, created on demand. Empty path when it cannot be created.
    std::filesystem::path get_app_data_directory();

    // Expands a leading "~" or "~/" and trims surrounding whitespace, so paths
    // typed into the workspace field behave like in a shell.
    std::string expand_user_path(const std::string& path);
}
} // namespace wsm

#endif // FILESYSTEM_UTILS_H
