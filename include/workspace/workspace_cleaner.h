#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace wsm {
namespace workspace {

struct CleanReport {
    size_t removed = 0;
    size_t preserved = 0;
    std::vector<std::string> failures; // one message per entry that could not be removed
};

/*
 * Empties <workspace>/build and <workspace>/install. Files named
 * COLCON_IGNORE, compile_commands.json and .built_by are kept, as is any entry
 * whose path contains .cache or .idea. Removal failures are collected in the
 * report and logged, they do not stop the clean.
 * Throws std::runtime_error when neither directory exists.
 */
CleanReport CleanWorkspace(const std::filesystem::path& workspace_root);

} // namespace workspace
} // namespace wsm
