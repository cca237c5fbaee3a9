#include <workspace/workspace_cleaner.h>

#include <array>
#include <iostream>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace wsm {
namespace workspace {

namespace {

constexpr std::array<const char*, 3> kPreservedFiles = {"COLCON_IGNORE", "compile_commands.json", ".built_by"};
constexpr std::array<const char*, 2> kPreservedMarkers = {".cache", ".idea"};

bool IsPreserved(const fs::directory_entry& entry) {
    const std::string name = entry.path().filename().string();
    for (const char* marker : kPreservedMarkers) {
        if (name.find(marker) != std::string::npos) return true;
    }
    std::error_code ec;
    if (entry.is_regular_file(ec)) {
        for (const char* keep : kPreservedFiles) {
            if (name == keep) return true;
        }
    }
    return false;
}

void RemoveContents(const fs::path& directory, CleanReport& report) {
    std::error_code ec;
    fs::directory_iterator it(directory, ec);
    if (ec) {
        report.failures.push_back("Cannot list " + directory.string() + ": " + ec.message());
        std::cerr << "Warning: " << report.failures.back() << std::endl;
        return;
    }

    // Collect first; removing while iterating leaves the iterator unspecified.
    std::vector<fs::directory_entry> entries(fs::begin(it), fs::end(it));
    for (const auto& entry : entries) {
        if (IsPreserved(entry)) {
            ++report.preserved;
            continue;
        }
        std::error_code remove_ec;
        fs::remove_all(entry.path(), remove_ec);
        if (remove_ec) {
            report.failures.push_back("Failed to remove " + entry.path().string() + ": " + remove_ec.message());
            std::cerr << "Warning: " << report.failures.back() << std::endl;
        } else {
            ++report.removed;
        }
    }
}

} // anonymous namespace

CleanReport CleanWorkspace(const fs::path& workspace_root) {
    const fs::path build_dir = workspace_root / "build";
    const fs::path install_dir = workspace_root / "install";

    std::error_code ec;
    const bool has_build = fs::is_directory(build_dir, ec);
    const bool has_install = fs::is_directory(install_dir, ec);
    if (!has_build && !has_install) {
        throw std::runtime_error("Neither build nor install directory found in " + workspace_root.string());
    }

    CleanReport report;
    if (has_build) RemoveContents(build_dir, report);
    if (has_install) RemoveContents(install_dir, report);

    std::cout << "Cleaned " << workspace_root << ": " << report.removed << " entries removed, "
              << report.preserved << " preserved, " << report.failures.size() << " failures." << std::endl;
    return report;
}

} // namespace workspace
} // namespace wsm
