#pragma once

#include <core/id_types.h>
#include <db/database_fwd.h>

#include <optional>
#include <string>
#include <vector>

namespace wsm {

enum class ThemeType {
    DARK,
    LIGHT
};

// CMAKE_BUILD_TYPE forwarded to colcon; AUTO leaves it to the packages.
enum class BuildType {
    AUTO,
    RELEASE,
    DEBUG
};

const char* ToString(ThemeType theme);
const char* ToString(BuildType build_type);
std::optional<ThemeType> ThemeFromString(const std::string& value);
std::optional<BuildType> BuildTypeFromString(const std::string& value);

// Hardware concurrency, 8 when unknown.
int DefaultParallelWorkers();

struct AppConfig {
    std::string workspace_path;
    std::vector<PackageId> last_selected_packages;
    bool symlink_install = true;
    bool always_on_top = false;
    int parallel_workers;
    ThemeType theme = ThemeType::DARK;
    BuildType build_type = BuildType::AUTO;

    AppConfig();
};

namespace config {

// Setting keys in the `settings` table.
inline constexpr const char* kWorkspacePath = "workspace_path";
inline constexpr const char* kLastSelectedPackages = "last_selected_packages";
inline constexpr const char* kSymlinkInstall = "symlink_install";
inline constexpr const char* kAlwaysOnTop = "always_on_top";
inline constexpr const char* kParallelWorkers = "parallel_workers";
inline constexpr const char* kTheme = "theme";
inline constexpr const char* kBuildType = "build_type";

// Missing or malformed values keep their defaults (with a warning on stderr).
AppConfig Load(db::SettingsStore& store);

// Throws std::runtime_error if the database rejects a write.
void Save(db::SettingsStore& store, const AppConfig& config);

} // namespace config
} // namespace wsm
