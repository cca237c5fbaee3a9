#pragma once

#include <config/app_config.h>
#include <core/id_types.h>

#include <string>
#include <vector>

namespace wsm {
namespace build {

struct BuildOptions {
    bool symlink_install = true;
    int parallel_workers = 1;
    BuildType build_type = BuildType::AUTO;
};

BuildOptions OptionsFromConfig(const AppConfig& config);

/*
 * argv of `colcon build` for the given packages:
 *   colcon build [--symlink-install] --parallel-workers N
 *                [--cmake-args -DCMAKE_BUILD_TYPE=<type>] --packages-select <pkg>...
 * Packages are emitted in sorted order. Throws std::invalid_argument when
 * `packages` is empty or parallel_workers < 1.
 */
std::vector<std::string> ComposeBuildCommand(const std::vector<PackageId>& packages, const BuildOptions& options);

// Shell-ready rendering of an argv (arguments quoted when needed).
std::string JoinCommandLine(const std::vector<std::string>& argv);

} // namespace build
} // namespace wsm
