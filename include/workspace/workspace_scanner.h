#pragma once

#include <core/id_types.h>

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace wsm {
namespace workspace {

struct Package {
    PackageId name;
    std::filesystem::path manifest_path;
    std::filesystem::path directory;
    PackageIdSet dependencies; // raw, as declared in the manifest
};

struct ScanResult {
    std::map<PackageId, Package> packages;
    // Manifests that could not be parsed, with the reason.
    std::vector<std::pair<std::filesystem::path, std::string>> skipped;
};

/*
 * Discovers the packages of a colcon workspace.
 * Every directory below <workspace>/src holding a package.xml contributes one
 * package; subtrees marked with COLCON_IGNORE are not visited. Broken
 * manifests are reported in ScanResult::skipped and never abort the scan.
 * Throws std::runtime_error if <workspace>/src does not exist.
 */
ScanResult ScanWorkspace(const std::filesystem::path& workspace_root);

// Name -> raw dependency set, the input of DependencyGraph::Build.
std::map<PackageId, PackageIdSet> DependencyTable(const ScanResult& scan);

} // namespace workspace
} // namespace wsm
