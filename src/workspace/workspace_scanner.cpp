#include <workspace/workspace_scanner.h>
#include <workspace/manifest_parser.h>

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace wsm {
namespace workspace {

namespace {

const char* const kManifestFileName = "package.xml";
const char* const kIgnoreMarker = "COLCON_IGNORE";

std::vector<fs::path> CollectManifestPaths(const fs::path& src_dir) {
    std::vector<fs::path> manifests;
    std::error_code ec;
    fs::recursive_directory_iterator it(src_dir, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        throw std::runtime_error("Cannot read " + src_dir.string() + ": " + ec.message());
    }

    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            std::cerr << "Warning: stopped walking " << src_dir << ": " << ec.message() << std::endl;
            break;
        }
        const fs::directory_entry& entry = *it;
        std::error_code status_ec;
        if (entry.is_directory(status_ec)) {
            if (fs::exists(entry.path() / kIgnoreMarker, status_ec)) {
                it.disable_recursion_pending();
            }
            continue;
        }
        if (entry.path().filename() == kManifestFileName && entry.is_regular_file(status_ec)) {
            manifests.push_back(entry.path());
        }
    }

    std::sort(manifests.begin(), manifests.end());
    return manifests;
}

} // anonymous namespace

ScanResult ScanWorkspace(const fs::path& workspace_root) {
    const fs::path src_dir = workspace_root / "src";
    std::error_code ec;
    if (!fs::is_directory(src_dir, ec)) {
        throw std::runtime_error("src directory not found: " + src_dir.string());
    }

    ScanResult result;
    for (const fs::path& manifest_path : CollectManifestPaths(src_dir)) {
        PackageManifest manifest;
        try {
            manifest = ParseManifest(manifest_path);
        } catch (const ManifestParseError& e) {
            std::cerr << "Warning: skipping package: " << e.what() << std::endl;
            result.skipped.emplace_back(manifest_path, e.what());
            continue;
        }

        auto existing = result.packages.find(manifest.name);
        if (existing != result.packages.end()) {
            std::cerr << "Warning: duplicate package '" << manifest.name << "' in " << manifest_path
                      << ", keeping " << existing->second.manifest_path << std::endl;
            result.skipped.emplace_back(manifest_path, "duplicate package name '" + manifest.name + "'");
            continue;
        }

        Package package;
        package.name = manifest.name;
        package.manifest_path = manifest_path;
        package.directory = manifest_path.parent_path();
        package.dependencies = std::move(manifest.dependencies);
        result.packages.emplace(package.name, std::move(package));
    }

    std::cout << "Scanned " << src_dir << ": " << result.packages.size() << " packages, "
              << result.skipped.size() << " skipped." << std::endl;
    return result;
}

std::map<PackageId, PackageIdSet> DependencyTable(const ScanResult& scan) {
    std::map<PackageId, PackageIdSet> table;
    for (const auto& [name, package] : scan.packages) {
        table.emplace(name, package.dependencies);
    }
    return table;
}

} // namespace workspace
} // namespace wsm
