#pragma once

#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <vector>

namespace wsm {
namespace test {

// Throw-away colcon workspace under the system temp directory, removed on
// destruction.
class TempWorkspace {
public:
    TempWorkspace() {
        std::random_device rd;
        root_ = std::filesystem::temp_directory_path() /
                ("wsm_test_" + std::to_string(rd()) + "_" + std::to_string(rd()));
        std::filesystem::create_directories(root_);
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    TempWorkspace(const TempWorkspace&) = delete;
    TempWorkspace& operator=(const TempWorkspace&) = delete;

    const std::filesystem::path& root() const { return root_; }
    std::filesystem::path src() const { return root_ / "src"; }

    void WriteFile(const std::filesystem::path& relative, const std::string& content) const {
        std::filesystem::path full = root_ / relative;
        std::filesystem::create_directories(full.parent_path());
        std::ofstream out(full, std::ios::binary);
        out << content;
    }

    // Writes src/<dir>/package.xml declaring `name` with <depend> entries.
    void AddPackage(const std::string& dir, const std::string& name,
                    const std::vector<std::string>& depends = {}) const {
        std::string xml = "<?xml version=\"1.0\"?>\n<package format=\"3\">\n  <name>" + name + "</name>\n";
        xml += "  <version>0.0.1</version>\n";
        for (const auto& dep : depends) {
            xml += "  <depend>" + dep + "</depend>\n";
        }
        xml += "</package>\n";
        WriteFile(std::filesystem::path("src") / dir / "package.xml", xml);
    }

private:
    std::filesystem::path root_;
};

} // namespace test
} // namespace wsm
