#include "gtest/gtest.h"
#include "temp_workspace.h"
#include <workspace/workspace_cleaner.h>

#include <filesystem>
#include <stdexcept>

namespace fs = std::filesystem;

using wsm::test::TempWorkspace;
using wsm::workspace::CleanWorkspace;

class WorkspaceCleanerTest : public ::testing::Test {
protected:
    TempWorkspace ws;
};

TEST_F(WorkspaceCleanerTest, RemovesBuildOutputsAndKeepsMarkers) {
    ws.WriteFile("build/core/CMakeCache.txt", "cache");
    ws.WriteFile("build/planner/Makefile", "all:");
    ws.WriteFile("build/COLCON_IGNORE", "");
    ws.WriteFile("build/compile_commands.json", "[]");
    ws.WriteFile("build/.built_by", "colcon");
    ws.WriteFile("build/.cache/clangd/index", "idx");
    ws.WriteFile("install/core/lib/libcore.so", "elf");
    ws.WriteFile("install/setup.bash", "#!/bin/bash");
    ws.WriteFile("install/.idea/workspace.xml", "<x/>");

    auto report = CleanWorkspace(ws.root());

    EXPECT_TRUE(report.failures.empty());
    EXPECT_EQ(report.removed, 4u);
    EXPECT_EQ(report.preserved, 5u);

    EXPECT_FALSE(fs::exists(ws.root() / "build" / "core"));
    EXPECT_FALSE(fs::exists(ws.root() / "build" / "planner"));
    EXPECT_FALSE(fs::exists(ws.root() / "install" / "core"));
    EXPECT_FALSE(fs::exists(ws.root() / "install" / "setup.bash"));

    EXPECT_TRUE(fs::exists(ws.root() / "build" / "COLCON_IGNORE"));
    EXPECT_TRUE(fs::exists(ws.root() / "build" / "compile_commands.json"));
    EXPECT_TRUE(fs::exists(ws.root() / "build" / ".built_by"));
    EXPECT_TRUE(fs::exists(ws.root() / "build" / ".cache" / "clangd" / "index"));
    EXPECT_TRUE(fs::exists(ws.root() / "install" / ".idea" / "workspace.xml"));
}

TEST_F(WorkspaceCleanerTest, MarkerNamedDirectoryIsRemoved) {
    // Only regular files named like colcon markers are preserved.
    ws.WriteFile("build/COLCON_IGNORE/stale", "x");
    auto report = CleanWorkspace(ws.root());
    EXPECT_EQ(report.removed, 1u);
    EXPECT_FALSE(fs::exists(ws.root() / "build" / "COLCON_IGNORE"));
}

TEST_F(WorkspaceCleanerTest, OnlyInstallPresent) {
    ws.WriteFile("install/pkg/share/file", "x");
    auto report = CleanWorkspace(ws.root());
    EXPECT_EQ(report.removed, 1u);
    EXPECT_TRUE(fs::is_directory(ws.root() / "install"));
}

TEST_F(WorkspaceCleanerTest, NothingToCleanThrows) {
    ws.AddPackage("core", "core");
    EXPECT_THROW(CleanWorkspace(ws.root()), std::runtime_error);
}
