#include "gtest/gtest.h"
#include "temp_workspace.h"
#include <workspace/workspace_scanner.h>

#include <stdexcept>

using wsm::test::TempWorkspace;
using wsm::workspace::DependencyTable;
using wsm::workspace::ScanWorkspace;

class WorkspaceScannerTest : public ::testing::Test {
protected:
    TempWorkspace ws;
};

TEST_F(WorkspaceScannerTest, FindsNestedPackages) {
    ws.AddPackage("core", "core");
    ws.AddPackage("stacks/nav/planner", "planner", {"core", "rclcpp"});
    ws.AddPackage("stacks/nav/controller", "controller", {"planner"});

    auto result = ScanWorkspace(ws.root());
    ASSERT_EQ(result.packages.size(), 3u);
    EXPECT_TRUE(result.skipped.empty());

    const auto& planner = result.packages.at("planner");
    EXPECT_EQ(planner.directory.string(), (ws.src() / "stacks" / "nav" / "planner").string());
    EXPECT_EQ(planner.manifest_path.string(), (ws.src() / "stacks" / "nav" / "planner" / "package.xml").string());
    EXPECT_EQ(planner.dependencies, wsm::PackageIdSet({"core", "rclcpp"}));
}

TEST_F(WorkspaceScannerTest, SkipsBrokenManifest) {
    ws.AddPackage("good", "good");
    ws.WriteFile("src/bad/package.xml", "<package><name>bad</name>");

    auto result = ScanWorkspace(ws.root());
    ASSERT_EQ(result.packages.size(), 1u);
    EXPECT_EQ(result.packages.count("good"), 1u);
    ASSERT_EQ(result.skipped.size(), 1u);
    EXPECT_EQ(result.skipped[0].first.string(), (ws.src() / "bad" / "package.xml").string());
}

TEST_F(WorkspaceScannerTest, HonorsColconIgnore) {
    ws.AddPackage("kept", "kept");
    ws.AddPackage("ignored/inner", "inner");
    ws.WriteFile("src/ignored/COLCON_IGNORE", "");

    auto result = ScanWorkspace(ws.root());
    ASSERT_EQ(result.packages.size(), 1u);
    EXPECT_EQ(result.packages.count("kept"), 1u);
}

TEST_F(WorkspaceScannerTest, DuplicateNameKeepsFirstInPathOrder) {
    ws.AddPackage("a_copy", "dup", {"x"});
    ws.AddPackage("b_copy", "dup", {"y"});

    auto result = ScanWorkspace(ws.root());
    ASSERT_EQ(result.packages.size(), 1u);
    EXPECT_EQ(result.packages.at("dup").directory.string(), (ws.src() / "a_copy").string());
    ASSERT_EQ(result.skipped.size(), 1u);
    EXPECT_EQ(result.skipped[0].first.string(), (ws.src() / "b_copy" / "package.xml").string());
}

TEST_F(WorkspaceScannerTest, EmptySrcGivesEmptyResult) {
    std::filesystem::create_directories(ws.src());
    auto result = ScanWorkspace(ws.root());
    EXPECT_TRUE(result.packages.empty());
    EXPECT_TRUE(result.skipped.empty());
}

TEST_F(WorkspaceScannerTest, MissingSrcThrows) {
    EXPECT_THROW(ScanWorkspace(ws.root()), std::runtime_error);
}

TEST_F(WorkspaceScannerTest, DependencyTableMirrorsPackages) {
    ws.AddPackage("a", "a", {"b", "external_pkg"});
    ws.AddPackage("b", "b");

    auto table = DependencyTable(ScanWorkspace(ws.root()));
    ASSERT_EQ(table.size(), 2u);
    EXPECT_EQ(table.at("a"), wsm::PackageIdSet({"b", "external_pkg"}));
    EXPECT_TRUE(table.at("b").empty());
}
