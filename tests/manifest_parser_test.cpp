#include "gtest/gtest.h"
#include <workspace/manifest_parser.h>

#include <filesystem>

using wsm::workspace::ManifestParseError;
using wsm::workspace::ParseManifest;
using wsm::workspace::ParseManifestString;

TEST(ManifestParserTest, CollectsAllDependencyKinds) {
    const char* xml = R"(<?xml version="1.0"?>
<package format="3">
  <name>nav_core</name>
  <version>1.0.0</version>
  <buildtool_depend>ament_cmake</buildtool_depend>
  <depend>rclcpp</depend>
  <build_depend>geometry_msgs</build_depend>
  <build_export_depend>tf2</build_export_depend>
  <exec_depend>launch_ros</exec_depend>
  <test_depend>ament_lint_auto</test_depend>
</package>)";

    auto manifest = ParseManifestString(xml);
    EXPECT_EQ(manifest.name, "nav_core");
    wsm::PackageIdSet expected = {"rclcpp", "geometry_msgs", "tf2", "launch_ros", "ament_lint_auto"};
    EXPECT_EQ(manifest.dependencies, expected);
}

TEST(ManifestParserTest, DuplicateAcrossKindsAppearsOnce) {
    const char* xml = R"(<package format="2">
  <name>foo</name>
  <depend>bar</depend>
  <test_depend>bar</test_depend>
</package>)";

    auto manifest = ParseManifestString(xml);
    EXPECT_EQ(manifest.name, "foo");
    ASSERT_EQ(manifest.dependencies.size(), 1u);
    EXPECT_EQ(manifest.dependencies.count("bar"), 1u);
}

TEST(ManifestParserTest, TrimsWhitespace) {
    const char* xml = "<package>\n  <name>\n    spaced_pkg\n  </name>\n  <depend>  rclpy\t</depend>\n</package>";
    auto manifest = ParseManifestString(xml);
    EXPECT_EQ(manifest.name, "spaced_pkg");
    EXPECT_EQ(manifest.dependencies, wsm::PackageIdSet({"rclpy"}));
}

TEST(ManifestParserTest, IgnoresUnknownAndEmptyElements) {
    const char* xml = R"(<package>
  <name>pkg</name>
  <maintainer email="a@b.c">Someone</maintainer>
  <export><build_type>ament_cmake</build_type></export>
  <depend></depend>
  <exec_depend>   </exec_depend>
</package>)";
    auto manifest = ParseManifestString(xml);
    EXPECT_EQ(manifest.name, "pkg");
    EXPECT_TRUE(manifest.dependencies.empty());
}

TEST(ManifestParserTest, NoDependencies) {
    auto manifest = ParseManifestString("<package><name>leaf</name></package>");
    EXPECT_EQ(manifest.name, "leaf");
    EXPECT_TRUE(manifest.dependencies.empty());
}

TEST(ManifestParserTest, MalformedXmlThrows) {
    EXPECT_THROW(ParseManifestString("<package><name>broken</name>"), ManifestParseError);
    EXPECT_THROW(ParseManifestString("not xml at all <"), ManifestParseError);
}

TEST(ManifestParserTest, MissingNameThrows) {
    EXPECT_THROW(ParseManifestString("<package><depend>x</depend></package>"), ManifestParseError);
    EXPECT_THROW(ParseManifestString("<package><name>  </name></package>"), ManifestParseError);
}

TEST(ManifestParserTest, ErrorMessageNamesSource) {
    try {
        ParseManifestString("<package>", "src/demo/package.xml");
        FAIL() << "Expected ManifestParseError";
    } catch (const ManifestParseError& e) {
        EXPECT_NE(std::string(e.what()).find("src/demo/package.xml"), std::string::npos);
    }
}

TEST(ManifestParserTest, MissingFileThrows) {
    std::filesystem::path missing = std::filesystem::temp_directory_path() / "wsm_no_such_dir" / "package.xml";
    EXPECT_THROW(ParseManifest(missing), ManifestParseError);
}
