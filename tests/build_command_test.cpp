#include "gtest/gtest.h"
#include <build/build_command.h>

#include <stdexcept>
#include <string>
#include <vector>

using wsm::BuildType;
using wsm::build::BuildOptions;
using wsm::build::ComposeBuildCommand;
using wsm::build::JoinCommandLine;

TEST(BuildCommandTest, DefaultFlags) {
    BuildOptions options;
    options.parallel_workers = 4;
    auto argv = ComposeBuildCommand({"planner", "core"}, options);

    std::vector<std::string> expected = {"colcon", "build", "--symlink-install", "--parallel-workers", "4",
                                         "--packages-select", "core", "planner"};
    EXPECT_EQ(argv, expected);
}

TEST(BuildCommandTest, BuildTypeAndNoSymlink) {
    BuildOptions options;
    options.symlink_install = false;
    options.parallel_workers = 2;
    options.build_type = BuildType::RELEASE;
    auto argv = ComposeBuildCommand({"core", "core"}, options);

    std::vector<std::string> expected = {"colcon", "build", "--parallel-workers", "2", "--cmake-args",
                                         "-DCMAKE_BUILD_TYPE=Release", "--packages-select", "core"};
    EXPECT_EQ(argv, expected);
}

TEST(BuildCommandTest, EmptySelectionThrows) {
    EXPECT_THROW(ComposeBuildCommand({}, BuildOptions()), std::invalid_argument);
}

TEST(BuildCommandTest, InvalidWorkerCountThrows) {
    BuildOptions options;
    options.parallel_workers = 0;
    EXPECT_THROW(ComposeBuildCommand({"core"}, options), std::invalid_argument);
}

TEST(BuildCommandTest, OptionsFromConfig) {
    wsm::AppConfig config;
    config.symlink_install = false;
    config.parallel_workers = 6;
    config.build_type = BuildType::DEBUG;
    BuildOptions options = wsm::build::OptionsFromConfig(config);
    EXPECT_FALSE(options.symlink_install);
    EXPECT_EQ(options.parallel_workers, 6);
    EXPECT_EQ(options.build_type, BuildType::DEBUG);
}

TEST(BuildCommandTest, JoinQuotesOnlyWhenNeeded) {
    EXPECT_EQ(JoinCommandLine({"colcon", "build", "--packages-select", "core"}),
              "colcon build --packages-select core");
    EXPECT_EQ(JoinCommandLine({"echo", "two words", "it's"}), "echo 'two words' 'it'\\''s'");
    EXPECT_EQ(JoinCommandLine({"a", ""}), "a ''");
}
