#include "gtest/gtest.h"
#include <config/app_config.h>
#include <db/settings_store.h>
#include <db/sqlite_connection.h>

#include <memory>
#include <stdexcept>

using wsm::AppConfig;
using wsm::BuildType;
using wsm::ThemeType;

class SettingsStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        m_db_conn = std::make_unique<wsm::db::SQLiteConnection>(":memory:");
        m_store = std::make_unique<wsm::db::SettingsStore>(*m_db_conn);
    }

    void TearDown() override {
        m_store.reset();
        m_db_conn.reset();
    }

    std::unique_ptr<wsm::db::SQLiteConnection> m_db_conn;
    std::unique_ptr<wsm::db::SettingsStore> m_store;
};

TEST_F(SettingsStoreTest, SaveAndLoad) {
    EXPECT_FALSE(m_store->loadSetting("missing").has_value());

    m_store->saveSetting("key", "value");
    auto loaded = m_store->loadSetting("key");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, "value");

    m_store->saveSetting("key", "other");
    EXPECT_EQ(m_store->loadSetting("key").value(), "other");
}

TEST_F(SettingsStoreTest, RemoveSetting) {
    m_store->saveSetting("key", "value");
    m_store->removeSetting("key");
    EXPECT_FALSE(m_store->loadSetting("key").has_value());
    EXPECT_NO_THROW(m_store->removeSetting("key"));
}

TEST_F(SettingsStoreTest, SaveSettingsWritesAllPairs) {
    m_store->saveSettings({{"a", "1"}, {"b", "2"}});
    EXPECT_EQ(m_store->loadSetting("a").value(), "1");
    EXPECT_EQ(m_store->loadSetting("b").value(), "2");
}

TEST_F(SettingsStoreTest, SaveSettingsRollsBackOnFailure) {
    m_store->saveSetting("a", "old");
    m_db_conn->exec("CREATE TRIGGER reject_b BEFORE INSERT ON settings WHEN NEW.key = 'b' "
                    "BEGIN SELECT RAISE(ABORT, 'rejected'); END;");

    EXPECT_THROW(m_store->saveSettings({{"a", "new"}, {"b", "2"}}), std::runtime_error);
    EXPECT_EQ(m_store->loadSetting("a").value(), "old");
    EXPECT_FALSE(m_store->loadSetting("b").has_value());
}

TEST_F(SettingsStoreTest, ExecRejectsBadSql) {
    EXPECT_THROW(m_db_conn->exec("SELECT * FROM no_such_table;"), std::runtime_error);
}

TEST_F(SettingsStoreTest, EmptyStoreGivesDefaults) {
    AppConfig config = wsm::config::Load(*m_store);
    EXPECT_TRUE(config.workspace_path.empty());
    EXPECT_TRUE(config.last_selected_packages.empty());
    EXPECT_TRUE(config.symlink_install);
    EXPECT_FALSE(config.always_on_top);
    EXPECT_EQ(config.parallel_workers, wsm::DefaultParallelWorkers());
    EXPECT_EQ(config.theme, ThemeType::DARK);
    EXPECT_EQ(config.build_type, BuildType::AUTO);
}

TEST_F(SettingsStoreTest, AppConfigRoundTrip) {
    AppConfig config;
    config.workspace_path = "/home/dev/ros2_ws";
    config.last_selected_packages = {"nav_core", "planner"};
    config.symlink_install = false;
    config.always_on_top = true;
    config.parallel_workers = 3;
    config.theme = ThemeType::LIGHT;
    config.build_type = BuildType::DEBUG;
    wsm::config::Save(*m_store, config);

    EXPECT_EQ(m_store->loadSetting(wsm::config::kLastSelectedPackages).value(), R"(["nav_core","planner"])");
    EXPECT_EQ(m_store->loadSetting(wsm::config::kBuildType).value(), "Debug");

    AppConfig loaded = wsm::config::Load(*m_store);
    EXPECT_EQ(loaded.workspace_path, config.workspace_path);
    EXPECT_EQ(loaded.last_selected_packages, config.last_selected_packages);
    EXPECT_EQ(loaded.symlink_install, false);
    EXPECT_EQ(loaded.always_on_top, true);
    EXPECT_EQ(loaded.parallel_workers, 3);
    EXPECT_EQ(loaded.theme, ThemeType::LIGHT);
    EXPECT_EQ(loaded.build_type, BuildType::DEBUG);
}

TEST_F(SettingsStoreTest, MalformedValuesFallBackToDefaults) {
    m_store->saveSetting(wsm::config::kLastSelectedPackages, "[not json");
    m_store->saveSetting(wsm::config::kSymlinkInstall, "maybe");
    m_store->saveSetting(wsm::config::kParallelWorkers, "0");
    m_store->saveSetting(wsm::config::kTheme, "purple");
    m_store->saveSetting(wsm::config::kBuildType, "RelWithDebInfo");

    AppConfig config = wsm::config::Load(*m_store);
    EXPECT_TRUE(config.last_selected_packages.empty());
    EXPECT_TRUE(config.symlink_install);
    EXPECT_EQ(config.parallel_workers, wsm::DefaultParallelWorkers());
    EXPECT_EQ(config.theme, ThemeType::DARK);
    EXPECT_EQ(config.build_type, BuildType::AUTO);
}

TEST_F(SettingsStoreTest, NonArraySelectionIsIgnored) {
    m_store->saveSetting(wsm::config::kLastSelectedPackages, R"({"a": 1})");
    m_store->saveSetting(wsm::config::kParallelWorkers, "many");
    AppConfig config = wsm::config::Load(*m_store);
    EXPECT_TRUE(config.last_selected_packages.empty());
    EXPECT_EQ(config.parallel_workers, wsm::DefaultParallelWorkers());
}

TEST(AppConfigTest, EnumStringConversions) {
    EXPECT_STREQ(wsm::ToString(ThemeType::DARK), "dark");
    EXPECT_STREQ(wsm::ToString(BuildType::RELEASE), "Release");
    EXPECT_EQ(wsm::ThemeFromString("light"), ThemeType::LIGHT);
    EXPECT_FALSE(wsm::ThemeFromString("Light").has_value());
    EXPECT_EQ(wsm::BuildTypeFromString("auto"), BuildType::AUTO);
    EXPECT_FALSE(wsm::BuildTypeFromString("release").has_value());
    EXPECT_GE(wsm::DefaultParallelWorkers(), 1);
}
