#include <config/app_config.h>
#include <db/settings_store.h>

#include <nlohmann/json.hpp>

#include <iostream>
#include <stdexcept>
#include <thread>

using json = nlohmann::json;

namespace wsm {

const char* ToString(ThemeType theme) {
    switch (theme) {
        case ThemeType::LIGHT: return "light";
        case ThemeType::DARK:
        default: return "dark";
    }
}

const char* ToString(BuildType build_type) {
    switch (build_type) {
        case BuildType::RELEASE: return "Release";
        case BuildType::DEBUG: return "Debug";
        case BuildType::AUTO:
        default: return "auto";
    }
}

std::optional<ThemeType> ThemeFromString(const std::string& value) {
    if (value == "dark") return ThemeType::DARK;
    if (value == "light") return ThemeType::LIGHT;
    return std::nullopt;
}

std::optional<BuildType> BuildTypeFromString(const std::string& value) {
    if (value == "auto") return BuildType::AUTO;
    if (value == "Release") return BuildType::RELEASE;
    if (value == "Debug") return BuildType::DEBUG;
    return std::nullopt;
}

int DefaultParallelWorkers() {
    unsigned int hw = std::thread::hardware_concurrency();
    return hw > 0 ? static_cast<int>(hw) : 8;
}

AppConfig::AppConfig() : parallel_workers(DefaultParallelWorkers()) {}

namespace config {

namespace {

std::optional<bool> ParseBool(const std::string& value) {
    if (value == "true" || value == "1") return true;
    if (value == "false" || value == "0") return false;
    return std::nullopt;
}

void WarnInvalid(const char* key, const std::string& value) {
    std::cerr << "Warning: ignoring invalid setting " << key << "='" << value << "'" << std::endl;
}

} // anonymous namespace

AppConfig Load(db::SettingsStore& store) {
    AppConfig config;

    if (auto value = store.loadSetting(kWorkspacePath)) {
        config.workspace_path = *value;
    }

    if (auto value = store.loadSetting(kLastSelectedPackages)) {
        try {
            config.last_selected_packages = json::parse(*value).get<std::vector<PackageId>>();
        } catch (const json::exception& e) {
            std::cerr << "Warning: Failed to parse " << kLastSelectedPackages << ": " << e.what() << std::endl;
        }
    }

    if (auto value = store.loadSetting(kSymlinkInstall)) {
        if (auto parsed = ParseBool(*value)) config.symlink_install = *parsed;
        else WarnInvalid(kSymlinkInstall, *value);
    }

    if (auto value = store.loadSetting(kAlwaysOnTop)) {
        if (auto parsed = ParseBool(*value)) config.always_on_top = *parsed;
        else WarnInvalid(kAlwaysOnTop, *value);
    }

    if (auto value = store.loadSetting(kParallelWorkers)) {
        try {
            int workers = std::stoi(*value);
            if (workers >= 1) {
                config.parallel_workers = workers;
            } else {
                WarnInvalid(kParallelWorkers, *value);
            }
        } catch (const std::exception&) {
            WarnInvalid(kParallelWorkers, *value);
        }
    }

    if (auto value = store.loadSetting(kTheme)) {
        if (auto parsed = ThemeFromString(*value)) config.theme = *parsed;
        else WarnInvalid(kTheme, *value);
    }

    if (auto value = store.loadSetting(kBuildType)) {
        if (auto parsed = BuildTypeFromString(*value)) config.build_type = *parsed;
        else WarnInvalid(kBuildType, *value);
    }

    return config;
}

void Save(db::SettingsStore& store, const AppConfig& config) {
    store.saveSettings({
        {kWorkspacePath, config.workspace_path},
        {kLastSelectedPackages, json(config.last_selected_packages).dump()},
        {kSymlinkInstall, config.symlink_install ? "true" : "false"},
        {kAlwaysOnTop, config.always_on_top ? "true" : "false"},
        {kParallelWorkers, std::to_string(config.parallel_workers)},
        {kTheme, ToString(config.theme)},
        {kBuildType, ToString(config.build_type)},
    });
}

} // namespace config
} // namespace wsm
