#include <core/filesystem_utils.h>

#include <cstdlib>
#include <iostream>
#include <system_error>

namespace wsm {
namespace utils {

namespace {
const char* const kAppDirName = ".ws-manager";
} // anonymous namespace

std::filesystem::path get_home_directory_path() {
    const char* home_env = std::getenv("HOME");
    if (home_env && *home_env) {
        return std::filesystem::path(home_env);
    }
    #ifdef _WIN32
        const char* userprofile = std::getenv("USERPROFILE");
        if (userprofile && *userprofile) {
            return std::filesystem::path(userprofile);
        }
    #endif
    return std::filesystem::path();
}

std::filesystem::path get_app_data_directory() {
    std::filesystem::path home_dir = get_home_directory_path();
    if (home_dir.empty()) {
        return std::filesystem::path();
    }

    std::filesystem::path app_dir = home_dir / kAppDirName;
    std::error_code ec;
    std::filesystem::create_directories(app_dir, ec);
    if (ec) {
        std::cerr << "Warning: cannot create " << app_dir << ": " << ec.message() << std::endl;
        return std::filesystem::path();
    }
    return app_dir;
}

std::string expand_user_path(const std::string& path) {
    const char* whitespace = " \t\r\n";
    auto first = path.find_first_not_of(whitespace);
    if (first == std::string::npos) return "";
    std::string trimmed = path.substr(first, path.find_last_not_of(whitespace) - first + 1);

    if (trimmed[0] != '~' || (trimmed.size() > 1 && trimmed[1] != '/')) {
        return trimmed;
    }
    std::filesystem::path home_dir = get_home_directory_path();
    if (home_dir.empty()) {
        return trimmed;
    }
    if (trimmed.size() <= 2) {
        return home_dir.string();
    }
    return (home_dir / trimmed.substr(2)).string();
}

} // namespace utils
} // namespace wsm
