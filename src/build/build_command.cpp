#include <build/build_command.h>

#include <algorithm>
#include <stdexcept>

namespace wsm {
namespace build {

BuildOptions OptionsFromConfig(const AppConfig& config) {
    BuildOptions options;
    options.symlink_install = config.symlink_install;
    options.parallel_workers = config.parallel_workers;
    options.build_type = config.build_type;
    return options;
}

std::vector<std::string> ComposeBuildCommand(const std::vector<PackageId>& packages, const BuildOptions& options) {
    if (packages.empty()) {
        throw std::invalid_argument("Please select at least one package");
    }
    if (options.parallel_workers < 1) {
        throw std::invalid_argument("parallel workers must be at least 1, got " + std::to_string(options.parallel_workers));
    }

    std::vector<std::string> argv = {"colcon", "build"};
    if (options.symlink_install) {
        argv.push_back("--symlink-install");
    }
    argv.push_back("--parallel-workers");
    argv.push_back(std::to_string(options.parallel_workers));
    if (options.build_type != BuildType::AUTO) {
        argv.push_back("--cmake-args");
        argv.push_back(std::string("-DCMAKE_BUILD_TYPE=") + ToString(options.build_type));
    }
    argv.push_back("--packages-select");

    std::vector<PackageId> sorted = packages;
    std::sort(sorted.begin(), sorted.end());
    sorted.erase(std::unique(sorted.begin(), sorted.end()), sorted.end());
    argv.insert(argv.end(), sorted.begin(), sorted.end());
    return argv;
}

std::string JoinCommandLine(const std::vector<std::string>& argv) {
    std::string line;
    for (const auto& arg : argv) {
        if (!line.empty()) line += ' ';
        bool needs_quotes = arg.empty() || arg.find_first_of(" \t\"'$\\") != std::string::npos;
        if (!needs_quotes) {
            line += arg;
            continue;
        }
        line += '\'';
        for (char c : arg) {
            if (c == '\'') line += "'\\''";
            else line += c;
        }
        line += '\'';
    }
    return line;
}

} // namespace build
} // namespace wsm
