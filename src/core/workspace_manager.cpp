#include <core/workspace_manager.h>
#include <build/build_command.h>
#include <core/filesystem_utils.h>
#include <db/settings_store.h>

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <iostream>
#include <stdexcept>

namespace wsm {

namespace {

std::string ToLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

} // anonymous namespace

WorkspaceManager::WorkspaceManager(db::SettingsStore& settings)
    : settings_(settings), selection_(&graph_) {
    try {
        config_ = config::Load(settings_);
    } catch (const std::exception& e) {
        std::cerr << "Warning: Failed to load settings, using defaults: " << e.what() << std::endl;
        config_ = AppConfig();
    }

    if (HasWorkspace()) {
        Refresh();
    }
}

void WorkspaceManager::saveConfig() {
    if (scanned_) {
        config_.last_selected_packages = selection_.SelectedPackages();
    }
    try {
        config::Save(settings_, config_);
    } catch (const std::exception& e) {
        std::cerr << "Warning: Failed to save settings: " << e.what() << std::endl;
        status_ = std::string("Failed to save settings: ") + e.what();
    }
}

bool WorkspaceManager::LoadWorkspace(const std::string& input) {
    const std::string path = utils::expand_user_path(input);
    if (path.empty()) {
        status_ = "Please select workspace first!";
        return false;
    }
    const std::string previous_path = config_.workspace_path;
    const bool previously_scanned = scanned_;
    if (path != config_.workspace_path) {
        // A different workspace is scanned from scratch. The current selection
        // is carried over by package name through last_selected_packages.
        if (scanned_) {
            config_.last_selected_packages = selection_.SelectedPackages();
        }
        scanned_ = false;
    }
    config_.workspace_path = path;
    if (!Refresh()) {
        config_.workspace_path = previous_path;
        scanned_ = previously_scanned;
        return false;
    }
    saveConfig();
    return true;
}

bool WorkspaceManager::Refresh() {
    if (!HasWorkspace()) {
        status_ = "Please select workspace first!";
        return false;
    }

    workspace::ScanResult scan;
    try {
        scan = workspace::ScanWorkspace(config_.workspace_path);
    } catch (const std::exception& e) {
        status_ = e.what();
        AppendLog(std::string("[error] ") + e.what());
        return false;
    }

    std::vector<PackageId> carried = scanned_ ? selection_.SelectedPackages() : config_.last_selected_packages;

    scan_ = std::move(scan);
    graph_.Build(workspace::DependencyTable(scan_));
    selection_.Reset(&graph_);
    selection_.Restore(carried);
    scanned_ = true;
    ++revision_;

    for (const auto& [path, reason] : scan_.skipped) {
        AppendLog("[warn] skipped " + path.string() + ": " + reason);
    }
    status_ = "Loaded " + std::to_string(scan_.packages.size()) + " packages";
    if (!scan_.skipped.empty()) {
        status_ += " (" + std::to_string(scan_.skipped.size()) + " skipped)";
    }
    return true;
}

void WorkspaceManager::ToggleSelection(const PackageId& id, bool checked) {
    if (selection_.Toggle(id, checked)) {
        ++revision_;
    }
}

void WorkspaceManager::SelectAll() {
    selection_.SelectAll();
    ++revision_;
}

void WorkspaceManager::DeselectAll() {
    selection_.DeselectAll();
    ++revision_;
}

std::vector<PackageId> WorkspaceManager::FilteredPackages(const std::string& filter) const {
    std::string needle = ToLower(filter);
    needle.erase(0, needle.find_first_not_of(" \t"));
    needle.erase(needle.find_last_not_of(" \t") + 1);

    std::vector<PackageId> result;
    for (const auto& id : graph_.Packages()) {
        if (needle.empty() || ToLower(id).find(needle) != std::string::npos) {
            result.push_back(id);
        }
    }
    return result;
}

GraphScope WorkspaceManager::ComputeGraphScope() const {
    GraphScope scope;
    scope.initially_selected = selection_.SelectedSet();
    if (scope.initially_selected.empty()) {
        for (const auto& id : graph_.Packages()) {
            scope.nodes.insert(id);
        }
    } else {
        scope.nodes = graph_.Closure(scope.initially_selected);
    }
    scope.edges = graph_.InducedEdges(scope.nodes);
    return scope;
}

std::optional<std::string> WorkspaceManager::ComposeBuildCommand() {
    if (!HasWorkspace()) {
        status_ = "Please select workspace first!";
        return std::nullopt;
    }

    std::string line;
    try {
        line = build::JoinCommandLine(
            build::ComposeBuildCommand(selection_.SelectedPackages(), build::OptionsFromConfig(config_)));
    } catch (const std::invalid_argument& e) {
        status_ = e.what();
        return std::nullopt;
    }

    AppendLog("[" + config_.workspace_path + "]$ " + line);
    status_ = "Build command copied to clipboard";
    saveConfig();
    return line;
}

std::optional<workspace::CleanReport> WorkspaceManager::CleanWorkspace() {
    if (!HasWorkspace()) {
        status_ = "Please select workspace first!";
        return std::nullopt;
    }

    workspace::CleanReport report;
    try {
        report = workspace::CleanWorkspace(config_.workspace_path);
    } catch (const std::exception& e) {
        status_ = std::string("Clean failed: ") + e.what();
        AppendLog("[error] " + status_);
        return std::nullopt;
    }

    for (const auto& failure : report.failures) {
        AppendLog("[warn] " + failure);
    }
    status_ = "Clean completed: " + std::to_string(report.removed) + " removed, " +
              std::to_string(report.preserved) + " preserved";
    AppendLog(status_);
    return report;
}

void WorkspaceManager::AppendLog(const std::string& line) {
    log_.push_back(line);
    ++log_appended_;
    if (log_.size() > kMaxLogLines) {
        log_.erase(log_.begin(), log_.begin() + static_cast<std::ptrdiff_t>(log_.size() - kMaxLogLines));
    }
}

} // namespace wsm
