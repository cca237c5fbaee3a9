#pragma once

#include <config/app_config.h>
#include <core/id_types.h>
#include <db/database_fwd.h>
#include <graph/model/dependency_graph.h>
#include <graph/model/selection_controller.h>
#include <workspace/workspace_cleaner.h>
#include <workspace/workspace_scanner.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace wsm {

// Node/edge subset shown in the dependency graph window.
struct GraphScope {
    PackageIdSet nodes;
    EdgeSet edges;
    PackageIdSet initially_selected;
};

/*
 * Application state behind the main window: configuration, the current scan,
 * its dependency graph and the package selection. Every method runs on the
 * GUI thread.
 */
class WorkspaceManager {
public:
    explicit WorkspaceManager(db::SettingsStore& settings);

    WorkspaceManager(const WorkspaceManager&) = delete;
    WorkspaceManager& operator=(const WorkspaceManager&) = delete;

    // Configuration
    const AppConfig& config() const { return config_; }
    AppConfig& mutableConfig() { return config_; }
    // Copies the selection into the config and writes everything to the store.
    void saveConfig();

    // Sets the workspace root ("~" expanded) and rescans it. Returns false
    // (status set, previous workspace kept) on error.
    bool LoadWorkspace(const std::string& path);
    // Rescans the current workspace; the selection survives for packages still present.
    bool Refresh();
    bool HasWorkspace() const { return !config_.workspace_path.empty(); }

    const graph::DependencyGraph& graph() const { return graph_; }
    const workspace::ScanResult& scan() const { return scan_; }
    const graph::SelectionController& selection() const { return selection_; }

    // User checkbox interaction.
    void ToggleSelection(const PackageId& id, bool checked);
    void SelectAll();
    void DeselectAll();

    // Sorted package names containing `filter` (case-insensitive).
    std::vector<PackageId> FilteredPackages(const std::string& filter) const;

    // Closure of the selection, or every package when nothing is selected.
    GraphScope ComputeGraphScope() const;

    // Composes the colcon command for the selection and logs it. Returns the
    // shell line, or std::nullopt (status set) when nothing is selected.
    std::optional<std::string> ComposeBuildCommand();

    // Cleans build/ and install/ of the workspace.
    std::optional<workspace::CleanReport> CleanWorkspace();

    // Log panel and status line. Only the newest kMaxLogLines are kept.
    static constexpr std::size_t kMaxLogLines = 5000;
    void AppendLog(const std::string& line);
    void ClearLog() { log_.clear(); }
    const std::vector<std::string>& log() const { return log_; }
    // Lines appended since start, including dropped ones.
    std::uint64_t log_appended() const { return log_appended_; }
    const std::string& status() const { return status_; }
    void setStatus(const std::string& status) { status_ = status; }

    // Bumped on every change that affects the dependency graph window.
    std::uint64_t revision() const { return revision_; }

private:
    db::SettingsStore& settings_;
    AppConfig config_;

    workspace::ScanResult scan_;
    graph::DependencyGraph graph_;
    graph::SelectionController selection_;
    bool scanned_ = false;

    std::vector<std::string> log_;
    std::uint64_t log_appended_ = 0;
    std::string status_;
    std::uint64_t revision_ = 0;
};

} // namespace wsm
