#pragma once

#include <core/id_types.h>

#include <functional>
#include <utility>
#include <map>
#include <vector>

namespace wsm {
namespace graph {

class DependencyGraph;

/*
 * Dependency-aware package selection.
 *
 * Selecting a package selects everything it (transitively) depends on;
 * deselecting a package deselects everything that (transitively) depends on
 * it. A propagation pass processes each package at most once, so cycles are
 * safe. While a pass is running, Toggle() calls are ignored: change listeners
 * that react to programmatic updates cannot start a second chain.
 */
class SelectionController {
public:
    using ChangeListener = std::function<void(const PackageId&, bool)>;

    explicit SelectionController(const DependencyGraph* graph = nullptr);

    // Rebinds to a rebuilt graph. Selections of vanished packages are dropped;
    // surviving ones are selected again so new dependencies are pulled in.
    void Reset(const DependencyGraph* graph);

    // User-initiated toggle of one package. Returns false when ignored
    // (unknown id or propagation already in progress).
    bool Toggle(const PackageId& id, bool checked);

    void Select(const PackageId& id);
    void Deselect(const PackageId& id);
    void SelectAll();
    void DeselectAll();

    // Selects every id still known to the graph, with propagation.
    void Restore(const std::vector<PackageId>& ids);

    bool IsSelected(const PackageId& id) const;
    bool IsPropagating() const { return propagating_; }

    // Sorted, as handed to persistence.
    std::vector<PackageId> SelectedPackages() const;
    PackageIdSet SelectedSet() const;

    void SetChangeListener(ChangeListener listener) { listener_ = std::move(listener); }

private:
    void Propagate(const PackageId& id, bool selected);
    void SetState(const PackageId& id, bool selected);

    const DependencyGraph* graph_;
    std::map<PackageId, bool> state_;
    ChangeListener listener_;
    bool propagating_ = false;
};

} // namespace graph
} // namespace wsm
