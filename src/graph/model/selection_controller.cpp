#include <graph/model/selection_controller.h>
#include <graph/model/dependency_graph.h>

namespace wsm {
namespace graph {

namespace {

// Marks a propagation pass as running for the lifetime of the scope.
class PropagationGuard {
public:
    explicit PropagationGuard(bool& flag) : flag_(flag) { flag_ = true; }
    ~PropagationGuard() { flag_ = false; }

    PropagationGuard(const PropagationGuard&) = delete;
    PropagationGuard& operator=(const PropagationGuard&) = delete;

private:
    bool& flag_;
};

} // anonymous namespace

SelectionController::SelectionController(const DependencyGraph* graph) : graph_(nullptr) {
    Reset(graph);
}

void SelectionController::Reset(const DependencyGraph* graph) {
    std::map<PackageId, bool> previous = std::move(state_);
    state_.clear();
    graph_ = graph;
    if (!graph_) return;

    std::vector<PackageId> carried;
    for (const auto& id : graph_->Packages()) {
        auto it = previous.find(id);
        const bool selected = (it != previous.end()) && it->second;
        state_[id] = selected;
        if (selected) carried.push_back(id);
    }
    // The rebuilt graph may have new edges out of a carried package.
    for (const auto& id : carried) {
        Propagate(id, true);
    }
}

bool SelectionController::Toggle(const PackageId& id, bool checked) {
    if (propagating_ || state_.find(id) == state_.end()) {
        return false;
    }
    Propagate(id, checked);
    return true;
}

void SelectionController::Select(const PackageId& id) {
    Propagate(id, true);
}

void SelectionController::Deselect(const PackageId& id) {
    Propagate(id, false);
}

void SelectionController::Propagate(const PackageId& id, bool selected) {
    if (propagating_ || !graph_ || !graph_->Contains(id)) return;
    PropagationGuard guard(propagating_);

    // Selection follows dependencies, deselection follows dependents.
    PackageIdSet visited;
    std::vector<PackageId> stack{id};
    while (!stack.empty()) {
        PackageId current = std::move(stack.back());
        stack.pop_back();
        if (!visited.insert(current).second) continue;

        SetState(current, selected);

        const PackageIdSet& next = selected ? graph_->Dependencies(current) : graph_->Dependents(current);
        for (auto it = next.rbegin(); it != next.rend(); ++it) {
            if (visited.find(*it) == visited.end()) {
                stack.push_back(*it);
            }
        }
    }
}

void SelectionController::SetState(const PackageId& id, bool selected) {
    auto it = state_.find(id);
    if (it == state_.end() || it->second == selected) return;
    it->second = selected;
    if (listener_) {
        listener_(id, selected);
    }
}

void SelectionController::SelectAll() {
    if (propagating_) return;
    PropagationGuard guard(propagating_);
    for (auto& entry : state_) {
        SetState(entry.first, true);
    }
}

void SelectionController::DeselectAll() {
    if (propagating_) return;
    PropagationGuard guard(propagating_);
    for (auto& entry : state_) {
        SetState(entry.first, false);
    }
}

void SelectionController::Restore(const std::vector<PackageId>& ids) {
    for (const auto& id : ids) {
        Select(id);
    }
}

bool SelectionController::IsSelected(const PackageId& id) const {
    auto it = state_.find(id);
    return it != state_.end() && it->second;
}

std::vector<PackageId> SelectionController::SelectedPackages() const {
    std::vector<PackageId> selected;
    for (const auto& [id, is_selected] : state_) {
        if (is_selected) selected.push_back(id);
    }
    return selected;
}

PackageIdSet SelectionController::SelectedSet() const {
    PackageIdSet selected;
    for (const auto& [id, is_selected] : state_) {
        if (is_selected) selected.insert(id);
    }
    return selected;
}

} // namespace graph
} // namespace wsm
