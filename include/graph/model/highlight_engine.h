#pragma once

#include <core/id_types.h>

#include <map>
#include <optional>

namespace wsm {
namespace graph {

enum class HighlightTag {
    NONE,
    FOCUSED,
    INCOMING, // has a direct edge into the focused node
    OUTGOING  // the focused node has a direct edge into it
};

/*
 * Tags every node relative to the focused one. Without a focus, or with a
 * focus that is not part of `nodes`, every node is NONE. When a node is both
 * a direct predecessor and a direct successor (2-cycle), OUTGOING wins.
 */
std::map<PackageId, HighlightTag> ClassifyNodes(const std::optional<PackageId>& focused,
                                                const PackageIdSet& nodes,
                                                const EdgeSet& edges);

// INCOMING for edges ending at the focus, OUTGOING for edges leaving it.
std::map<Edge, HighlightTag> ClassifyEdges(const std::optional<PackageId>& focused,
                                           const PackageIdSet& nodes,
                                           const EdgeSet& edges);

// Single-focus holder driven by node clicks.
class FocusState {
public:
    // Clicking the focused node again clears the focus; clicking another
    // node moves the focus there.
    void Click(const PackageId& id);
    void Clear() { focused_.reset(); }

    // Drops the focus if its node is no longer displayed.
    void Retain(const PackageIdSet& nodes);

    const std::optional<PackageId>& Focused() const { return focused_; }
    bool IsFocused(const PackageId& id) const { return focused_ && *focused_ == id; }

private:
    std::optional<PackageId> focused_;
};

} // namespace graph
} // namespace wsm
