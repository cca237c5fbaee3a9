#include <graph/model/highlight_engine.h>

namespace wsm {
namespace graph {

namespace {

bool HasFocus(const std::optional<PackageId>& focused, const PackageIdSet& nodes) {
    return focused.has_value() && nodes.find(*focused) != nodes.end();
}

} // anonymous namespace

std::map<PackageId, HighlightTag> ClassifyNodes(const std::optional<PackageId>& focused,
                                                const PackageIdSet& nodes,
                                                const EdgeSet& edges) {
    std::map<PackageId, HighlightTag> tags;
    for (const auto& node : nodes) {
        tags.emplace(node, HighlightTag::NONE);
    }
    if (!HasFocus(focused, nodes)) {
        return tags;
    }

    const PackageId& focus = *focused;
    PackageIdSet incoming;
    PackageIdSet outgoing;
    for (const auto& [src, dst] : edges) {
        if (dst == focus && src != focus) incoming.insert(src);
        if (src == focus && dst != focus) outgoing.insert(dst);
    }

    for (auto& [node, tag] : tags) {
        if (node == focus) {
            tag = HighlightTag::FOCUSED;
        } else if (outgoing.count(node)) {
            tag = HighlightTag::OUTGOING;
        } else if (incoming.count(node)) {
            tag = HighlightTag::INCOMING;
        }
    }
    return tags;
}

std::map<Edge, HighlightTag> ClassifyEdges(const std::optional<PackageId>& focused,
                                           const PackageIdSet& nodes,
                                           const EdgeSet& edges) {
    std::map<Edge, HighlightTag> tags;
    const bool has_focus = HasFocus(focused, nodes);
    for (const auto& edge : edges) {
        HighlightTag tag = HighlightTag::NONE;
        if (has_focus) {
            if (edge.first == *focused) {
                tag = HighlightTag::OUTGOING;
            } else if (edge.second == *focused) {
                tag = HighlightTag::INCOMING;
            }
        }
        tags.emplace(edge, tag);
    }
    return tags;
}

void FocusState::Click(const PackageId& id) {
    if (IsFocused(id)) {
        focused_.reset();
    } else {
        focused_ = id;
    }
}

void FocusState::Retain(const PackageIdSet& nodes) {
    if (focused_ && nodes.find(*focused_) == nodes.end()) {
        focused_.reset();
    }
}

} // namespace graph
} // namespace wsm
