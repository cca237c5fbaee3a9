#pragma once

#include <set>
#include <string>
#include <utility>

namespace wsm {

// Package identifiers are the <name> declared in package.xml.
using PackageId = std::string;
using PackageIdSet = std::set<PackageId>;

// Forward edge: first depends on second.
using Edge = std::pair<PackageId, PackageId>;
using EdgeSet = std::set<Edge>;

} // namespace wsm
