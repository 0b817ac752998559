#pragma once

#include <suture/dependency_graph.hpp>
#include <suture/package.hpp>
#include <optional>
#include <string>
#include <vector>

namespace suture {

enum class WhitelistMode {
    // Whitelisted packages plus everything they transitively require
    Closure,
    // Only whitelisted packages; edges leaving the whitelist are dropped
    Strict
};

const char* whitelist_mode_name(WhitelistMode mode);
std::optional<WhitelistMode> parse_whitelist_mode(const std::string& name);

// Build the dependency graph of an installed package set.
//
// Errors:
//   InvalidArg  a package has an empty name
//   Duplicate   two packages share a name
//   GraphBuild  a declared dependency is not installed
//
// An absent or empty whitelist keeps every package. Whitelist entries that
// are not installed are logged and ignored. Nodes keep installed order.
Result<DependencyGraph> load_graph(
    const std::vector<PackageDescriptor>& installed,
    const std::optional<std::vector<std::string>>& whitelist = std::nullopt,
    WhitelistMode mode = WhitelistMode::Closure);

} // namespace suture
