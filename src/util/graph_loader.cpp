#include <suture/graph_loader.hpp>
#include <suture/log.hpp>
#include <unordered_map>
#include <unordered_set>

namespace suture {

const char* whitelist_mode_name(WhitelistMode mode) {
    switch (mode) {
        case WhitelistMode::Closure: return "closure";
        case WhitelistMode::Strict:  return "strict";
    }
    return "unknown";
}

std::optional<WhitelistMode> parse_whitelist_mode(const std::string& name) {
    if (name == "closure") return WhitelistMode::Closure;
    if (name == "strict") return WhitelistMode::Strict;
    return std::nullopt;
}

static Result<DependencyGraph> build_full_graph(
    const std::vector<PackageDescriptor>& installed)
{
    DependencyGraph graph;
    std::unordered_set<std::string> seen;

    for (const auto& pkg : installed) {
        if (pkg.name.empty()) {
            return SutureError{SutureError::InvalidArg,
                "installed package with an empty name"};
        }
        if (!seen.insert(pkg.name).second) {
            return SutureError{SutureError::Duplicate,
                "package '" + pkg.name + "' is installed more than once"};
        }
        graph.add_package(pkg);
    }

    for (const auto& pkg : installed) {
        for (const auto& dep : pkg.dependencies) {
            if (!graph.contains(dep)) {
                return SutureError{SutureError::GraphBuild,
                    "package '" + pkg.name + "' depends on '" + dep
                        + "', which is not installed",
                    "install '" + dep + "' or remove it from the dependencies of '"
                        + pkg.name + "'"};
            }
            SUTURE_TRY(graph.add_dependency(pkg.name, dep));
        }
    }

    return Result<DependencyGraph>::ok(std::move(graph));
}

// Copy the nodes selected by keep, in id order, and the edges between them.
static Result<DependencyGraph> filter_graph(const DependencyGraph& full,
                                            const std::vector<bool>& keep) {
    DependencyGraph out;
    const auto& inner = full.inner();

    for (DependencyGraph::NodeId id = 0; id < inner.node_count(); ++id) {
        if (keep[id]) out.add_package(inner.node(id));
    }
    for (DependencyGraph::NodeId id = 0; id < inner.node_count(); ++id) {
        if (!keep[id]) continue;
        for (const auto& e : inner.successors(id)) {
            if (!keep[e.to]) continue;
            SUTURE_TRY(out.add_dependency(inner.node(id).name,
                                          inner.node(e.to).name));
        }
    }
    return Result<DependencyGraph>::ok(std::move(out));
}

Result<DependencyGraph> load_graph(
    const std::vector<PackageDescriptor>& installed,
    const std::optional<std::vector<std::string>>& whitelist,
    WhitelistMode mode)
{
    auto full = build_full_graph(installed);
    if (full.is_err()) return full;

    if (!whitelist.has_value() || whitelist->empty()) {
        log::debug("dependency graph: %zu packages, %zu edges",
                   full.value().size(), full.value().edge_count());
        return full;
    }

    const DependencyGraph& graph = full.value();
    std::vector<DependencyGraph::NodeId> roots;
    for (const auto& name : *whitelist) {
        if (!graph.contains(name)) {
            log::warn("whitelisted package '%s' is not installed; ignoring",
                      name.c_str());
            continue;
        }
        roots.push_back(graph.id_of(name));
    }

    std::vector<bool> keep;
    if (mode == WhitelistMode::Closure) {
        keep = graph.inner().reachable_from(roots);
    } else {
        keep.assign(graph.size(), false);
        for (auto id : roots) keep[id] = true;
    }

    auto filtered = filter_graph(graph, keep);
    if (filtered.is_ok()) {
        log::debug("whitelist (%s) kept %zu of %zu packages",
                   whitelist_mode_name(mode), filtered.value().size(),
                   graph.size());
    }
    return filtered;
}

} // namespace suture
