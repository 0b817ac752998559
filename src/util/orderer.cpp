#include <suture/orderer.hpp>
#include <suture/log.hpp>
#include <unordered_map>

namespace suture {

Result<std::vector<std::string>> topological_order(const DependencyGraph& graph) {
    const auto& inner = graph.inner();
    auto ids = inner.topological_sort(
        [](const PackageDescriptor& pkg) { return pkg.name; });
    if (ids.is_err()) return std::move(ids).error();

    std::vector<std::string> order;
    order.reserve(ids.value().size());
    for (auto id : ids.value()) {
        order.push_back(inner.node(id).name);
    }

    log::debug("ordered %zu packages", order.size());
    return Result<std::vector<std::string>>::ok(std::move(order));
}

Status verify_order(const DependencyGraph& graph,
                    const std::vector<std::string>& order) {
    std::unordered_map<std::string, size_t> position;
    for (size_t i = 0; i < order.size(); ++i) {
        if (!graph.contains(order[i])) {
            return SutureError{SutureError::NotFound,
                "ordered package '" + order[i] + "' is not in the graph"};
        }
        if (!position.emplace(order[i], i).second) {
            return SutureError{SutureError::Duplicate,
                "package '" + order[i] + "' appears more than once"};
        }
    }

    for (const auto& name : graph.names()) {
        if (!position.count(name)) {
            return SutureError{SutureError::NotFound,
                "package '" + name + "' is missing from the order"};
        }
        for (const auto& dep : graph.dependencies_of(name)) {
            if (position[dep] >= position[name]) {
                return SutureError{SutureError::Cycle,
                    "'" + dep + "' must precede its dependent '" + name + "'"};
            }
        }
    }

    return ok_status();
}

} // namespace suture
