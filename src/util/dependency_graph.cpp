#include <suture/dependency_graph.hpp>

namespace suture {

static std::string package_name(const PackageDescriptor& pkg) {
    return pkg.name;
}

DependencyGraph::NodeId DependencyGraph::add_package(PackageDescriptor pkg) {
    auto it = index_.find(pkg.name);
    if (it != index_.end()) return it->second;
    std::string name = pkg.name;
    NodeId id = graph_.add_node(std::move(pkg));
    index_.emplace(std::move(name), id);
    return id;
}

Status DependencyGraph::add_dependency(const std::string& from,
                                       const std::string& to) {
    auto f = index_.find(from);
    auto t = index_.find(to);
    if (f == index_.end() || t == index_.end()) {
        const std::string& missing = (f == index_.end()) ? from : to;
        return SutureError{SutureError::GraphBuild,
            "edge " + from + " -> " + to + " references unknown package '"
                + missing + "'"};
    }
    graph_.add_edge(f->second, t->second);
    return ok_status();
}

bool DependencyGraph::contains(const std::string& name) const {
    return index_.count(name) > 0;
}

const PackageDescriptor& DependencyGraph::package(const std::string& name) const {
    return graph_.node(index_.at(name));
}

std::vector<std::string> DependencyGraph::names() const {
    std::vector<std::string> out;
    out.reserve(graph_.node_count());
    for (NodeId id = 0; id < graph_.node_count(); ++id) {
        out.push_back(graph_.node(id).name);
    }
    return out;
}

std::vector<std::string> DependencyGraph::dependencies_of(const std::string& name) const {
    std::vector<std::string> out;
    auto it = index_.find(name);
    if (it == index_.end()) return out;
    for (const auto& e : graph_.successors(it->second)) {
        out.push_back(graph_.node(e.to).name);
    }
    return out;
}

bool DependencyGraph::depends_on(const std::string& dependent,
                                 const std::string& dependency) const {
    auto a = index_.find(dependent);
    auto b = index_.find(dependency);
    if (a == index_.end() || b == index_.end()) return false;
    return graph_.has_edge(a->second, b->second);
}

std::vector<std::string> DependencyGraph::roots() const {
    std::vector<std::string> out;
    for (NodeId id = 0; id < graph_.node_count(); ++id) {
        if (graph_.in_degree(id) == 0) out.push_back(graph_.node(id).name);
    }
    return out;
}

std::string DependencyGraph::tree_display(const std::string& root) const {
    auto it = index_.find(root);
    if (it == index_.end()) return "";
    return graph_.tree_display(it->second, package_name);
}

} // namespace suture
