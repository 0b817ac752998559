#pragma once

#include <suture/graph.hpp>
#include <suture/package.hpp>
#include <string>
#include <vector>
#include <unordered_map>

namespace suture {

// String-keyed package graph. Nodes are package descriptors in insertion
// order; an edge A -> B means A depends on B. Built by load_graph().
class DependencyGraph {
public:
    using Inner = Graph<PackageDescriptor>;
    using NodeId = Inner::NodeId;

    // Returns the existing id when a package of that name is already present
    NodeId add_package(PackageDescriptor pkg);

    // Both ends must already be present
    Status add_dependency(const std::string& from, const std::string& to);

    size_t size() const { return graph_.node_count(); }
    size_t edge_count() const { return graph_.edge_count(); }
    bool contains(const std::string& name) const;

    // Precondition: contains(name)
    NodeId id_of(const std::string& name) const { return index_.at(name); }
    const PackageDescriptor& package(const std::string& name) const;
    const PackageDescriptor& package(NodeId id) const { return graph_.node(id); }

    // Package names in insertion order
    std::vector<std::string> names() const;

    // In-graph dependencies of name, declaration order
    std::vector<std::string> dependencies_of(const std::string& name) const;

    bool depends_on(const std::string& dependent,
                    const std::string& dependency) const;

    // Roots are packages nothing else in the graph depends on
    std::vector<std::string> roots() const;

    std::string tree_display(const std::string& root) const;

    const Inner& inner() const { return graph_; }

private:
    Inner graph_;
    std::unordered_map<std::string, NodeId> index_;
};

} // namespace suture
