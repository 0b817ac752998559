#pragma once

#include <suture/result.hpp>
#include <string>
#include <vector>
#include <queue>
#include <algorithm>
#include <functional>
#include <sstream>
#include <unordered_set>
#include <cstdint>

namespace suture {

// ---------------------------------------------------------------------------
// Graph<NodeData, EdgeData> — directed graph with adjacency list
//
// An edge from -> to reads "from depends on to". Node ids are dense and
// assigned in insertion order; successor lists keep insertion order too.
// Every traversal below is driven by those two orders, never by hashing.
// ---------------------------------------------------------------------------

template<typename NodeData, typename EdgeData = std::monostate>
class Graph {
public:
    using NodeId = size_t;
    using Describe = std::function<std::string(const NodeData&)>;

    struct Edge {
        NodeId from;
        NodeId to;
        EdgeData data;
    };

    NodeId add_node(NodeData data) {
        NodeId id = nodes_.size();
        nodes_.push_back(std::move(data));
        adj_.push_back({});
        radj_.push_back({});
        return id;
    }

    // Parallel edges are collapsed: adding an existing edge is a no-op.
    void add_edge(NodeId from, NodeId to, EdgeData data = {}) {
        if (has_edge(from, to)) return;
        adj_[from].push_back({from, to, std::move(data)});
        radj_[to].push_back(from);
    }

    bool has_edge(NodeId from, NodeId to) const {
        for (const auto& e : adj_[from]) {
            if (e.to == to) return true;
        }
        return false;
    }

    size_t node_count() const { return nodes_.size(); }

    size_t edge_count() const {
        size_t total = 0;
        for (const auto& edges : adj_) total += edges.size();
        return total;
    }

    const NodeData& node(NodeId id) const { return nodes_[id]; }
    NodeData& node(NodeId id) { return nodes_[id]; }

    const std::vector<Edge>& successors(NodeId id) const { return adj_[id]; }
    const std::vector<NodeId>& predecessors(NodeId id) const { return radj_[id]; }

    size_t in_degree(NodeId id) const { return radj_[id].size(); }
    size_t out_degree(NodeId id) const { return adj_[id].size(); }

    // Dependencies-first topological order by depth-first post-order.
    // Roots are tried in id order and successors in insertion order, so the
    // result is fully determined by construction order. Each node appears
    // exactly once. A back edge yields a Cycle error; when describe is
    // given, the message spells out the cycle ("a -> b -> a").
    Result<std::vector<NodeId>> topological_sort(const Describe& describe = {}) const {
        enum Mark : uint8_t { Unvisited, Active, Done };

        size_t n = nodes_.size();
        std::vector<Mark> mark(n, Unvisited);
        std::vector<NodeId> order;
        order.reserve(n);

        // (node, index of the next successor to visit)
        std::vector<std::pair<NodeId, size_t>> stack;

        for (NodeId root = 0; root < n; ++root) {
            if (mark[root] != Unvisited) continue;
            mark[root] = Active;
            stack.push_back({root, 0});

            while (!stack.empty()) {
                NodeId u = stack.back().first;
                size_t next = stack.back().second;

                if (next == adj_[u].size()) {
                    mark[u] = Done;
                    order.push_back(u);
                    stack.pop_back();
                    continue;
                }

                stack.back().second = next + 1;
                NodeId v = adj_[u][next].to;
                if (mark[v] == Active) {
                    return cycle_error(stack, v, describe);
                }
                if (mark[v] == Unvisited) {
                    mark[v] = Active;
                    stack.push_back({v, 0});
                }
            }
        }

        return Result<std::vector<NodeId>>::ok(std::move(order));
    }

    // Membership mask of every node reachable from roots (roots included).
    std::vector<bool> reachable_from(const std::vector<NodeId>& roots) const {
        std::vector<bool> seen(nodes_.size(), false);
        std::queue<NodeId> bfs;
        for (NodeId r : roots) {
            if (!seen[r]) {
                seen[r] = true;
                bfs.push(r);
            }
        }
        while (!bfs.empty()) {
            NodeId u = bfs.front();
            bfs.pop();
            for (const auto& e : adj_[u]) {
                if (!seen[e.to]) {
                    seen[e.to] = true;
                    bfs.push(e.to);
                }
            }
        }
        return seen;
    }

    // Tree display: format the dependency tree below root as a string.
    // Nodes already printed are marked "(*)" and not expanded again.
    std::string tree_display(NodeId root, const Describe& describe) const {
        std::ostringstream out;
        std::unordered_set<NodeId> visited;
        tree_display_impl(root, "", true, visited, describe, out);
        return out.str();
    }

private:
    std::vector<NodeData> nodes_;
    std::vector<std::vector<Edge>> adj_;
    std::vector<std::vector<NodeId>> radj_;

    SutureError cycle_error(const std::vector<std::pair<NodeId, size_t>>& stack,
                            NodeId closing,
                            const Describe& describe) const {
        if (!describe) {
            return SutureError{SutureError::Cycle, "graph contains a cycle"};
        }

        auto start = std::find_if(stack.begin(), stack.end(),
            [closing](const std::pair<NodeId, size_t>& frame) {
                return frame.first == closing;
            });

        std::string path;
        for (auto it = start; it != stack.end(); ++it) {
            path += describe(nodes_[it->first]);
            path += " -> ";
        }
        path += describe(nodes_[closing]);

        return SutureError{SutureError::Cycle,
            "dependency cycle: " + path,
            "break the cycle by removing one of the dependencies listed"};
    }

    void tree_display_impl(
        NodeId u,
        const std::string& prefix,
        bool is_last,
        std::unordered_set<NodeId>& visited,
        const Describe& describe,
        std::ostringstream& out) const
    {
        out << prefix;
        if (!prefix.empty()) {
            out << (is_last ? "└── " : "├── ");
        }
        out << describe(nodes_[u]);

        if (!visited.insert(u).second) {
            out << " (*)\n";
            return;
        }
        out << "\n";

        const auto& edges = adj_[u];
        for (size_t i = 0; i < edges.size(); ++i) {
            std::string child_prefix = prefix;
            if (!prefix.empty()) {
                child_prefix += (is_last ? "    " : "│   ");
            } else {
                child_prefix = " ";
            }
            tree_display_impl(edges[i].to, child_prefix,
                              i == edges.size() - 1,
                              visited, describe, out);
        }
    }
};

} // namespace suture
