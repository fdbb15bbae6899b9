#pragma once

/// @file service_graph.h
/// @brief Immutable directed service call graph of one snapshot
///
/// Edges point from caller to callee. Cycles are allowed; every traversal
/// is guarded by a visited set and a depth bound. All queries are const
/// and safe to call concurrently.

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "snapshot/types.h"

namespace skyrca::graph {

/// @brief Size of a service graph
struct GraphStats {
    size_t nodes = 0;
    size_t edges = 0;
};

/// @brief Reached service id -> hop distance from the start service
using HopMap = std::map<std::string, size_t>;

/// @brief Directed service call graph
class ServiceGraph {
public:
    /// @brief Build a graph from nodes and call edges
    ///
    /// Duplicate node ids keep the first occurrence. Edge endpoints are
    /// resolved by id, then by name. Unresolvable endpoints and self-calls
    /// drop the edge with a warning; duplicate edges merge.
    static ServiceGraph Build(const std::vector<snapshot::ServiceNode>& nodes,
                              const std::vector<snapshot::CallEdge>& edges);

    /// @brief Build a graph from a snapshot topology
    static ServiceGraph FromTopology(const snapshot::Topology& topology);

    ServiceGraph() = default;

    bool HasNode(std::string_view id) const;

    /// @brief Look up a node by id
    /// @return Pointer into the graph, or nullptr when absent
    const snapshot::ServiceNode* FindNode(std::string_view id) const;

    /// @brief Resolve a service reference to a node id
    /// @param id_or_name Node id, or node name as reported by some collectors
    std::optional<std::string> ResolveId(std::string_view id_or_name) const;

    /// @brief Immediate callers of a service, sorted by id
    std::vector<std::string> Upstream(std::string_view id) const;

    /// @brief Immediate callees of a service, sorted by id
    std::vector<std::string> Downstream(std::string_view id) const;

    /// @brief Number of distinct immediate callers
    size_t FanIn(std::string_view id) const;

    /// @brief Number of distinct immediate callees
    size_t FanOut(std::string_view id) const;

    /// @brief Services that transitively call @p id, within @p max_depth hops
    ///
    /// Breadth-first against edge direction; each service is reported once
    /// with its shortest hop distance. The start service is never included,
    /// even when it sits on a cycle.
    HopMap ReachableUpstream(std::string_view id, size_t max_depth) const;

    /// @brief Services transitively called by @p id, within @p max_depth hops
    HopMap ReachableDownstream(std::string_view id, size_t max_depth) const;

    size_t NodeCount() const { return nodes_.size(); }
    size_t EdgeCount() const { return edge_count_; }

    /// @brief All node ids, sorted
    std::vector<std::string> NodeIds() const;

    GraphStats Stats() const { return GraphStats{NodeCount(), EdgeCount()}; }

    /// @brief Problems recovered from while building the graph
    const std::vector<std::string>& Warnings() const { return warnings_; }

private:
    using Adjacency = std::map<std::string, std::set<std::string>, std::less<>>;

    HopMap Traverse(std::string_view id, size_t max_depth, const Adjacency& adjacency) const;

    std::map<std::string, snapshot::ServiceNode, std::less<>> nodes_;
    std::map<std::string, std::string, std::less<>> name_index_;
    Adjacency callers_;
    Adjacency callees_;
    size_t edge_count_ = 0;
    std::vector<std::string> warnings_;
};

}  // namespace skyrca::graph
