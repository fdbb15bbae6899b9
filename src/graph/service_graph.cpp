/// @file service_graph.cpp
/// @brief Service call graph implementation

#include "graph/service_graph.h"

#include <deque>
#include <utility>

#include <absl/strings/str_cat.h>

#include "common/logging.h"

namespace skyrca::graph {

ServiceGraph ServiceGraph::Build(const std::vector<snapshot::ServiceNode>& nodes,
                                 const std::vector<snapshot::CallEdge>& edges) {
    ServiceGraph graph;

    for (const auto& node : nodes) {
        auto [it, inserted] = graph.nodes_.emplace(node.id, node);
        if (!inserted) {
            graph.warnings_.push_back(
                absl::StrCat("Duplicate service node '", node.id, "' dropped"));
            continue;
        }
        if (!node.name.empty()) {
            graph.name_index_.emplace(node.name, node.id);
        }
        graph.callers_[node.id];
        graph.callees_[node.id];
    }

    for (const auto& edge : edges) {
        auto source = graph.ResolveId(edge.source);
        auto target = graph.ResolveId(edge.target);
        if (!source || !target) {
            graph.warnings_.push_back(absl::StrCat(
                "Call ", edge.source, " -> ", edge.target, " dropped: unknown ",
                source ? "target" : "source"));
            continue;
        }
        if (*source == *target) {
            graph.warnings_.push_back(
                absl::StrCat("Self-call on '", *source, "' dropped"));
            continue;
        }
        if (graph.callees_[*source].insert(*target).second) {
            graph.callers_[*target].insert(*source);
            ++graph.edge_count_;
        }
    }

    for (const auto& warning : graph.warnings_) {
        SKYRCA_LOG_WARN("Service graph: {}", warning);
    }
    SKYRCA_LOG_DEBUG("Service graph built with {} nodes and {} edges",
                     graph.NodeCount(), graph.EdgeCount());

    return graph;
}

ServiceGraph ServiceGraph::FromTopology(const snapshot::Topology& topology) {
    return Build(topology.nodes, topology.calls);
}

bool ServiceGraph::HasNode(std::string_view id) const {
    return nodes_.find(id) != nodes_.end();
}

const snapshot::ServiceNode* ServiceGraph::FindNode(std::string_view id) const {
    auto it = nodes_.find(id);
    return it == nodes_.end() ? nullptr : &it->second;
}

std::optional<std::string> ServiceGraph::ResolveId(std::string_view id_or_name) const {
    if (auto it = nodes_.find(id_or_name); it != nodes_.end()) {
        return it->first;
    }
    if (auto it = name_index_.find(id_or_name); it != name_index_.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::vector<std::string> ServiceGraph::Upstream(std::string_view id) const {
    auto it = callers_.find(id);
    if (it == callers_.end()) {
        return {};
    }
    return std::vector<std::string>(it->second.begin(), it->second.end());
}

std::vector<std::string> ServiceGraph::Downstream(std::string_view id) const {
    auto it = callees_.find(id);
    if (it == callees_.end()) {
        return {};
    }
    return std::vector<std::string>(it->second.begin(), it->second.end());
}

size_t ServiceGraph::FanIn(std::string_view id) const {
    auto it = callers_.find(id);
    return it == callers_.end() ? 0 : it->second.size();
}

size_t ServiceGraph::FanOut(std::string_view id) const {
    auto it = callees_.find(id);
    return it == callees_.end() ? 0 : it->second.size();
}

HopMap ServiceGraph::ReachableUpstream(std::string_view id, size_t max_depth) const {
    return Traverse(id, max_depth, callers_);
}

HopMap ServiceGraph::ReachableDownstream(std::string_view id, size_t max_depth) const {
    return Traverse(id, max_depth, callees_);
}

HopMap ServiceGraph::Traverse(std::string_view id, size_t max_depth,
                              const Adjacency& adjacency) const {
    HopMap reached;
    if (!HasNode(id) || max_depth == 0) {
        return reached;
    }

    std::set<std::string, std::less<>> visited;
    visited.emplace(id);

    std::deque<std::pair<std::string, size_t>> queue;
    queue.emplace_back(std::string(id), 0);

    while (!queue.empty()) {
        auto [current, depth] = std::move(queue.front());
        queue.pop_front();
        if (depth >= max_depth) {
            continue;
        }

        auto it = adjacency.find(current);
        if (it == adjacency.end()) {
            continue;
        }
        for (const auto& next : it->second) {
            if (!visited.insert(next).second) {
                continue;
            }
            reached.emplace(next, depth + 1);
            queue.emplace_back(next, depth + 1);
        }
    }

    return reached;
}

std::vector<std::string> ServiceGraph::NodeIds() const {
    std::vector<std::string> ids;
    ids.reserve(nodes_.size());
    for (const auto& [id, node] : nodes_) {
        ids.push_back(id);
    }
    return ids;
}

}  // namespace skyrca::graph
