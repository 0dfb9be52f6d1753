#ifndef TOKENFLOW_MODULES_COMPILER_EXECUTABLE_DIAGRAM_H
#define TOKENFLOW_MODULES_COMPILER_EXECUTABLE_DIAGRAM_H

#include "core/types/node.h"
#include "core/types/edge.h"
#include "core/types/diagnostic.h"
#include <cstddef>
#include <map>
#include <optional>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

namespace tokenflow {

using EdgeIndex = std::size_t;
using PortIndex = std::map<PortName, std::vector<EdgeIndex>>;

// One per loop-back edge
struct LoopInfo {
    EdgeIndex back_edge = 0;
    NodeId head; // target of the loop-back edge
    NodeId tail; // source of the loop-back edge
    std::vector<NodeId> members; // base-DAG path head..tail inclusive, topological order

    bool contains(const NodeId& id) const;
    bool operator==(const LoopInfo&) const = default;
};

// Compiler output. Immutable once built; shared read-only by every run.
class ExecutableDiagram {
public:
    ExecutableDiagram(std::vector<Node> nodes,
                      std::vector<ExecutableEdge> edges,
                      std::vector<NodeId> topological_order,
                      std::vector<LoopInfo> loops,
                      Diagnostics diagnostics);

    bool has_node(const NodeId& id) const { return node_index_.count(id) > 0; }
    const Node& node(const NodeId& id) const;
    const std::vector<Node>& nodes() const { return nodes_; }
    const std::vector<NodeId>& topological_order() const { return topological_order_; }

    const std::vector<ExecutableEdge>& edges() const { return edges_; }
    const ExecutableEdge& edge(EdgeIndex index) const { return edges_.at(index); }
    std::optional<EdgeIndex> find_edge(const Edge& edge) const;

    const std::vector<EdgeIndex>& outgoing(const NodeId& id) const;
    const std::vector<EdgeIndex>& incoming(const NodeId& id) const;
    const PortIndex& outgoing_by_port(const NodeId& id) const;
    const PortIndex& incoming_by_port(const NodeId& id) const;

    const std::vector<LoopInfo>& loops() const { return loops_; }
    const LoopInfo* loop_for_edge(EdgeIndex index) const;
    std::vector<const LoopInfo*> loops_containing(const NodeId& id) const;

    const NodeId& start_node() const { return start_node_; }
    std::vector<NodeId> endpoints() const;

    const Diagnostics& diagnostics() const { return diagnostics_; }

    nlohmann::json to_json() const;

    // Same nodes, edges, policies and loops (diagnostics are not compared)
    bool structurally_equal(const ExecutableDiagram& other) const;

private:
    std::vector<Node> nodes_;
    std::vector<ExecutableEdge> edges_;
    std::vector<NodeId> topological_order_;
    std::vector<LoopInfo> loops_;
    Diagnostics diagnostics_;
    NodeId start_node_;

    std::unordered_map<NodeId, std::size_t> node_index_;
    std::unordered_map<Edge, EdgeIndex> edge_index_;
    std::unordered_map<NodeId, std::vector<EdgeIndex>> outgoing_;
    std::unordered_map<NodeId, std::vector<EdgeIndex>> incoming_;
    std::unordered_map<NodeId, PortIndex> outgoing_by_port_;
    std::unordered_map<NodeId, PortIndex> incoming_by_port_;
};

} // namespace tokenflow

#endif // TOKENFLOW_MODULES_COMPILER_EXECUTABLE_DIAGRAM_H
