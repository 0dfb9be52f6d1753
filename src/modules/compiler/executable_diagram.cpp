#include "modules/compiler/executable_diagram.h"
#include <algorithm>
#include <stdexcept>

namespace tokenflow {

namespace {

const std::vector<EdgeIndex> kNoEdges;
const PortIndex kNoPorts;

nlohmann::json policy_json(const Node& node) {
    nlohmann::json j;
    j["join_policy"] = to_string(node.join_policy);
    j["concurrency"] = to_string(node.concurrency_policy);
    return j;
}

} // namespace

bool LoopInfo::contains(const NodeId& id) const {
    return std::find(members.begin(), members.end(), id) != members.end();
}

ExecutableDiagram::ExecutableDiagram(std::vector<Node> nodes,
                                     std::vector<ExecutableEdge> edges,
                                     std::vector<NodeId> topological_order,
                                     std::vector<LoopInfo> loops,
                                     Diagnostics diagnostics)
    : nodes_(std::move(nodes)),
      edges_(std::move(edges)),
      topological_order_(std::move(topological_order)),
      loops_(std::move(loops)),
      diagnostics_(std::move(diagnostics)) {
    for (std::size_t i = 0; i < nodes_.size(); ++i) {
        node_index_[nodes_[i].id] = i;
        if (nodes_[i].type == NodeType::START) start_node_ = nodes_[i].id;
    }
    for (EdgeIndex i = 0; i < edges_.size(); ++i) {
        const Edge& e = edges_[i].edge;
        if (!has_node(e.source) || !has_node(e.target)) {
            throw std::invalid_argument("Edge references unknown node: " + to_string(e));
        }
        edge_index_[e] = i;
        outgoing_[e.source].push_back(i);
        incoming_[e.target].push_back(i);
        outgoing_by_port_[e.source][e.source_port].push_back(i);
        incoming_by_port_[e.target][e.target_port].push_back(i);
    }
}

const Node& ExecutableDiagram::node(const NodeId& id) const {
    auto it = node_index_.find(id);
    if (it == node_index_.end()) {
        throw std::out_of_range("Unknown node: " + id);
    }
    return nodes_[it->second];
}

std::optional<EdgeIndex> ExecutableDiagram::find_edge(const Edge& edge) const {
    auto it = edge_index_.find(edge);
    if (it == edge_index_.end()) return std::nullopt;
    return it->second;
}

const std::vector<EdgeIndex>& ExecutableDiagram::outgoing(const NodeId& id) const {
    auto it = outgoing_.find(id);
    return it == outgoing_.end() ? kNoEdges : it->second;
}

const std::vector<EdgeIndex>& ExecutableDiagram::incoming(const NodeId& id) const {
    auto it = incoming_.find(id);
    return it == incoming_.end() ? kNoEdges : it->second;
}

const PortIndex& ExecutableDiagram::outgoing_by_port(const NodeId& id) const {
    auto it = outgoing_by_port_.find(id);
    return it == outgoing_by_port_.end() ? kNoPorts : it->second;
}

const PortIndex& ExecutableDiagram::incoming_by_port(const NodeId& id) const {
    auto it = incoming_by_port_.find(id);
    return it == incoming_by_port_.end() ? kNoPorts : it->second;
}

const LoopInfo* ExecutableDiagram::loop_for_edge(EdgeIndex index) const {
    for (const auto& loop : loops_) {
        if (loop.back_edge == index) return &loop;
    }
    return nullptr;
}

std::vector<const LoopInfo*> ExecutableDiagram::loops_containing(const NodeId& id) const {
    std::vector<const LoopInfo*> result;
    for (const auto& loop : loops_) {
        if (loop.contains(id)) result.push_back(&loop);
    }
    return result;
}

std::vector<NodeId> ExecutableDiagram::endpoints() const {
    std::vector<NodeId> result;
    for (const auto& n : nodes_) {
        if (n.type == NodeType::ENDPOINT) result.push_back(n.id);
    }
    return result;
}

nlohmann::json ExecutableDiagram::to_json() const {
    nlohmann::json j;
    j["start"] = start_node_;
    j["nodes"] = nlohmann::json::array();
    for (const auto& n : nodes_) {
        nlohmann::json jn = policy_json(n);
        jn["id"] = n.id;
        jn["type"] = to_string(n.type);
        jn["label"] = n.label;
        jn["inputs"] = n.inputs;
        jn["outputs"] = n.outputs;
        jn["config"] = n.config;
        if (n.max_iteration) jn["max_iteration"] = *n.max_iteration;
        if (n.timeout_ms) jn["timeout_ms"] = *n.timeout_ms;
        j["nodes"].push_back(std::move(jn));
    }
    j["edges"] = nlohmann::json::array();
    for (const auto& e : edges_) {
        j["edges"].push_back({
            {"id", e.id},
            {"source", e.edge.source},
            {"source_port", e.edge.source_port},
            {"target", e.edge.target},
            {"target_port", e.edge.target_port},
            {"loop_back", e.loop_back},
            {"skippable", e.skippable},
            {"transform", e.transform}
        });
    }
    j["topological_order"] = topological_order_;
    j["loops"] = nlohmann::json::array();
    for (const auto& loop : loops_) {
        j["loops"].push_back({
            {"edge", edges_[loop.back_edge].id},
            {"head", loop.head},
            {"tail", loop.tail},
            {"members", loop.members}
        });
    }
    j["diagnostics"] = nlohmann::json::array();
    for (const auto& d : diagnostics_) {
        j["diagnostics"].push_back(tokenflow::to_json(d));
    }
    return j;
}

bool ExecutableDiagram::structurally_equal(const ExecutableDiagram& other) const {
    return nodes_ == other.nodes_ &&
           edges_ == other.edges_ &&
           topological_order_ == other.topological_order_ &&
           loops_ == other.loops_;
}

} // namespace tokenflow
