#include "modules/compiler/diagram_compiler.h"
#include "modules/rules/connection_rules.h"
#include "core/types/errors.h"
#include "common/logging/logger.h"
#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <functional>
#include <limits>
#include <queue>
#include <set>
#include <unordered_map>
#include <unordered_set>

namespace tokenflow {

struct CompilationContext {
    explicit CompilationContext(const GraphDescription& g) : graph(g) {}

    const GraphDescription& graph;
    Diagnostics diagnostics;

    // validation
    std::unordered_map<NodeId, std::size_t> raw_node_index; // first occurrence only
    std::unordered_map<NodeId, NodeType> node_types;
    std::unordered_map<std::string, NodeId> label_index;
    std::unordered_map<std::string, const RawHandle*> handle_index;
    std::unordered_set<std::size_t> invalid_nodes;
    std::unordered_set<std::size_t> invalid_connections;

    // transformation
    std::vector<Node> nodes;
    std::unordered_map<NodeId, std::size_t> node_pos;
    std::unordered_set<NodeId> explicit_join;
    std::unordered_set<NodeId> explicit_concurrency;

    // resolution
    struct ResolvedConnection {
        std::size_t raw_index;
        std::string id;
        Edge edge;
    };
    std::vector<ResolvedConnection> resolved;

    // edge building / optimization
    std::vector<ExecutableEdge> edges;
    std::vector<NodeId> topological_order;
    std::vector<LoopInfo> loops;

    std::shared_ptr<const ExecutableDiagram> diagram;

    void report(DiagnosticPhase phase, Severity severity, std::string message,
                std::optional<NodeId> node = std::nullopt,
                std::optional<std::string> edge = std::nullopt) {
        diagnostics.push_back({phase, severity, std::move(message), std::move(node), std::move(edge)});
    }

    bool has_node(const NodeId& id) const { return node_pos.count(id) > 0; }
    Node& node(const NodeId& id) { return nodes[node_pos.at(id)]; }
};

namespace {

struct EndpointRef {
    NodeId node;
    std::optional<PortName> port;
};

// Integer that fits in an int; nullopt for anything else
std::optional<int> as_int(const nlohmann::json& v) {
    if (v.is_number_unsigned()) {
        const auto n = v.get<std::uint64_t>();
        if (n > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) return std::nullopt;
        return static_cast<int>(n);
    }
    if (!v.is_number_integer()) return std::nullopt;
    const auto n = v.get<std::int64_t>();
    if (n < std::numeric_limits<int>::min() || n > std::numeric_limits<int>::max()) return std::nullopt;
    return static_cast<int>(n);
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string connection_id(const RawConnection& c, std::size_t index) {
    if (c.id && !c.id->empty()) return *c.id;
    return "connection_" + std::to_string(index);
}

std::optional<NodeId> find_node(const CompilationContext& ctx, const std::string& ref) {
    if (ctx.raw_node_index.count(ref)) return ref;
    auto it = ctx.label_index.find(ref);
    if (it != ctx.label_index.end()) return it->second;
    return std::nullopt;
}

// handle id -> node id -> node label -> "node:port"
std::optional<EndpointRef> resolve_reference(const CompilationContext& ctx, const std::string& ref) {
    if (auto h = ctx.handle_index.find(ref); h != ctx.handle_index.end()) {
        const RawHandle& handle = *h->second;
        if (!ctx.raw_node_index.count(handle.node_id)) return std::nullopt;
        EndpointRef result{handle.node_id, std::nullopt};
        if (!handle.label.empty()) result.port = handle.label;
        return result;
    }
    if (auto id = find_node(ctx, ref)) {
        return EndpointRef{*id, std::nullopt};
    }
    const auto colon = ref.rfind(':');
    if (colon != std::string::npos && colon > 0 && colon + 1 < ref.size()) {
        if (auto id = find_node(ctx, ref.substr(0, colon))) {
            return EndpointRef{*id, ref.substr(colon + 1)};
        }
    }
    return std::nullopt;
}

PortName source_port_of(const RawConnection& c, const EndpointRef& ref) {
    if (c.source_port && !c.source_port->empty()) return *c.source_port;
    if (ref.port) return *ref.port;
    return std::string(kDefaultPort);
}

PortName target_port_of(const RawConnection& c, const EndpointRef& ref) {
    if (c.target_port && !c.target_port->empty()) return *c.target_port;
    if (ref.port) return *ref.port;
    if (c.label && !c.label->empty()) return *c.label;
    return std::string(kDefaultPort);
}

// "kind[:n]" or {"kind": ..., <count_key>: n}
bool split_policy(const nlohmann::json& v, const char* count_key, std::string& kind,
                  std::optional<int>& count, std::string& error) {
    if (v.is_string()) {
        const std::string s = v.get<std::string>();
        const auto colon = s.find(':');
        kind = lower(s.substr(0, colon));
        if (colon != std::string::npos) {
            try {
                count = std::stoi(s.substr(colon + 1));
            } catch (const std::exception&) {
                error = "Invalid count in policy '" + s + "'";
                return false;
            }
        }
        return true;
    }
    if (v.is_object()) {
        if (!v.contains("kind") || !v.at("kind").is_string()) {
            error = "Policy object requires a string 'kind'";
            return false;
        }
        kind = lower(v.at("kind").get<std::string>());
        if (v.contains(count_key)) {
            count = as_int(v.at(count_key));
            if (!count) {
                error = std::string("Policy field '") + count_key + "' must be an integer";
                return false;
            }
        }
        return true;
    }
    error = "Policy must be a string or an object, got " + v.dump();
    return false;
}

std::optional<JoinPolicy> parse_join_policy(const nlohmann::json& v, std::string& error) {
    std::string kind;
    std::optional<int> k;
    if (!split_policy(v, "k", kind, k, error)) return std::nullopt;
    if (kind == "all") return JoinPolicy::all();
    if (kind == "any") return JoinPolicy::any();
    if (kind == "k_of_n") return JoinPolicy::k_of_n(k.value_or(0)); // range checked at assembly
    error = "Unknown join policy '" + kind + "'";
    return std::nullopt;
}

std::optional<ConcurrencyPolicy> parse_concurrency_policy(const nlohmann::json& v, std::string& error) {
    std::string kind;
    std::optional<int> n;
    if (!split_policy(v, "max_concurrent", kind, n, error)) return std::nullopt;
    if (kind == "singleton") return ConcurrencyPolicy::singleton();
    if (kind == "per_token") return ConcurrencyPolicy::per_token();
    if (kind == "bounded") {
        if (!n || *n < 1) {
            error = "Bounded concurrency requires max_concurrent >= 1";
            return std::nullopt;
        }
        return ConcurrencyPolicy::bounded(*n);
    }
    error = "Unknown concurrency policy '" + kind + "'";
    return std::nullopt;
}

// Policies, loop bound, timeout and skippable flag from the transformed config
void parse_node_settings(CompilationContext& ctx, Node& node) {
    const auto& cfg = node.config;
    auto fail = [&](std::string message) {
        ctx.report(DiagnosticPhase::TRANSFORMATION, Severity::ERROR, std::move(message), node.id);
    };
    auto present = [&](const char* key) { return cfg.contains(key) && !cfg.at(key).is_null(); };

    std::string error;
    if (present("join_policy")) {
        if (auto policy = parse_join_policy(cfg.at("join_policy"), error)) {
            node.join_policy = *policy;
            ctx.explicit_join.insert(node.id);
        } else {
            fail(error);
        }
    }
    if (present("concurrency")) {
        if (auto policy = parse_concurrency_policy(cfg.at("concurrency"), error)) {
            node.concurrency_policy = *policy;
            ctx.explicit_concurrency.insert(node.id);
        } else {
            fail(error);
        }
    }
    if (present("max_iteration")) {
        const auto n = as_int(cfg.at("max_iteration"));
        if (n && *n >= 1) {
            node.max_iteration = *n;
        } else {
            fail("max_iteration must be a positive integer");
        }
    }
    if (present("timeout_ms")) {
        const auto n = as_int(cfg.at("timeout_ms"));
        if (n && *n > 0) {
            node.timeout_ms = *n;
        } else {
            fail("timeout_ms must be a positive integer");
        }
    } else if (present("timeout")) {
        const auto& v = cfg.at("timeout"); // seconds
        const double ms = v.is_number() ? std::round(v.get<double>() * 1000.0) : 0.0;
        if (!v.is_number() || v.get<double>() <= 0) {
            fail("timeout must be a positive number of seconds");
        } else if (ms < 1.0) {
            fail("timeout must be at least 1 ms");
        } else if (ms > static_cast<double>(std::numeric_limits<int>::max())) {
            fail("timeout is too large");
        } else {
            node.timeout_ms = static_cast<int>(ms);
        }
    }
    if (present("skippable")) {
        const auto& v = cfg.at("skippable");
        if (v.is_boolean()) {
            node.skippable = v.get<bool>();
        } else {
            fail("skippable must be a boolean");
        }
    }
}

std::unordered_set<NodeId> reachable_from(const NodeId& root,
                                          const std::unordered_map<NodeId, std::vector<NodeId>>& adjacency) {
    std::unordered_set<NodeId> seen{root};
    std::vector<NodeId> stack{root};
    while (!stack.empty()) {
        NodeId id = std::move(stack.back());
        stack.pop_back();
        auto it = adjacency.find(id);
        if (it == adjacency.end()) continue;
        for (const auto& next : it->second) {
            if (seen.insert(next).second) stack.push_back(next);
        }
    }
    return seen;
}

} // namespace

DiagramCompiler::DiagramCompiler() : DiagramCompiler(Config{}) {}

DiagramCompiler::DiagramCompiler(Config config) : config_(config) {}

std::shared_ptr<const ExecutableDiagram> DiagramCompiler::compile(const GraphDescription& graph) const {
    auto result = compile_with_diagnostics(graph);
    if (!result.success) {
        throw CompilationFailed(std::move(result.diagnostics));
    }
    return result.diagram;
}

CompilationResult DiagramCompiler::compile_with_diagnostics(const GraphDescription& graph) const {
    using Phase = void (DiagramCompiler::*)(CompilationContext&) const;
    static const std::array<std::pair<const char*, Phase>, 6> phases = {{
        {"validation", &DiagramCompiler::validate},
        {"transformation", &DiagramCompiler::transform},
        {"resolution", &DiagramCompiler::resolve},
        {"edge_building", &DiagramCompiler::build_edges},
        {"optimization", &DiagramCompiler::optimize},
        {"assembly", &DiagramCompiler::assemble},
    }};

    CompilationContext ctx(graph);
    for (const auto& [name, phase] : phases) {
        (this->*phase)(ctx);
        SPDLOG_LOGGER_DEBUG(logger(), "compiler: {} done, {} diagnostics so far", name, ctx.diagnostics.size());
        if (config_.mode == Mode::FAIL_FAST && has_errors(ctx.diagnostics)) {
            SPDLOG_LOGGER_DEBUG(logger(), "compiler: stopping after {} phase", name);
            break;
        }
    }

    CompilationResult result;
    result.success = ctx.diagram != nullptr && !has_errors(ctx.diagnostics);
    if (result.success) {
        result.diagram = ctx.diagram;
        SPDLOG_LOGGER_INFO(logger(), "Compiled diagram: {} nodes, {} edges, {} loops",
                           ctx.diagram->nodes().size(), ctx.diagram->edges().size(),
                           ctx.diagram->loops().size());
    } else {
        SPDLOG_LOGGER_WARN(logger(), "Diagram compilation failed with {} diagnostics", ctx.diagnostics.size());
    }
    result.diagnostics = std::move(ctx.diagnostics);
    return result;
}

// ---- Phase 1 ----
void DiagramCompiler::validate(CompilationContext& ctx) const {
    constexpr auto kPhase = DiagnosticPhase::VALIDATION;
    const auto& graph = ctx.graph;

    if (graph.nodes.empty()) {
        ctx.report(kPhase, Severity::ERROR, "Diagram has no nodes");
        return;
    }

    std::vector<NodeId> starts;
    std::size_t endpoint_count = 0;
    for (std::size_t i = 0; i < graph.nodes.size(); ++i) {
        const RawNode& raw = graph.nodes[i];
        if (raw.id.empty()) {
            ctx.report(kPhase, Severity::ERROR, "Node at position " + std::to_string(i) + " has an empty id");
            ctx.invalid_nodes.insert(i);
            continue;
        }
        if (!ctx.raw_node_index.emplace(raw.id, i).second) {
            ctx.report(kPhase, Severity::ERROR, "Duplicate node id '" + raw.id + "'", raw.id);
            ctx.invalid_nodes.insert(i);
            continue;
        }
        if (raw.label && !raw.label->empty()) {
            ctx.label_index.emplace(*raw.label, raw.id);
        }
        auto type = parse_node_type(raw.type);
        if (!type) {
            ctx.report(kPhase, Severity::ERROR, "Unknown node type '" + raw.type + "'", raw.id);
            ctx.invalid_nodes.insert(i);
            continue;
        }
        if (!raw.data.is_object() && !raw.data.is_null()) {
            ctx.report(kPhase, Severity::ERROR, "Node data must be an object", raw.id);
            ctx.invalid_nodes.insert(i);
            continue;
        }
        ctx.node_types[raw.id] = *type;
        if (*type == NodeType::START) starts.push_back(raw.id);
        if (*type == NodeType::ENDPOINT) ++endpoint_count;
    }

    if (starts.empty()) {
        ctx.report(kPhase, Severity::ERROR, "Diagram has no start node");
    } else if (starts.size() > 1) {
        for (std::size_t i = 1; i < starts.size(); ++i) {
            ctx.report(kPhase, Severity::ERROR,
                       "Diagram has " + std::to_string(starts.size()) + " start nodes; exactly one is required",
                       starts[i]);
        }
    }
    if (endpoint_count == 0) {
        ctx.report(kPhase, Severity::WARNING, "Diagram has no endpoint node");
    }

    for (const auto& handle : graph.handles) {
        if (handle.id.empty()) continue;
        if (!ctx.raw_node_index.count(handle.node_id)) {
            ctx.report(kPhase, Severity::ERROR,
                       "Handle '" + handle.id + "' references unknown node '" + handle.node_id + "'");
            continue;
        }
        ctx.handle_index.emplace(handle.id, &handle);
    }

    std::unordered_map<NodeId, std::set<PortName>> condition_ports;
    for (std::size_t i = 0; i < graph.connections.size(); ++i) {
        const RawConnection& c = graph.connections[i];
        const std::string id = connection_id(c, i);
        auto src = resolve_reference(ctx, c.source);
        auto tgt = resolve_reference(ctx, c.target);
        if (!src) {
            ctx.report(kPhase, Severity::ERROR, "Connection source '" + c.source + "' does not resolve to a node",
                       std::nullopt, id);
        }
        if (!tgt) {
            ctx.report(kPhase, Severity::ERROR, "Connection target '" + c.target + "' does not resolve to a node",
                       std::nullopt, id);
        }
        if (!src || !tgt) {
            ctx.invalid_connections.insert(i);
            continue;
        }
        auto src_type = ctx.node_types.find(src->node);
        if (src_type == ctx.node_types.end() || !ctx.node_types.count(tgt->node)) {
            // endpoint node already reported
            ctx.invalid_connections.insert(i);
            continue;
        }
        const PortName port = source_port_of(c, *src);
        const auto& outputs = port_spec(src_type->second).outputs;
        if (!outputs.empty() && std::find(outputs.begin(), outputs.end(), port) == outputs.end()) {
            ctx.report(kPhase, Severity::ERROR,
                       "Node '" + src->node + "' (" + to_string(src_type->second) +
                           ") has no output port '" + port + "'",
                       src->node, id);
            ctx.invalid_connections.insert(i);
            continue;
        }
        if (src_type->second == NodeType::CONDITION) {
            condition_ports[src->node].insert(port);
        }
    }

    for (const auto& raw : graph.nodes) {
        auto type = ctx.node_types.find(raw.id);
        if (type == ctx.node_types.end() || type->second != NodeType::CONDITION) continue;
        const auto& ports = condition_ports[raw.id];
        for (std::string_view branch : {kCondTruePort, kCondFalsePort}) {
            if (!ports.count(std::string(branch))) {
                ctx.report(kPhase, Severity::WARNING,
                           "Condition node has no '" + std::string(branch) + "' branch", raw.id);
            }
        }
    }
}

// ---- Phase 2 ----
void DiagramCompiler::transform(CompilationContext& ctx) const {
    const NodeTransformTable& table =
        config_.transform_table ? *config_.transform_table : NodeTransformTable::builtin();

    for (std::size_t i = 0; i < ctx.graph.nodes.size(); ++i) {
        if (ctx.invalid_nodes.count(i)) continue;
        const RawNode& raw = ctx.graph.nodes[i];
        auto type = ctx.node_types.find(raw.id);
        if (type == ctx.node_types.end()) continue;

        Node node;
        node.id = raw.id;
        node.type = type->second;
        if (raw.label && !raw.label->empty()) {
            node.label = *raw.label;
        } else if (raw.data.is_object() && raw.data.contains("label") && raw.data.at("label").is_string()) {
            node.label = raw.data.at("label").get<std::string>();
        } else {
            node.label = raw.id;
        }
        try {
            node.config = table.apply(node.type, node.id, raw.data, ctx.diagnostics);
        } catch (const nlohmann::json::exception& e) {
            ctx.report(DiagnosticPhase::TRANSFORMATION, Severity::ERROR,
                       std::string("Node transform failed: ") + e.what(), node.id);
            continue;
        }
        node.outputs = port_spec(node.type).outputs;
        parse_node_settings(ctx, node);

        ctx.node_pos[node.id] = ctx.nodes.size();
        ctx.nodes.push_back(std::move(node));
    }
}

// ---- Phase 3 ----
void DiagramCompiler::resolve(CompilationContext& ctx) const {
    for (std::size_t i = 0; i < ctx.graph.connections.size(); ++i) {
        if (ctx.invalid_connections.count(i)) continue;
        const RawConnection& c = ctx.graph.connections[i];
        auto src = resolve_reference(ctx, c.source);
        auto tgt = resolve_reference(ctx, c.target);
        if (!src || !tgt || !ctx.has_node(src->node) || !ctx.has_node(tgt->node)) continue;

        Edge edge{src->node, source_port_of(c, *src), tgt->node, target_port_of(c, *tgt)};
        SPDLOG_LOGGER_TRACE(logger(), "compiler: resolved {}", to_string(edge));
        ctx.resolved.push_back({i, connection_id(c, i), std::move(edge)});
    }
}

// ---- Phase 4 ----
void DiagramCompiler::build_edges(CompilationContext& ctx) const {
    constexpr auto kPhase = DiagnosticPhase::EDGE_BUILDING;
    std::unordered_set<Edge> seen;

    for (const auto& rc : ctx.resolved) {
        const Node& src = ctx.node(rc.edge.source);
        const Node& tgt = ctx.node(rc.edge.target);
        if (auto reason = connection_reason(src.type, tgt.type)) {
            ctx.report(kPhase, Severity::ERROR, "Invalid connection " + to_string(rc.edge) + ": " + *reason,
                       std::nullopt, rc.id);
            continue;
        }
        if (!seen.insert(rc.edge).second) {
            ctx.report(kPhase, Severity::WARNING, "Duplicate connection " + to_string(rc.edge) + " collapsed",
                       std::nullopt, rc.id);
            continue;
        }

        ExecutableEdge edge;
        edge.id = rc.id;
        edge.edge = rc.edge;
        edge.transform = default_transform(src.type, tgt.type);

        const nlohmann::json& data = ctx.graph.connections[rc.raw_index].data;
        if (data.is_object()) {
            if (auto t = data.find("transform"); t != data.end() && !t->is_null()) {
                if (t->is_object()) {
                    edge.transform.update(*t); // override wins key by key
                } else {
                    ctx.report(kPhase, Severity::ERROR, "Connection transform override must be an object",
                               std::nullopt, rc.id);
                }
            }
            if (auto s = data.find("skippable"); s != data.end() && s->is_boolean()) {
                edge.skippable = s->get<bool>();
            }
        }
        if (src.type == NodeType::CONDITION && src.skippable) {
            edge.skippable = true;
        }
        ctx.edges.push_back(std::move(edge));
    }
}

// ---- Phase 5 ----
void DiagramCompiler::optimize(CompilationContext& ctx) const {
    constexpr auto kPhase = DiagnosticPhase::OPTIMIZATION;
    if (ctx.nodes.empty()) return;

    std::unordered_map<NodeId, std::vector<std::size_t>> out_edges;
    std::unordered_map<NodeId, std::vector<NodeId>> all_forward;
    for (std::size_t i = 0; i < ctx.edges.size(); ++i) {
        const Edge& e = ctx.edges[i].edge;
        out_edges[e.source].push_back(i);
        all_forward[e.source].push_back(e.target);
    }

    // DFS post-order, START first, then the remaining roots in declaration order
    std::unordered_map<NodeId, int> color; // 0 white, 1 grey, 2 black
    std::vector<NodeId> postorder;
    auto dfs = [&](const NodeId& root) {
        if (color[root] != 0) return;
        std::vector<std::pair<NodeId, std::size_t>> stack;
        stack.emplace_back(root, 0);
        color[root] = 1;
        while (!stack.empty()) {
            const NodeId current = stack.back().first;
            const std::size_t next = stack.back().second;
            const auto& out = out_edges[current];
            if (next < out.size()) {
                stack.back().second = next + 1;
                const NodeId& child = ctx.edges[out[next]].edge.target;
                if (color[child] == 0) {
                    color[child] = 1;
                    stack.emplace_back(child, 0);
                }
            } else {
                color[current] = 2;
                postorder.push_back(current);
                stack.pop_back();
            }
        }
    };

    std::optional<NodeId> start;
    for (const auto& node : ctx.nodes) {
        if (node.type == NodeType::START) {
            start = node.id;
            break;
        }
    }
    if (start) dfs(*start);
    for (const auto& node : ctx.nodes) dfs(node.id);

    std::unordered_map<NodeId, std::size_t> rank;
    for (std::size_t i = 0; i < postorder.size(); ++i) {
        rank[postorder[postorder.size() - 1 - i]] = i;
    }

    std::vector<std::size_t> back_edges;
    std::unordered_map<NodeId, std::vector<NodeId>> forward, reverse;
    for (std::size_t i = 0; i < ctx.edges.size(); ++i) {
        auto& e = ctx.edges[i];
        if (rank[e.edge.target] <= rank[e.edge.source]) {
            e.loop_back = true;
            back_edges.push_back(i);
            SPDLOG_LOGGER_DEBUG(logger(), "compiler: loop-back edge {}", to_string(e.edge));
        } else {
            forward[e.edge.source].push_back(e.edge.target);
            reverse[e.edge.target].push_back(e.edge.source);
        }
    }

    // Kahn over the base DAG; ties broken by declaration order
    std::unordered_map<NodeId, int> in_degree;
    for (const auto& node : ctx.nodes) in_degree[node.id] = 0;
    for (const auto& [src, targets] : forward) {
        for (const auto& t : targets) ++in_degree[t];
    }
    std::priority_queue<std::size_t, std::vector<std::size_t>, std::greater<>> ready;
    for (const auto& node : ctx.nodes) {
        if (in_degree[node.id] == 0) ready.push(ctx.node_pos.at(node.id));
    }
    std::vector<NodeId> order;
    while (!ready.empty()) {
        const NodeId id = ctx.nodes[ready.top()].id;
        ready.pop();
        order.push_back(id);
        for (const auto& t : forward[id]) {
            if (--in_degree[t] == 0) ready.push(ctx.node_pos.at(t));
        }
    }
    if (order.size() != ctx.nodes.size()) {
        ctx.report(kPhase, Severity::ERROR, "Diagram contains a cycle that is not broken by a loop-back edge");
        return;
    }
    ctx.topological_order = order;

    for (std::size_t index : back_edges) {
        const auto& e = ctx.edges[index];
        LoopInfo loop;
        loop.back_edge = index;
        loop.head = e.edge.target;
        loop.tail = e.edge.source;
        const auto from_head = reachable_from(loop.head, forward);
        const auto to_tail = reachable_from(loop.tail, reverse);
        bool bounded = false;
        for (const auto& id : ctx.topological_order) {
            if (!from_head.count(id) || !to_tail.count(id)) continue;
            loop.members.push_back(id);
            const Node& member = ctx.node(id);
            if (member.max_iteration || is_branching(member.type)) bounded = true;
        }
        if (!bounded) {
            ctx.report(kPhase, Severity::ERROR,
                       "Unrecognized cycle: loop " + loop.head + " .. " + loop.tail +
                           " has no branching exit and no max_iteration bound",
                       loop.tail, e.id);
            continue;
        }
        ctx.loops.push_back(std::move(loop));
    }

    if (start) {
        const auto reachable = reachable_from(*start, all_forward);
        for (const auto& node : ctx.nodes) {
            if (!reachable.count(node.id)) {
                ctx.report(kPhase, Severity::WARNING, "Node is unreachable from the start node", node.id);
            }
        }
    }
}

// ---- Phase 6 ----
void DiagramCompiler::assemble(CompilationContext& ctx) const {
    std::unordered_map<NodeId, std::vector<const ExecutableEdge*>> incoming;
    std::unordered_map<NodeId, std::vector<NodeId>> forward;
    for (const auto& e : ctx.edges) {
        incoming[e.edge.target].push_back(&e);
        if (!e.loop_back) forward[e.edge.source].push_back(e.edge.target);
    }

    // nodes on a base-DAG path below some branching node
    std::unordered_set<NodeId> below_branch;
    std::vector<NodeId> stack;
    for (const auto& node : ctx.nodes) {
        if (!is_branching(node.type)) continue;
        for (const auto& t : forward[node.id]) stack.push_back(t);
    }
    while (!stack.empty()) {
        NodeId id = std::move(stack.back());
        stack.pop_back();
        if (!below_branch.insert(id).second) continue;
        for (const auto& t : forward[id]) stack.push_back(t);
    }

    for (Node& node : ctx.nodes) {
        const auto& in = incoming[node.id];
        std::set<PortName> ports;
        for (const auto* e : in) ports.insert(e->edge.target_port);
        node.inputs.assign(ports.begin(), ports.end());

        const int n = static_cast<int>(in.size());
        if (!ctx.explicit_join.count(node.id)) {
            bool any = false;
            if (node.type != NodeType::START && n > 1) {
                for (const auto* e : in) {
                    const Node& src = ctx.node(e->edge.source);
                    if (e->loop_back || is_branching(src.type) || below_branch.count(src.id)) {
                        any = true;
                        break;
                    }
                }
            }
            node.join_policy = any ? JoinPolicy::any() : JoinPolicy::all();
        } else if (node.join_policy.kind == JoinPolicy::Kind::K_OF_N &&
                   (node.join_policy.k < 1 || node.join_policy.k > n)) {
            ctx.report(DiagnosticPhase::ASSEMBLY, Severity::ERROR,
                       "k_of_n join requires 1 <= k <= " + std::to_string(n) +
                           " incoming edges, got k = " + std::to_string(node.join_policy.k),
                       node.id);
        }
        if (!ctx.explicit_concurrency.count(node.id)) {
            node.concurrency_policy = ConcurrencyPolicy::singleton();
        }
    }

    if (has_errors(ctx.diagnostics)) return;

    ctx.diagram = std::make_shared<const ExecutableDiagram>(
        ctx.nodes, ctx.edges, ctx.topological_order, ctx.loops, ctx.diagnostics);
}

} // namespace tokenflow
