#ifndef TOKENFLOW_TYPES_EDGE_H
#define TOKENFLOW_TYPES_EDGE_H

#include "context.h"
#include <cstddef>
#include <functional>
#include <string>
#include <nlohmann/json.hpp>

namespace tokenflow {

// (source node, source port) -> (target node, target port)
struct Edge {
    NodeId source;
    PortName source_port;
    NodeId target;
    PortName target_port;

    bool operator==(const Edge&) const = default;
};

std::string to_string(const Edge& edge);

inline void hash_combine(std::size_t& seed, std::size_t value) {
    seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
}

struct EdgeHash {
    std::size_t operator()(const Edge& e) const noexcept {
        std::hash<std::string> h;
        std::size_t seed = h(e.source);
        hash_combine(seed, h(e.source_port));
        hash_combine(seed, h(e.target));
        hash_combine(seed, h(e.target_port));
        return seed;
    }
};

// Edge as produced by the compiler
struct ExecutableEdge {
    std::string id; // connection id from the graph description
    Edge edge;
    bool loop_back = false;
    bool skippable = false;
    nlohmann::json transform = nlohmann::json::object(); // merged data-transform policy

    bool operator==(const ExecutableEdge&) const = default;
};

} // namespace tokenflow

template <>
struct std::hash<tokenflow::Edge> {
    std::size_t operator()(const tokenflow::Edge& e) const noexcept {
        return tokenflow::EdgeHash{}(e);
    }
};

#endif // TOKENFLOW_TYPES_EDGE_H
