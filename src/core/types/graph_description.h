#ifndef TOKENFLOW_TYPES_GRAPH_DESCRIPTION_H
#define TOKENFLOW_TYPES_GRAPH_DESCRIPTION_H

#include "context.h"
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace tokenflow {

// Untyped, pre-parsed graph as produced by a loader or editor. Sole input of the compiler.

struct RawNode {
    std::string id;
    std::string type; // wire name, checked during validation
    std::optional<std::string> label;
    nlohmann::json data = nlohmann::json::object();
};

struct RawHandle {
    std::string id;
    std::string node_id;
    std::string label; // port name
    std::string direction; // "input" / "output"
};

struct RawConnection {
    std::optional<std::string> id;
    std::string source; // handle id, node id, node label, or "node:port"
    std::string target;
    std::optional<std::string> source_port;
    std::optional<std::string> target_port;
    std::optional<std::string> label;
    nlohmann::json data = nlohmann::json::object(); // transform override, skippable, ...
};

struct GraphDescription {
    std::vector<RawNode> nodes;
    std::vector<RawConnection> connections;
    std::vector<RawHandle> handles;
    nlohmann::json metadata = nlohmann::json::object();
};

} // namespace tokenflow

#endif // TOKENFLOW_TYPES_GRAPH_DESCRIPTION_H
