#ifndef TOKENFLOW_MODULES_COMPILER_NODE_TRANSFORM_TABLE_H
#define TOKENFLOW_MODULES_COMPILER_NODE_TRANSFORM_TABLE_H

#include "core/types/node.h"
#include "core/types/diagnostic.h"
#include <functional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace tokenflow {

// Per-type hook, runs after renames/defaults/removals. May rewrite data and emit diagnostics.
using TransformHook = std::function<void(const NodeId& node_id, nlohmann::json& data, Diagnostics& diagnostics)>;

struct TransformDescriptor {
    std::vector<std::pair<std::string, std::string>> renames; // from -> to
    nlohmann::json defaults = nlohmann::json::object();       // injected when missing or null
    std::vector<std::string> removals;
    TransformHook hook;
};

// NodeType -> TransformDescriptor, registered up front and read-only during compilation
class NodeTransformTable {
public:
    NodeTransformTable() = default;

    // Table with the built-in per-type rules
    static const NodeTransformTable& builtin();

    void register_descriptor(NodeType type, TransformDescriptor descriptor);
    // Applied to every node type before its own descriptor
    void register_common(TransformDescriptor descriptor);

    const TransformDescriptor* descriptor_for(NodeType type) const;

    nlohmann::json apply(NodeType type, const NodeId& node_id, nlohmann::json data,
                         Diagnostics& diagnostics) const;

private:
    std::unordered_map<NodeType, TransformDescriptor> descriptors_;
    TransformDescriptor common_;
};

} // namespace tokenflow

#endif // TOKENFLOW_MODULES_COMPILER_NODE_TRANSFORM_TABLE_H
