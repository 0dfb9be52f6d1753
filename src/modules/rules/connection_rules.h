#ifndef TOKENFLOW_MODULES_RULES_CONNECTION_RULES_H
#define TOKENFLOW_MODULES_RULES_CONNECTION_RULES_H

#include "core/types/node.h"
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace tokenflow {

// Stateless table deciding which node-type pairs may be linked.
// Every NodeType is classified explicitly (see classify() in connection_rules.cpp).

struct ConnectionConstraints {
    std::vector<NodeType> can_receive_from;
    std::vector<NodeType> can_send_to;
};

bool can_connect(NodeType source, NodeType target);

// Human readable reason for a rejected pair, nullopt if the pair is allowed
std::optional<std::string> connection_reason(NodeType source, NodeType target);

ConnectionConstraints connection_constraints(NodeType type);

// Type-pair default data transform policy (JSON object, possibly empty)
nlohmann::json default_transform(NodeType source, NodeType target);

} // namespace tokenflow

#endif // TOKENFLOW_MODULES_RULES_CONNECTION_RULES_H
