#ifndef TOKENFLOW_TYPES_NODE_H
#define TOKENFLOW_TYPES_NODE_H

#include "context.h"
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>

namespace tokenflow {

// 节点类型枚举 (closed universe, every value must be classified in connection_rules.cpp)
enum class NodeType : uint8_t {
    START,
    PERSON_JOB,
    CONDITION,
    CODE_JOB,
    API_JOB,
    ENDPOINT,
    DB,
    USER_RESPONSE,
    HOOK,
    TEMPLATE_JOB,
    JSON_SCHEMA_VALIDATOR,
    TYPESCRIPT_AST,
    SUB_DIAGRAM,
    INTEGRATED_API,
    IR_BUILDER,
    DIFF_PATCH
};

inline constexpr std::array<NodeType, 16> kAllNodeTypes = {
    NodeType::START, NodeType::PERSON_JOB, NodeType::CONDITION, NodeType::CODE_JOB,
    NodeType::API_JOB, NodeType::ENDPOINT, NodeType::DB, NodeType::USER_RESPONSE,
    NodeType::HOOK, NodeType::TEMPLATE_JOB, NodeType::JSON_SCHEMA_VALIDATOR,
    NodeType::TYPESCRIPT_AST, NodeType::SUB_DIAGRAM, NodeType::INTEGRATED_API,
    NodeType::IR_BUILDER, NodeType::DIFF_PATCH
};

// Conventional port names
inline constexpr std::string_view kDefaultPort = "default";
inline constexpr std::string_view kErrorPort = "error";
inline constexpr std::string_view kCondTruePort = "condtrue";
inline constexpr std::string_view kCondFalsePort = "condfalse";
// person_job input read only by the node's first run
inline constexpr std::string_view kFirstPort = "first";

std::string to_string(NodeType type);
std::optional<NodeType> parse_node_type(std::string_view name);

// Static port layout of a node type
struct PortSpec {
    std::vector<PortName> outputs;
    std::vector<PortName> exclusive_outputs; // non-empty only for branching types
    bool accepts_inputs = true;
};

const PortSpec& port_spec(NodeType type);
bool is_branching(NodeType type);

struct JoinPolicy {
    enum class Kind : uint8_t { ALL, ANY, K_OF_N };

    Kind kind = Kind::ALL;
    int k = 0; // only meaningful for K_OF_N

    static JoinPolicy all() { return {Kind::ALL, 0}; }
    static JoinPolicy any() { return {Kind::ANY, 0}; }
    static JoinPolicy k_of_n(int k) { return {Kind::K_OF_N, k}; }

    bool operator==(const JoinPolicy&) const = default;
};

struct ConcurrencyPolicy {
    enum class Kind : uint8_t { SINGLETON, PER_TOKEN, BOUNDED };

    Kind kind = Kind::SINGLETON;
    int max_concurrent = 1; // only meaningful for BOUNDED

    static ConcurrencyPolicy singleton() { return {Kind::SINGLETON, 1}; }
    static ConcurrencyPolicy per_token() { return {Kind::PER_TOKEN, 0}; }
    static ConcurrencyPolicy bounded(int n) { return {Kind::BOUNDED, n}; }

    // Whether another run may start while `in_flight` runs are active
    bool admits(int in_flight) const {
        switch (kind) {
            case Kind::SINGLETON: return in_flight < 1;
            case Kind::BOUNDED: return in_flight < max_concurrent;
            case Kind::PER_TOKEN: return true;
        }
        return false;
    }

    bool operator==(const ConcurrencyPolicy&) const = default;
};

std::string to_string(JoinPolicy policy);
std::string to_string(ConcurrencyPolicy policy);

// Compiled node. Immutable once the ExecutableDiagram is assembled.
struct Node {
    NodeId id;
    NodeType type = NodeType::START;
    std::string label;
    std::vector<PortName> inputs;  // connected input ports
    std::vector<PortName> outputs; // declared output ports
    nlohmann::json config = nlohmann::json::object();
    JoinPolicy join_policy;
    ConcurrencyPolicy concurrency_policy;
    std::optional<int> max_iteration;
    std::optional<int> timeout_ms;
    bool skippable = false;

    bool has_output(std::string_view port) const;
    bool operator==(const Node&) const = default;
};

} // namespace tokenflow

#endif // TOKENFLOW_TYPES_NODE_H
