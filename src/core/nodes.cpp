#include "core/types/node.h"
#include "core/types/edge.h"
#include <algorithm>
#include <cctype>
#include <string>

namespace tokenflow {

std::string to_string(NodeType type) {
    switch (type) {
        case NodeType::START: return "start";
        case NodeType::PERSON_JOB: return "person_job";
        case NodeType::CONDITION: return "condition";
        case NodeType::CODE_JOB: return "code_job";
        case NodeType::API_JOB: return "api_job";
        case NodeType::ENDPOINT: return "endpoint";
        case NodeType::DB: return "db";
        case NodeType::USER_RESPONSE: return "user_response";
        case NodeType::HOOK: return "hook";
        case NodeType::TEMPLATE_JOB: return "template_job";
        case NodeType::JSON_SCHEMA_VALIDATOR: return "json_schema_validator";
        case NodeType::TYPESCRIPT_AST: return "typescript_ast";
        case NodeType::SUB_DIAGRAM: return "sub_diagram";
        case NodeType::INTEGRATED_API: return "integrated_api";
        case NodeType::IR_BUILDER: return "ir_builder";
        case NodeType::DIFF_PATCH: return "diff_patch";
    }
    return "unknown";
}

std::optional<NodeType> parse_node_type(std::string_view name) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (NodeType type : kAllNodeTypes) {
        if (to_string(type) == lowered) return type;
    }
    return std::nullopt;
}

namespace {

PortSpec make_spec(NodeType type) {
    PortSpec spec;
    switch (type) {
        case NodeType::START:
            spec.outputs = {std::string(kDefaultPort)};
            spec.accepts_inputs = false;
            return spec;
        case NodeType::ENDPOINT:
            spec.accepts_inputs = true;
            return spec;
        case NodeType::CONDITION:
            spec.outputs = {std::string(kCondTruePort), std::string(kCondFalsePort), std::string(kErrorPort)};
            spec.exclusive_outputs = {std::string(kCondTruePort), std::string(kCondFalsePort)};
            return spec;
        case NodeType::PERSON_JOB:
        case NodeType::CODE_JOB:
        case NodeType::API_JOB:
        case NodeType::DB:
        case NodeType::USER_RESPONSE:
        case NodeType::HOOK:
        case NodeType::TEMPLATE_JOB:
        case NodeType::JSON_SCHEMA_VALIDATOR:
        case NodeType::TYPESCRIPT_AST:
        case NodeType::SUB_DIAGRAM:
        case NodeType::INTEGRATED_API:
        case NodeType::IR_BUILDER:
        case NodeType::DIFF_PATCH:
            spec.outputs = {std::string(kDefaultPort), std::string(kErrorPort)};
            return spec;
    }
    return spec;
}

} // namespace

const PortSpec& port_spec(NodeType type) {
    static const std::array<PortSpec, kAllNodeTypes.size()> table = [] {
        std::array<PortSpec, kAllNodeTypes.size()> t;
        for (NodeType type : kAllNodeTypes) {
            t[static_cast<size_t>(type)] = make_spec(type);
        }
        return t;
    }();
    return table.at(static_cast<size_t>(type));
}

bool is_branching(NodeType type) {
    return !port_spec(type).exclusive_outputs.empty();
}

std::string to_string(JoinPolicy policy) {
    switch (policy.kind) {
        case JoinPolicy::Kind::ALL: return "all";
        case JoinPolicy::Kind::ANY: return "any";
        case JoinPolicy::Kind::K_OF_N: return "k_of_n(" + std::to_string(policy.k) + ")";
    }
    return "unknown";
}

std::string to_string(ConcurrencyPolicy policy) {
    switch (policy.kind) {
        case ConcurrencyPolicy::Kind::SINGLETON: return "singleton";
        case ConcurrencyPolicy::Kind::PER_TOKEN: return "per_token";
        case ConcurrencyPolicy::Kind::BOUNDED: return "bounded(" + std::to_string(policy.max_concurrent) + ")";
    }
    return "unknown";
}

bool Node::has_output(std::string_view port) const {
    return std::find(outputs.begin(), outputs.end(), port) != outputs.end();
}

std::string to_string(const Edge& edge) {
    return edge.source + ":" + edge.source_port + " -> " + edge.target + ":" + edge.target_port;
}

} // namespace tokenflow
