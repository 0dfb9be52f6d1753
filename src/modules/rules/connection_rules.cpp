#include "modules/rules/connection_rules.h"

namespace tokenflow {

namespace {

enum class Role {
    SOURCE_ONLY,    // may send, never receives
    SINK_ONLY,      // may receive, never sends
    OUTPUT_CAPABLE  // may send and receive
};

// 不加 default: 新增 NodeType 时编译器会提示未分类
Role classify(NodeType type) {
    switch (type) {
        case NodeType::START:
            return Role::SOURCE_ONLY;
        case NodeType::ENDPOINT:
            return Role::SINK_ONLY;
        case NodeType::PERSON_JOB:
        case NodeType::CONDITION:
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
            return Role::OUTPUT_CAPABLE;
    }
    return Role::OUTPUT_CAPABLE;
}

bool sends(Role role) { return role != Role::SINK_ONLY; }
bool receives(Role role) { return role != Role::SOURCE_ONLY; }

} // namespace

std::optional<std::string> connection_reason(NodeType source, NodeType target) {
    const Role src = classify(source);
    const Role tgt = classify(target);
    if (!receives(tgt)) {
        return to_string(target) + " nodes cannot receive input";
    }
    if (!sends(src)) {
        return to_string(source) + " nodes cannot send output";
    }
    return std::nullopt;
}

bool can_connect(NodeType source, NodeType target) {
    return !connection_reason(source, target).has_value();
}

ConnectionConstraints connection_constraints(NodeType type) {
    ConnectionConstraints constraints;
    for (NodeType other : kAllNodeTypes) {
        if (can_connect(other, type)) constraints.can_receive_from.push_back(other);
        if (can_connect(type, other)) constraints.can_send_to.push_back(other);
    }
    return constraints;
}

nlohmann::json default_transform(NodeType source, NodeType target) {
    nlohmann::json transform = nlohmann::json::object();
    switch (source) {
        case NodeType::PERSON_JOB:
            transform["content_type"] =
                target == NodeType::PERSON_JOB ? "conversation_state" : "raw_text";
            break;
        case NodeType::CODE_JOB:
            transform["content_type"] = "object";
            break;
        case NodeType::CONDITION:
            transform["content_type"] = "raw_text";
            break;
        case NodeType::START:
        case NodeType::API_JOB:
        case NodeType::ENDPOINT:
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
            break;
    }
    return transform;
}

} // namespace tokenflow
