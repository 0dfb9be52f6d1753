#include "modules/compiler/node_transform_table.h"

namespace tokenflow {

namespace {

void apply_descriptor(const TransformDescriptor& d, const NodeId& node_id, nlohmann::json& data,
                      Diagnostics& diagnostics) {
    for (const auto& [from, to] : d.renames) {
        if (!data.contains(from)) continue;
        if (!data.contains(to)) {
            data[to] = std::move(data[from]);
        }
        data.erase(from);
    }
    for (const auto& [key, value] : d.defaults.items()) {
        if (!data.contains(key) || data[key].is_null()) {
            data[key] = value;
        }
    }
    for (const auto& key : d.removals) {
        data.erase(key);
    }
    if (d.hook) {
        d.hook(node_id, data, diagnostics);
    }
}

Diagnostic transform_warning(const NodeId& node_id, std::string message) {
    return Diagnostic{DiagnosticPhase::TRANSFORMATION, Severity::WARNING, std::move(message), node_id, std::nullopt};
}

NodeTransformTable make_builtin() {
    NodeTransformTable table;

    // editor-only fields
    table.register_common({{}, nlohmann::json::object(), {"position", "flipped"}, nullptr});

    table.register_descriptor(NodeType::PERSON_JOB, {
        {},
        {{"max_iteration", 1}},
        {},
        [](const NodeId& id, nlohmann::json& data, Diagnostics& diagnostics) {
            if (!data.contains("default_prompt") && !data.contains("first_only_prompt")) {
                diagnostics.push_back(transform_warning(id, "person_job has no prompt"));
            }
        }
    });

    table.register_descriptor(NodeType::CONDITION, {
        {},
        {{"condition_type", "custom"}, {"skippable", false}},
        {},
        [](const NodeId& id, nlohmann::json& data, Diagnostics& diagnostics) {
            if (data["condition_type"] == "custom" && !data.contains("expression")) {
                diagnostics.push_back(transform_warning(id, "custom condition has no expression"));
            }
        }
    });

    table.register_descriptor(NodeType::CODE_JOB, {
        {{"filePath", "file_path"}, {"functionName", "function_name"}},
        nlohmann::json::object(),
        {},
        [](const NodeId& id, nlohmann::json& data, Diagnostics& diagnostics) {
            if (!data.contains("code") && !data.contains("file_path")) {
                diagnostics.push_back(transform_warning(id, "code_job has neither code nor file_path"));
            }
        }
    });

    table.register_descriptor(NodeType::DB, {
        {{"subType", "sub_type"}, {"serializeJson", "serialize_json"}},
        {{"format", "json"}},
        {},
        nullptr
    });

    table.register_descriptor(NodeType::HOOK, {
        {{"hookType", "hook_type"}, {"retryCount", "retry_count"}},
        {{"hook_type", "shell"}, {"timeout", 60}, {"retry_count", 0}},
        {},
        nullptr
    });

    table.register_descriptor(NodeType::TEMPLATE_JOB, {
        {{"templateContent", "template"}},
        nlohmann::json::object(),
        {},
        nullptr
    });

    return table;
}

} // namespace

const NodeTransformTable& NodeTransformTable::builtin() {
    static const NodeTransformTable table = make_builtin();
    return table;
}

void NodeTransformTable::register_descriptor(NodeType type, TransformDescriptor descriptor) {
    descriptors_[type] = std::move(descriptor);
}

void NodeTransformTable::register_common(TransformDescriptor descriptor) {
    common_ = std::move(descriptor);
}

const TransformDescriptor* NodeTransformTable::descriptor_for(NodeType type) const {
    auto it = descriptors_.find(type);
    return it == descriptors_.end() ? nullptr : &it->second;
}

nlohmann::json NodeTransformTable::apply(NodeType type, const NodeId& node_id, nlohmann::json data,
                                         Diagnostics& diagnostics) const {
    if (data.is_null()) {
        data = nlohmann::json::object();
    }
    apply_descriptor(common_, node_id, data, diagnostics);
    if (const auto* d = descriptor_for(type)) {
        apply_descriptor(*d, node_id, data, diagnostics);
    }
    return data;
}

} // namespace tokenflow
