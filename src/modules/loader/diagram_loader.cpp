#include "modules/loader/diagram_loader.h"
#include "common/logging/logger.h"
#include "common/utils/yaml_json.h"
#include "core/types/errors.h"
#include "core/types/node.h"
#include <fstream>
#include <optional>
#include <set>
#include <sstream>
#include <string_view>
#include <yaml-cpp/yaml.h>

namespace tokenflow {

namespace {

std::string require_string(const nlohmann::json& obj, const char* key, const std::string& where) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string() || it->get<std::string>().empty()) {
        throw DiagramLoadError(where + ": missing string field '" + key + "'");
    }
    return it->get<std::string>();
}

std::optional<std::string> optional_string(const nlohmann::json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return std::nullopt;
    if (it->is_string()) return it->get<std::string>();
    return it->dump();
}

nlohmann::json object_field(const nlohmann::json& obj, const char* key, const std::string& where) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return nlohmann::json::object();
    if (!it->is_object()) {
        throw DiagramLoadError(where + ": '" + key + "' must be a mapping");
    }
    return *it;
}

const nlohmann::json& list_field(const nlohmann::json& doc, const char* key) {
    static const nlohmann::json empty = nlohmann::json::array();
    auto it = doc.find(key);
    if (it == doc.end() || it->is_null()) return empty;
    if (!it->is_array()) {
        throw DiagramLoadError(std::string("'") + key + "' must be a list");
    }
    return *it;
}

RawNode parse_node(const nlohmann::json& entry, std::size_t index, const nlohmann::json& persons) {
    const std::string where = "nodes[" + std::to_string(index) + "]";
    if (!entry.is_object()) throw DiagramLoadError(where + " must be a mapping");

    RawNode node;
    node.type = require_string(entry, "type", where);
    node.label = optional_string(entry, "label");
    if (auto id = optional_string(entry, "id")) {
        node.id = *id;
    } else if (node.label) {
        node.id = *node.label; // light format: label doubles as id
    } else {
        throw DiagramLoadError(where + ": node needs an 'id' or a 'label'");
    }

    if (entry.contains("props") && entry.contains("data")) {
        throw DiagramLoadError(where + ": use either 'props' or 'data', not both");
    }
    node.data = entry.contains("props") ? object_field(entry, "props", where) : object_field(entry, "data", where);
    if (entry.contains("position") && !node.data.contains("position")) {
        node.data["position"] = entry["position"]; // dropped by the transform table
    }

    // person_job: props.person -> persons[person]
    if (auto person = node.data.find("person"); person != node.data.end() && person->is_string()) {
        auto p = persons.find(person->get<std::string>());
        if (p != persons.end() && p->is_object()) {
            for (const auto& [key, value] : p->items()) {
                if (!node.data.contains(key)) node.data[key] = value;
            }
        } else {
            SPDLOG_LOGGER_WARN(logger(), "Node '{}' refers to unknown person '{}'", node.id, person->get<std::string>());
        }
    }
    return node;
}

// "Check_condtrue" -> ("Check", "condtrue") when Check is a known node and Check_condtrue is not
void split_branch_reference(RawConnection& conn, const std::set<std::string>& names) {
    if (conn.source_port || names.count(conn.source)) return;
    for (std::string_view port : {kCondTruePort, kCondFalsePort}) {
        const std::string suffix = "_" + std::string(port);
        if (conn.source.size() > suffix.size() &&
            conn.source.compare(conn.source.size() - suffix.size(), suffix.size(), suffix) == 0) {
            const std::string base = conn.source.substr(0, conn.source.size() - suffix.size());
            if (names.count(base)) {
                conn.source = base;
                conn.source_port = std::string(port);
                return;
            }
        }
    }
}

RawConnection parse_connection(const nlohmann::json& entry, std::size_t index, const std::set<std::string>& names) {
    const std::string where = "connections[" + std::to_string(index) + "]";
    if (!entry.is_object()) throw DiagramLoadError(where + " must be a mapping");

    RawConnection conn;
    const bool light = entry.contains("from") || entry.contains("to");
    conn.id = optional_string(entry, "id");
    conn.source = require_string(entry, light ? "from" : "source", where);
    conn.target = require_string(entry, light ? "to" : "target", where);
    conn.source_port = optional_string(entry, "source_port");
    conn.target_port = optional_string(entry, "target_port");
    conn.label = optional_string(entry, "label");
    conn.data = object_field(entry, "data", where);

    if (auto content_type = optional_string(entry, "content_type")) {
        conn.data["transform"]["content_type"] = *content_type;
    }
    if (entry.contains("transform")) {
        const nlohmann::json transform = object_field(entry, "transform", where);
        if (!conn.data.contains("transform")) conn.data["transform"] = nlohmann::json::object();
        conn.data["transform"].update(transform);
    }
    if (auto skippable = entry.find("skippable"); skippable != entry.end()) {
        if (!skippable->is_boolean()) throw DiagramLoadError(where + ": 'skippable' must be a boolean");
        conn.data["skippable"] = *skippable;
    }

    split_branch_reference(conn, names);
    return conn;
}

RawHandle parse_handle(const nlohmann::json& entry, std::size_t index) {
    const std::string where = "handles[" + std::to_string(index) + "]";
    if (!entry.is_object()) throw DiagramLoadError(where + " must be a mapping");

    RawHandle handle;
    handle.id = require_string(entry, "id", where);
    handle.node_id = require_string(entry, "node_id", where);
    handle.label = entry.contains("label") ? require_string(entry, "label", where) : std::string(kDefaultPort);
    handle.direction = optional_string(entry, "direction").value_or("output");
    if (handle.direction != "input" && handle.direction != "output") {
        throw DiagramLoadError(where + ": direction must be 'input' or 'output'");
    }
    return handle;
}

} // namespace

GraphDescription DiagramLoader::from_json(const nlohmann::json& document) {
    if (!document.is_object()) {
        throw DiagramLoadError("Diagram document must be a mapping");
    }

    GraphDescription graph;
    const nlohmann::json persons = object_field(document, "persons", "document");

    std::set<std::string> names;
    const nlohmann::json& nodes = list_field(document, "nodes");
    for (std::size_t i = 0; i < nodes.size(); ++i) {
        RawNode node = parse_node(nodes[i], i, persons);
        names.insert(node.id);
        if (node.label) names.insert(*node.label);
        graph.nodes.push_back(std::move(node));
    }

    const nlohmann::json& connections = document.contains("connections") ? list_field(document, "connections")
                                                                         : list_field(document, "arrows");
    for (std::size_t i = 0; i < connections.size(); ++i) {
        graph.connections.push_back(parse_connection(connections[i], i, names));
    }

    const nlohmann::json& handles = list_field(document, "handles");
    for (std::size_t i = 0; i < handles.size(); ++i) {
        graph.handles.push_back(parse_handle(handles[i], i));
    }

    for (const char* key : {"version", "name", "description"}) {
        if (document.contains(key)) graph.metadata[key] = document[key];
    }
    if (!persons.empty()) graph.metadata["persons"] = persons;
    if (document.contains("metadata") && document["metadata"].is_object()) {
        graph.metadata.update(document["metadata"]);
    }

    SPDLOG_LOGGER_DEBUG(logger(), "Loaded diagram: {} nodes, {} connections, {} handles", graph.nodes.size(),
                        graph.connections.size(), graph.handles.size());
    return graph;
}

GraphDescription DiagramLoader::parse_from_string(const std::string& text) {
    nlohmann::json document;
    try {
        document = parse_yaml_or_json(text);
    } catch (const YAML::Exception& e) {
        throw DiagramLoadError(std::string("Diagram parse error: ") + e.what());
    }
    return from_json(document);
}

GraphDescription DiagramLoader::parse_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw DiagramLoadError("Cannot open file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse_from_string(buffer.str());
}

} // namespace tokenflow
