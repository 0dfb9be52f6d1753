#ifndef TOKENFLOW_MODULES_LOADER_DIAGRAM_LOADER_H
#define TOKENFLOW_MODULES_LOADER_DIAGRAM_LOADER_H

#include "core/types/graph_description.h"
#include <string>
#include <nlohmann/json.hpp>

namespace tokenflow {

// Reads a diagram document (YAML or JSON) into a GraphDescription.
//
// Light format:
//   nodes:       [{label, type, props, position?}]
//   connections: [{from, to, label?, content_type?, skippable?, transform?}]
//   persons:     {name: {system_prompt, ...}}   (person_job props.person refers to it)
// `from: Check_condtrue` addresses a condition branch.
//
// Native format:
//   nodes:       [{id, type, label?, data}]
//   connections: [{id?, source, target, source_port?, target_port?, label?, data?}]
//   handles:     [{id, node_id, label, direction}]
//
// Both may be mixed per entry. Only the document shape is checked here; graph
// semantics are left to the compiler. Throws DiagramLoadError.
class DiagramLoader {
public:
    static GraphDescription parse_from_string(const std::string& text);
    static GraphDescription parse_from_file(const std::string& path);
    static GraphDescription from_json(const nlohmann::json& document);
};

} // namespace tokenflow

#endif // TOKENFLOW_MODULES_LOADER_DIAGRAM_LOADER_H
