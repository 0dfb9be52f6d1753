#ifndef TOKENFLOW_COMMON_UTILS_YAML_JSON_H
#define TOKENFLOW_COMMON_UTILS_YAML_JSON_H

#include <string>
#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

namespace tokenflow {

// YAML::Node -> nlohmann::json. Quoted scalars stay strings; plain scalars are typed.
nlohmann::json yaml_to_json(const YAML::Node& node);

// JSON is a YAML subset, so one entry point parses both. Throws YAML::Exception.
nlohmann::json parse_yaml_or_json(const std::string& text);

} // namespace tokenflow

#endif // TOKENFLOW_COMMON_UTILS_YAML_JSON_H
