#ifndef TOKENFLOW_COMMON_CONFIG_ENGINE_CONFIG_H
#define TOKENFLOW_COMMON_CONFIG_ENGINE_CONFIG_H

#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace tokenflow {

struct EngineConfig {
    // scheduler
    int max_workers = 4;
    std::optional<int> run_timeout_ms;
    std::optional<int> default_node_timeout_ms;
    int poll_interval_ms = 50;
    int max_epochs = 1000;
    bool stop_when_endpoints_complete = true;

    // compiler: "fail_fast" / "diagnostics"
    std::string compile_mode = "fail_fast";

    std::string log_level = "info";

    struct Llm {
        std::string model_path; // empty: person_job is not registered
        int n_ctx = 2048;
        int n_threads = 4;
        int n_gpu_layers = 99;
        float temperature = 0.7f;
        float min_p = 0.05f;
        int n_predict = 512;
    } llm;
};

// Missing keys keep their defaults; wrong types or out-of-range values throw ConfigError.
// `base_dir` resolves a relative llm.model_path.
EngineConfig engine_config_from_json(const nlohmann::json& j, const std::string& base_dir = "");

// Throws ConfigError if the file cannot be read or parsed
EngineConfig load_engine_config(const std::string& path);

nlohmann::json to_json(const EngineConfig& config);

} // namespace tokenflow

#endif // TOKENFLOW_COMMON_CONFIG_ENGINE_CONFIG_H
