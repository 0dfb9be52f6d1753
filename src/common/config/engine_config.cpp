#include "common/config/engine_config.h"
#include "core/types/errors.h"
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <limits>

namespace tokenflow {

namespace {

// Reads j[key] into out when present; ConfigError on a type mismatch
template<typename T>
void read_field(const nlohmann::json& j, const char* key, T& out, const std::string& scope) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return;
    try {
        out = it->get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError("Invalid value for '" + scope + key + "': " + e.what());
    }
}

// get<int> would silently wrap a value outside int range
template<>
void read_field<int>(const nlohmann::json& j, const char* key, int& out, const std::string& scope) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return;
    if (!it->is_number_integer()) {
        throw ConfigError("Invalid value for '" + scope + key + "': expected an integer, got " + it->dump());
    }
    const bool fits = it->is_number_unsigned()
        ? it->get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<int>::max())
        : it->get<std::int64_t>() >= std::numeric_limits<int>::min() &&
          it->get<std::int64_t>() <= std::numeric_limits<int>::max();
    if (!fits) {
        throw ConfigError("Invalid value for '" + scope + key + "': " + it->dump() + " is out of range");
    }
    out = it->get<int>();
}

void read_optional_ms(const nlohmann::json& j, const char* key, std::optional<int>& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return;
    const bool positive = it->is_number_unsigned() ? it->get<std::uint64_t>() > 0
                                                   : it->is_number_integer() && it->get<std::int64_t>() > 0;
    if (!positive) {
        throw ConfigError(std::string("'") + key + "' must be a positive integer (milliseconds)");
    }
    int ms = 0;
    read_field(j, key, ms, "");
    out = ms;
}

void require_positive(int value, const char* key) {
    if (value < 1) throw ConfigError(std::string("'") + key + "' must be >= 1");
}

} // namespace

EngineConfig engine_config_from_json(const nlohmann::json& j, const std::string& base_dir) {
    namespace fs = std::filesystem;

    if (!j.is_object()) {
        throw ConfigError("Engine configuration must be a JSON object");
    }

    EngineConfig config;
    read_field(j, "max_workers", config.max_workers, "");
    read_optional_ms(j, "run_timeout_ms", config.run_timeout_ms);
    read_optional_ms(j, "default_node_timeout_ms", config.default_node_timeout_ms);
    read_field(j, "poll_interval_ms", config.poll_interval_ms, "");
    read_field(j, "max_epochs", config.max_epochs, "");
    read_field(j, "stop_when_endpoints_complete", config.stop_when_endpoints_complete, "");
    read_field(j, "compile_mode", config.compile_mode, "");
    read_field(j, "log_level", config.log_level, "");

    require_positive(config.max_workers, "max_workers");
    require_positive(config.poll_interval_ms, "poll_interval_ms");
    require_positive(config.max_epochs, "max_epochs");
    if (config.compile_mode != "fail_fast" && config.compile_mode != "diagnostics") {
        throw ConfigError("'compile_mode' must be \"fail_fast\" or \"diagnostics\", got \"" + config.compile_mode + "\"");
    }

    if (auto it = j.find("llm"); it != j.end() && !it->is_null()) {
        if (!it->is_object()) throw ConfigError("'llm' must be an object");
        const nlohmann::json& llm = *it;
        read_field(llm, "model_path", config.llm.model_path, "llm.");
        read_field(llm, "n_ctx", config.llm.n_ctx, "llm.");
        read_field(llm, "n_threads", config.llm.n_threads, "llm.");
        read_field(llm, "n_gpu_layers", config.llm.n_gpu_layers, "llm.");
        read_field(llm, "temperature", config.llm.temperature, "llm.");
        read_field(llm, "min_p", config.llm.min_p, "llm.");
        read_field(llm, "n_predict", config.llm.n_predict, "llm.");

        // 相对路径按配置文件所在目录解析
        if (!config.llm.model_path.empty() && fs::path(config.llm.model_path).is_relative() && !base_dir.empty()) {
            config.llm.model_path = fs::absolute(fs::path(base_dir) / config.llm.model_path).string();
        }
    }
    return config;
}

EngineConfig load_engine_config(const std::string& path) {
    namespace fs = std::filesystem;

    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Cannot open config file: " + path);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("Malformed config file " + path + ": " + e.what());
    }

    fs::path dir = fs::path(path).parent_path();
    if (dir.empty()) dir = ".";
    return engine_config_from_json(j, dir.string());
}

nlohmann::json to_json(const EngineConfig& config) {
    nlohmann::json j = {
        {"max_workers", config.max_workers},
        {"poll_interval_ms", config.poll_interval_ms},
        {"max_epochs", config.max_epochs},
        {"stop_when_endpoints_complete", config.stop_when_endpoints_complete},
        {"compile_mode", config.compile_mode},
        {"log_level", config.log_level},
        {"llm", {
            {"model_path", config.llm.model_path},
            {"n_ctx", config.llm.n_ctx},
            {"n_threads", config.llm.n_threads},
            {"n_gpu_layers", config.llm.n_gpu_layers},
            {"temperature", config.llm.temperature},
            {"min_p", config.llm.min_p},
            {"n_predict", config.llm.n_predict}
        }}
    };
    if (config.run_timeout_ms) j["run_timeout_ms"] = *config.run_timeout_ms;
    if (config.default_node_timeout_ms) j["default_node_timeout_ms"] = *config.default_node_timeout_ms;
    return j;
}

} // namespace tokenflow
