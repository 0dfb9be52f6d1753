// main.cpp
#include "tokenflow/core/engine.h"
#include "common/logging/logger.h"
#include "core/types/errors.h"
#include "modules/trace/trace_exporter.h"
#include <atomic>
#include <chrono>
#include <csignal>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <nlohmann/json.hpp>
#ifdef TOKENFLOW_WITH_LLAMA
#include "common/llm/llama_adapter.h"
#endif

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

void on_sigint(int) {
    g_interrupted = 1;
}

// engine->cancel() locks, so it is called from here rather than from the signal handler
class InterruptWatcher {
public:
    explicit InterruptWatcher(tokenflow::WorkflowEngine& engine)
        : thread_([this, &engine] {
              while (!stop_.load()) {
                  if (g_interrupted) engine.cancel(); // repeated until run() returns
                  std::this_thread::sleep_for(std::chrono::milliseconds(50));
              }
          }) {}

    ~InterruptWatcher() {
        stop_ = true;
        thread_.join();
    }

    InterruptWatcher(const InterruptWatcher&) = delete;
    InterruptWatcher& operator=(const InterruptWatcher&) = delete;

private:
    std::atomic<bool> stop_{false};
    std::thread thread_;
};

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " <diagram.yaml|json> [options]\n"
              << "  --config <engine.json>   engine configuration\n"
              << "  --inputs <inputs.json>   initial inputs for the start node\n"
              << "  --input <key>=<value>    single initial input (repeatable)\n"
              << "  --trace <trace.json>     write the execution trace\n"
              << "  --log-level <level>      trace/debug/info/warn/error/off\n";
}

nlohmann::json read_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    nlohmann::json j;
    file >> j;
    return j;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string diagram_path;
    std::string config_path;
    std::string trace_path;
    std::string log_level;
    nlohmann::json inputs = nlohmann::json::object();

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            auto next = [&]() -> std::string {
                if (i + 1 >= argc) throw std::runtime_error("Missing value for " + arg);
                return argv[++i];
            };
            if (arg == "--config") {
                config_path = next();
            } else if (arg == "--inputs") {
                inputs.update(read_json_file(next()));
            } else if (arg == "--input") {
                const std::string kv = next();
                const auto eq = kv.find('=');
                if (eq == std::string::npos) throw std::runtime_error("--input expects key=value, got " + kv);
                inputs[kv.substr(0, eq)] = kv.substr(eq + 1);
            } else if (arg == "--trace") {
                trace_path = next();
            } else if (arg == "--log-level") {
                log_level = next();
            } else if (arg == "-h" || arg == "--help") {
                print_usage(argv[0]);
                return 0;
            } else if (diagram_path.empty()) {
                diagram_path = arg;
            } else {
                throw std::runtime_error("Unexpected argument: " + arg);
            }
        }
        if (diagram_path.empty()) {
            print_usage(argv[0]);
            return 1;
        }

        // 1. 配置
        tokenflow::EngineConfig config;
        if (!config_path.empty()) config = tokenflow::load_engine_config(config_path);
        if (!log_level.empty()) config.log_level = log_level;

        // 2. 加载 + 编译
        auto engine = tokenflow::WorkflowEngine::from_file(diagram_path, config);

#ifdef TOKENFLOW_WITH_LLAMA
        if (!config.llm.model_path.empty()) {
            auto adapter = std::make_shared<tokenflow::LlamaAdapter>(tokenflow::to_llama_config(config.llm));
            engine->set_text_generator(tokenflow::make_text_generator(adapter));
        }
#endif

        tokenflow::TraceExporter tracer;
        engine->add_observer(&tracer);

        std::signal(SIGINT, on_sigint);

        // 3. 执行
        tokenflow::ExecutionResult result;
        {
            InterruptWatcher watcher(*engine);
            result = engine->run(inputs);
        }

        // 4. 输出结果
        std::cout << result.to_json().dump(2) << std::endl;

        // 5. 导出 Trace
        if (!trace_path.empty()) {
            std::ofstream trace_file(trace_path);
            if (!trace_file.is_open()) {
                std::cerr << "Cannot write trace to " << trace_path << std::endl;
                return 1;
            }
            trace_file << tracer.to_json().dump(2) << std::endl;
            std::cerr << "Trace exported to " << trace_path << " (" << tracer.get_traces().size() << " records)\n";
        }
        return result.success ? 0 : 2;

    } catch (const tokenflow::CompilationFailed& e) {
        std::cerr << e.what() << std::endl;
        for (const auto& d : e.diagnostics()) {
            std::cerr << "  " << tokenflow::to_string(d) << std::endl;
        }
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[FATAL] " << e.what() << std::endl;
        return 1;
    }
}
