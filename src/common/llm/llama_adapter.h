#ifndef TOKENFLOW_COMMON_LLM_LLAMA_ADAPTER_H
#define TOKENFLOW_COMMON_LLM_LLAMA_ADAPTER_H

#include "common/config/engine_config.h"
#include "modules/handlers/person_job_handler.h"
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <llama.h>

namespace tokenflow {

class LlamaAdapter {
public:
    struct Config {
        std::string model_path;
        int n_ctx = 2048;
        int n_threads = 4;
        int n_gpu_layers = 99;
        float temperature = 0.7f;
        float min_p = 0.05f;
        int n_predict = 512;
        bool keep_context = false; // false: every generate() starts from an empty KV cache
    };

    // Throws std::runtime_error when the model or context cannot be created
    explicit LlamaAdapter(const Config& config);
    ~LlamaAdapter();

    LlamaAdapter(const LlamaAdapter&) = delete;
    LlamaAdapter& operator=(const LlamaAdapter&) = delete;

    // Serialised; one llama_context per adapter
    std::string generate(const std::string& prompt);
    bool is_loaded() const;
    const Config& config() const { return config_; }

private:
    Config config_;
    std::unique_ptr<llama_model, decltype(&llama_model_free)> model_;
    std::unique_ptr<llama_context, decltype(&llama_free)> ctx_;
    std::unique_ptr<llama_sampler, decltype(&llama_sampler_free)> sampler_;
    std::mutex mutex_;

    std::vector<llama_token> tokenize(const std::string& text, bool add_bos);
    std::string detokenize(llama_token token);
};

LlamaAdapter::Config to_llama_config(const EngineConfig::Llm& llm);

// Adapter-backed generator for PersonJobHandler
TextGenerator make_text_generator(std::shared_ptr<LlamaAdapter> adapter);

} // namespace tokenflow

#endif // TOKENFLOW_COMMON_LLM_LLAMA_ADAPTER_H
