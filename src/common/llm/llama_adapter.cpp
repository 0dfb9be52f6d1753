#include "common/llm/llama_adapter.h"
#include "common/logging/logger.h"
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace tokenflow {

LlamaAdapter::LlamaAdapter(const Config& config)
    : config_(config),
      model_(nullptr, llama_model_free),
      ctx_(nullptr, llama_free),
      sampler_(nullptr, llama_sampler_free) {

    llama_model_params model_params = llama_model_default_params();
    model_params.n_gpu_layers = config_.n_gpu_layers;

    llama_model* raw_model = llama_model_load_from_file(config_.model_path.c_str(), model_params);
    if (!raw_model) {
        throw std::runtime_error("Failed to load model: " + config_.model_path);
    }
    model_.reset(raw_model);

    llama_context_params ctx_params = llama_context_default_params();
    ctx_params.n_ctx = config_.n_ctx;
    ctx_params.n_threads = config_.n_threads;
    ctx_params.n_threads_batch = config_.n_threads;

    llama_context* raw_ctx = llama_init_from_model(model_.get(), ctx_params);
    if (!raw_ctx) {
        throw std::runtime_error("Failed to create llama context for " + config_.model_path);
    }
    ctx_.reset(raw_ctx);

    auto smpl_params = llama_sampler_chain_default_params();
    llama_sampler* raw_sampler = llama_sampler_chain_init(smpl_params);
    llama_sampler_chain_add(raw_sampler, llama_sampler_init_min_p(config_.min_p, 1));
    llama_sampler_chain_add(raw_sampler, llama_sampler_init_temp(config_.temperature));
    llama_sampler_chain_add(raw_sampler, llama_sampler_init_dist(LLAMA_DEFAULT_SEED));
    sampler_.reset(raw_sampler);

    SPDLOG_LOGGER_INFO(logger(), "Loaded model {} (n_ctx={}, threads={})", config_.model_path, config_.n_ctx,
                       config_.n_threads);
}

LlamaAdapter::~LlamaAdapter() = default;

std::vector<llama_token> LlamaAdapter::tokenize(const std::string& text, bool add_bos) {
    const llama_vocab* vocab = llama_model_get_vocab(model_.get());
    // 第一次调用只取 token 数（返回负值）
    int32_t n_tokens = -llama_tokenize(vocab, text.data(), static_cast<int32_t>(text.size()),
                                       nullptr, 0, add_bos, true);
    if (n_tokens <= 0) return {};

    std::vector<llama_token> tokens(n_tokens);
    if (llama_tokenize(vocab, text.data(), static_cast<int32_t>(text.size()),
                       tokens.data(), n_tokens, add_bos, true) < 0) {
        return {};
    }
    return tokens;
}

std::string LlamaAdapter::detokenize(llama_token token) {
    const llama_vocab* vocab = llama_model_get_vocab(model_.get());
    char buf[256] = {0};
    int n = llama_token_to_piece(vocab, token, buf, sizeof(buf) - 1, 0, true);
    if (n < 0) return "";
    return std::string(buf, n);
}

std::string LlamaAdapter::generate(const std::string& prompt) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!is_loaded()) {
        throw std::runtime_error("Model not loaded");
    }

    llama_memory_t memory = llama_get_memory(ctx_.get());
    if (!config_.keep_context) {
        llama_memory_clear(memory, true);
    }
    const bool is_first = llama_memory_seq_pos_max(memory, 0) == -1;

    auto tokens = tokenize(prompt, is_first);
    if (tokens.empty()) {
        throw std::runtime_error("Tokenization failed");
    }
    const int n_ctx = static_cast<int>(llama_n_ctx(ctx_.get()));
    int n_past = static_cast<int>(llama_memory_seq_pos_max(memory, 0)) + 1;
    if (n_past + static_cast<int>(tokens.size()) >= n_ctx) {
        throw std::runtime_error("Prompt of " + std::to_string(tokens.size()) + " tokens does not fit n_ctx=" +
                                 std::to_string(n_ctx));
    }

    llama_batch batch = llama_batch_get_one(tokens.data(), static_cast<int32_t>(tokens.size()));
    if (llama_decode(ctx_.get(), batch)) {
        throw std::runtime_error("Prompt evaluation failed");
    }

    const llama_vocab* vocab = llama_model_get_vocab(model_.get());
    n_past += static_cast<int>(tokens.size());
    std::string response;
    for (int i = 0; i < config_.n_predict && n_past < n_ctx; ++i, ++n_past) {
        llama_token new_token = llama_sampler_sample(sampler_.get(), ctx_.get(), -1);
        if (llama_vocab_is_eog(vocab, new_token)) {
            break;
        }
        response += detokenize(new_token);

        batch = llama_batch_get_one(&new_token, 1);
        if (llama_decode(ctx_.get(), batch)) {
            SPDLOG_LOGGER_WARN(logger(), "Decode failed after {} generated tokens", i + 1);
            break;
        }
    }

    llama_sampler_reset(sampler_.get());
    return response;
}

bool LlamaAdapter::is_loaded() const {
    return model_ != nullptr && ctx_ != nullptr && sampler_ != nullptr;
}

LlamaAdapter::Config to_llama_config(const EngineConfig::Llm& llm) {
    LlamaAdapter::Config config;
    config.model_path = llm.model_path;
    config.n_ctx = llm.n_ctx;
    config.n_threads = llm.n_threads;
    config.n_gpu_layers = llm.n_gpu_layers;
    config.temperature = llm.temperature;
    config.min_p = llm.min_p;
    config.n_predict = llm.n_predict;
    return config;
}

TextGenerator make_text_generator(std::shared_ptr<LlamaAdapter> adapter) {
    if (!adapter) {
        throw std::invalid_argument("make_text_generator: null adapter");
    }
    return [adapter = std::move(adapter)](const std::string& prompt) { return adapter->generate(prompt); };
}

} // namespace tokenflow
