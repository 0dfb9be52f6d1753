#ifndef TOKENFLOW_TYPES_RUN_CONTEXT_H
#define TOKENFLOW_TYPES_RUN_CONTEXT_H

#include "context.h"
#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace tokenflow {

// Cooperative cancellation flag. A child is cancelled when it or any ancestor is.
class CancellationToken {
public:
    CancellationToken() : state_(std::make_shared<State>()) {}

    void cancel() const noexcept { state_->cancelled.store(true, std::memory_order_release); }

    bool is_cancelled() const noexcept {
        for (const State* s = state_.get(); s != nullptr; s = s->parent.get()) {
            if (s->cancelled.load(std::memory_order_acquire)) return true;
        }
        return false;
    }

    CancellationToken child() const {
        CancellationToken token;
        token.state_->parent = state_;
        return token;
    }

private:
    struct State {
        std::atomic<bool> cancelled{false};
        std::shared_ptr<const State> parent;
    };
    std::shared_ptr<State> state_;
};

// Handed to a handler for one run of one node
struct RunContext {
    std::string execution_id;
    NodeId node_id;
    Epoch epoch = 0;
    int execution_number = 1; // 1-based, per node
    CancellationToken cancellation;
    std::optional<std::chrono::steady_clock::time_point> deadline;
    std::map<PortName, nlohmann::json> input_transforms; // per input port, from the incoming edge
    std::shared_ptr<const nlohmann::json> run_inputs;     // initial inputs of the whole run
    bool loop_exhausted = false; // every bounded member of the node's loops reached max_iteration

    bool is_cancelled() const {
        return cancellation.is_cancelled() ||
               (deadline && std::chrono::steady_clock::now() >= *deadline);
    }
};

} // namespace tokenflow

#endif // TOKENFLOW_TYPES_RUN_CONTEXT_H
