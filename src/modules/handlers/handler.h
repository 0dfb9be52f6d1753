#ifndef TOKENFLOW_MODULES_HANDLERS_HANDLER_H
#define TOKENFLOW_MODULES_HANDLERS_HANDLER_H

#include "core/types/context.h"
#include "core/types/run_context.h"
#include <functional>
#include <string>
#include <utility>
#include <nlohmann/json.hpp>

namespace tokenflow {

struct HandlerResult {
    bool success = true;
    PortMap outputs;
    std::string message;

    static HandlerResult ok(PortMap outputs) { return {true, std::move(outputs), ""}; }
    static HandlerResult failure(std::string message) { return {false, {}, std::move(message)}; }
};

// Does the actual work of one node type. Called concurrently from worker threads;
// must not touch scheduler or token state. Exceptions are turned into failures.
class Handler {
public:
    virtual ~Handler() = default;
    virtual HandlerResult execute(const PortMap& inputs, const nlohmann::json& config, const RunContext& context) = 0;
};

using HandlerFunction = std::function<HandlerResult(const PortMap&, const nlohmann::json&, const RunContext&)>;

class FunctionHandler : public Handler {
public:
    explicit FunctionHandler(HandlerFunction func) : func_(std::move(func)) {}

    HandlerResult execute(const PortMap& inputs, const nlohmann::json& config, const RunContext& context) override {
        return func_(inputs, config, context);
    }

private:
    HandlerFunction func_;
};

} // namespace tokenflow

#endif // TOKENFLOW_MODULES_HANDLERS_HANDLER_H
