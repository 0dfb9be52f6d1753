#ifndef TOKENFLOW_MODULES_HANDLERS_PERSON_JOB_HANDLER_H
#define TOKENFLOW_MODULES_HANDLERS_PERSON_JOB_HANDLER_H

#include "modules/handlers/handler.h"
#include <functional>
#include <mutex>
#include <string>

namespace tokenflow {

// prompt -> completion
using TextGenerator = std::function<std::string(const std::string&)>;

// person_job: renders first_only_prompt (first execution) or default_prompt, prefixed by
// system_prompt, and emits the generated text on "default".
class PersonJobHandler : public Handler {
public:
    explicit PersonJobHandler(TextGenerator generator);

    HandlerResult execute(const PortMap& inputs, const nlohmann::json& config, const RunContext& context) override;

    static std::string build_prompt(const PortMap& inputs, const nlohmann::json& config, const RunContext& context);

private:
    TextGenerator generator_;
    std::mutex mutex_; // one generation at a time
};

} // namespace tokenflow

#endif // TOKENFLOW_MODULES_HANDLERS_PERSON_JOB_HANDLER_H
