#ifndef TOKENFLOW_MODULES_HANDLERS_HANDLER_REGISTRY_H
#define TOKENFLOW_MODULES_HANDLERS_HANDLER_REGISTRY_H

#include "core/types/node.h"
#include "modules/handlers/handler.h"
#include <memory>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

namespace tokenflow {

// NodeType -> Handler. Filled before a run; read-only while the scheduler runs.
class HandlerRegistry {
public:
    HandlerRegistry() = default;

    void register_handler(NodeType type, std::shared_ptr<Handler> handler);

    template<typename Func,
             typename = std::enable_if_t<std::is_invocable_r_v<HandlerResult, Func&,
                                                                const PortMap&, const nlohmann::json&,
                                                                const RunContext&>>>
    void register_handler(NodeType type, Func&& func) {
        register_handler(type, std::make_shared<FunctionHandler>(HandlerFunction(std::forward<Func>(func))));
    }

    bool has_handler(NodeType type) const;
    // Throws HandlerNotFound
    std::shared_ptr<Handler> handler_for(NodeType type) const;
    std::vector<NodeType> registered_types() const;

private:
    std::unordered_map<NodeType, std::shared_ptr<Handler>> handlers_;
};

} // namespace tokenflow

#endif // TOKENFLOW_MODULES_HANDLERS_HANDLER_REGISTRY_H
