#include "modules/handlers/handler_registry.h"
#include "core/types/errors.h"
#include <stdexcept>

namespace tokenflow {

void HandlerRegistry::register_handler(NodeType type, std::shared_ptr<Handler> handler) {
    if (!handler) {
        throw std::invalid_argument("Cannot register a null handler for " + to_string(type));
    }
    handlers_[type] = std::move(handler);
}

bool HandlerRegistry::has_handler(NodeType type) const {
    return handlers_.count(type) > 0;
}

std::shared_ptr<Handler> HandlerRegistry::handler_for(NodeType type) const {
    auto it = handlers_.find(type);
    if (it == handlers_.end()) {
        throw HandlerNotFound(to_string(type));
    }
    return it->second;
}

std::vector<NodeType> HandlerRegistry::registered_types() const {
    std::vector<NodeType> types;
    for (NodeType type : kAllNodeTypes) {
        if (has_handler(type)) types.push_back(type);
    }
    return types;
}

} // namespace tokenflow
