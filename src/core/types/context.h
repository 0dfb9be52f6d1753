#ifndef TOKENFLOW_TYPES_CONTEXT_H
#define TOKENFLOW_TYPES_CONTEXT_H

#include <nlohmann/json.hpp>
#include <map>
#include <memory>
#include <string>

namespace tokenflow {

// 使用 nlohmann::json 作为统一的数据类型
using Value = nlohmann::json;

// Opaque payload carried by tokens. The core stores and forwards it, never inspects it.
using Envelope = nlohmann::json;
using EnvelopePtr = std::shared_ptr<const Envelope>;

using NodeId = std::string;
using PortName = std::string;
using Epoch = int;
using Sequence = int;

// Port -> payload, as handed to and returned by handlers
using PortMap = std::map<PortName, EnvelopePtr>;

inline EnvelopePtr make_envelope(Envelope value) {
    return std::make_shared<const Envelope>(std::move(value));
}

} // namespace tokenflow

#endif // TOKENFLOW_TYPES_CONTEXT_H
