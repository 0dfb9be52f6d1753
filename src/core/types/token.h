#ifndef TOKENFLOW_TYPES_TOKEN_H
#define TOKENFLOW_TYPES_TOKEN_H

#include "context.h"
#include "edge.h"
#include <chrono>
#include <string>
#include <nlohmann/json.hpp>

namespace tokenflow {

// Immutable unit of data flowing along one edge within one epoch
struct Token {
    std::string id;
    Edge edge;
    Epoch epoch = 0;
    Sequence sequence = 0; // 1-based, per (edge, epoch)
    EnvelopePtr payload;
    std::chrono::system_clock::time_point timestamp;
    nlohmann::json metadata = nlohmann::json::object();
};

} // namespace tokenflow

#endif // TOKENFLOW_TYPES_TOKEN_H
