#ifndef TOKENFLOW_TYPES_DIAGNOSTIC_H
#define TOKENFLOW_TYPES_DIAGNOSTIC_H

#include "context.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace tokenflow {

enum class DiagnosticPhase : uint8_t {
    VALIDATION,
    TRANSFORMATION,
    RESOLUTION,
    EDGE_BUILDING,
    OPTIMIZATION,
    ASSEMBLY,
    EXECUTION // runtime failures reported by the scheduler
};

enum class Severity : uint8_t { ERROR, WARNING, INFO };

struct Diagnostic {
    DiagnosticPhase phase = DiagnosticPhase::VALIDATION;
    Severity severity = Severity::ERROR;
    std::string message;
    std::optional<NodeId> node_id;
    std::optional<std::string> edge_id;

    bool is_error() const { return severity == Severity::ERROR; }
};

using Diagnostics = std::vector<Diagnostic>;

std::string to_string(DiagnosticPhase phase);
std::string to_string(Severity severity);
std::string to_string(const Diagnostic& diagnostic);
nlohmann::json to_json(const Diagnostic& diagnostic);

inline bool has_errors(const Diagnostics& diagnostics) {
    for (const auto& d : diagnostics) {
        if (d.is_error()) return true;
    }
    return false;
}

} // namespace tokenflow

#endif // TOKENFLOW_TYPES_DIAGNOSTIC_H
