#include "core/types/diagnostic.h"
#include "core/types/errors.h"
#include <sstream>

namespace tokenflow {

std::string to_string(DiagnosticPhase phase) {
    switch (phase) {
        case DiagnosticPhase::VALIDATION: return "validation";
        case DiagnosticPhase::TRANSFORMATION: return "transformation";
        case DiagnosticPhase::RESOLUTION: return "resolution";
        case DiagnosticPhase::EDGE_BUILDING: return "edge_building";
        case DiagnosticPhase::OPTIMIZATION: return "optimization";
        case DiagnosticPhase::ASSEMBLY: return "assembly";
        case DiagnosticPhase::EXECUTION: return "execution";
    }
    return "unknown";
}

std::string to_string(Severity severity) {
    switch (severity) {
        case Severity::ERROR: return "error";
        case Severity::WARNING: return "warning";
        case Severity::INFO: return "info";
    }
    return "unknown";
}

std::string to_string(const Diagnostic& diagnostic) {
    std::ostringstream oss;
    oss << "[" << to_string(diagnostic.phase) << "/" << to_string(diagnostic.severity) << "] "
        << diagnostic.message;
    if (diagnostic.node_id) oss << " (node: " << *diagnostic.node_id << ")";
    if (diagnostic.edge_id) oss << " (edge: " << *diagnostic.edge_id << ")";
    return oss.str();
}

nlohmann::json to_json(const Diagnostic& diagnostic) {
    nlohmann::json j;
    j["phase"] = to_string(diagnostic.phase);
    j["severity"] = to_string(diagnostic.severity);
    j["message"] = diagnostic.message;
    j["node_id"] = diagnostic.node_id ? nlohmann::json(*diagnostic.node_id) : nlohmann::json(nullptr);
    j["edge_id"] = diagnostic.edge_id ? nlohmann::json(*diagnostic.edge_id) : nlohmann::json(nullptr);
    return j;
}

namespace {

std::string summarize(const Diagnostics& diagnostics) {
    std::ostringstream oss;
    oss << "Compilation failed";
    size_t errors = 0;
    for (const auto& d : diagnostics) {
        if (!d.is_error()) continue;
        oss << (errors == 0 ? ": " : "; ") << to_string(d);
        ++errors;
    }
    return oss.str();
}

} // namespace

CompilationFailed::CompilationFailed(Diagnostics diagnostics)
    : std::runtime_error(summarize(diagnostics)), diagnostics_(std::move(diagnostics)) {}

} // namespace tokenflow
