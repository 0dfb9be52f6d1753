#ifndef TOKENFLOW_TYPES_ERRORS_H
#define TOKENFLOW_TYPES_ERRORS_H

#include "diagnostic.h"
#include <stdexcept>
#include <string>

namespace tokenflow {

// Thrown by DiagramCompiler::compile when any error-level diagnostic exists
class CompilationFailed : public std::runtime_error {
public:
    explicit CompilationFailed(Diagnostics diagnostics);

    const Diagnostics& diagnostics() const noexcept { return diagnostics_; }

private:
    Diagnostics diagnostics_;
};

// Engine bug: partial consumption, over-admission, cursor regression.
// Aborts the run; never caused by a workflow mistake.
class SchedulerInvariantError : public std::logic_error {
public:
    explicit SchedulerInvariantError(const std::string& what)
        : std::logic_error("Scheduler invariant violated: " + what) {}
};

class HandlerNotFound : public std::runtime_error {
public:
    explicit HandlerNotFound(const std::string& node_type)
        : std::runtime_error("No handler registered for node type: " + node_type) {}
};

// Malformed diagram document (YAML/JSON syntax or shape)
class DiagramLoadError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace tokenflow

#endif // TOKENFLOW_TYPES_ERRORS_H
