#ifndef TOKENFLOW_MODULES_COMPILER_DIAGRAM_COMPILER_H
#define TOKENFLOW_MODULES_COMPILER_DIAGRAM_COMPILER_H

#include "core/types/diagnostic.h"
#include "core/types/graph_description.h"
#include "modules/compiler/executable_diagram.h"
#include "modules/compiler/node_transform_table.h"
#include <memory>

namespace tokenflow {

struct CompilationResult {
    bool success = false;
    std::shared_ptr<const ExecutableDiagram> diagram; // null unless success
    Diagnostics diagnostics;
};

struct CompilationContext;

// validate -> transform -> resolve -> build edges -> optimize -> assemble
class DiagramCompiler {
public:
    enum class Mode {
        FAIL_FAST,  // stop after the first phase that reports an error
        DIAGNOSTICS // run every phase and aggregate all diagnostics
    };

    struct Config {
        Mode mode = Mode::FAIL_FAST;
        const NodeTransformTable* transform_table = nullptr; // nullptr: NodeTransformTable::builtin()
    };

    DiagramCompiler();
    explicit DiagramCompiler(Config config);

    // Throws CompilationFailed if any error-level diagnostic is produced
    std::shared_ptr<const ExecutableDiagram> compile(const GraphDescription& graph) const;

    CompilationResult compile_with_diagnostics(const GraphDescription& graph) const;

private:
    Config config_;

    void validate(CompilationContext& ctx) const;
    void transform(CompilationContext& ctx) const;
    void resolve(CompilationContext& ctx) const;
    void build_edges(CompilationContext& ctx) const;
    void optimize(CompilationContext& ctx) const;
    void assemble(CompilationContext& ctx) const;
};

} // namespace tokenflow

#endif // TOKENFLOW_MODULES_COMPILER_DIAGRAM_COMPILER_H
