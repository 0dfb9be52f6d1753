// tests/test_compiler.cpp
#include <catch2/catch_test_macros.hpp>
#include "test_helpers.h"
#include "core/types/errors.h"
#include "modules/compiler/diagram_compiler.h"
#include <algorithm>
#include <cstdint>

using namespace tokenflow;
using tokenflow::test::link;
using tokenflow::test::node;

namespace {

bool has_diagnostic(const Diagnostics& diagnostics, DiagnosticPhase phase, Severity severity,
                    const std::string& fragment) {
    return std::any_of(diagnostics.begin(), diagnostics.end(), [&](const Diagnostic& d) {
        return d.phase == phase && d.severity == severity && d.message.find(fragment) != std::string::npos;
    });
}

GraphDescription linear_graph() {
    GraphDescription g;
    g.nodes = {node("start", "start"), node("job", "code_job", {{"code", "return 1"}}), node("end", "endpoint")};
    g.connections = {link("start", "job"), link("job", "end")};
    return g;
}

// start -> work -> check ; check.condfalse -> work (loop) ; check.condtrue -> end
GraphDescription loop_graph() {
    GraphDescription g;
    g.nodes = {
        node("start", "start"),
        node("work", "code_job", {{"code", "x"}, {"max_iteration", 3}}),
        node("check", "condition", {{"condition_type", "detect_max_iterations"}}),
        node("end", "endpoint"),
    };
    g.connections = {
        link("start", "work"),
        link("work", "check"),
        link("check", "work", "condfalse"),
        link("check", "end", "condtrue"),
    };
    return g;
}

} // namespace

TEST_CASE("Linear diagram compiles with default policies", "[compiler]") {
    auto diagram = test::compile(linear_graph());

    REQUIRE(diagram->nodes().size() == 3);
    REQUIRE(diagram->edges().size() == 2);
    REQUIRE(diagram->start_node() == "start");
    REQUIRE(diagram->endpoints() == std::vector<NodeId>{"end"});
    REQUIRE(diagram->topological_order() == std::vector<NodeId>{"start", "job", "end"});
    REQUIRE(diagram->loops().empty());

    const Node& job = diagram->node("job");
    REQUIRE(job.join_policy == JoinPolicy::all());
    REQUIRE(job.concurrency_policy == ConcurrencyPolicy::singleton());
    REQUIRE(job.inputs == std::vector<PortName>{"default"});

    const auto edge = diagram->find_edge(Edge{"start", "default", "job", "default"});
    REQUIRE(edge.has_value());
    REQUIRE(diagram->edge(*edge).id == "connection_0");
    REQUIRE_FALSE(diagram->edge(*edge).loop_back);
    REQUIRE(diagram->outgoing("job").size() == 1);
    REQUIRE(diagram->incoming("job").size() == 1);
    REQUIRE(diagram->incoming_by_port("end").count("default") == 1);
}

TEST_CASE("Two start nodes fail validation and produce no diagram", "[compiler][scenario]") {
    GraphDescription g;
    g.nodes = {node("s1", "start"), node("s2", "start"), node("end", "endpoint")};
    g.connections = {link("s1", "end"), link("s2", "end")};

    auto result = DiagramCompiler().compile_with_diagnostics(g);
    REQUIRE_FALSE(result.success);
    REQUIRE(result.diagram == nullptr);
    REQUIRE(has_diagnostic(result.diagnostics, DiagnosticPhase::VALIDATION, Severity::ERROR, "start nodes"));

    REQUIRE_THROWS_AS(DiagramCompiler().compile(g), CompilationFailed);
    try {
        DiagramCompiler().compile(g);
    } catch (const CompilationFailed& e) {
        REQUIRE(has_errors(e.diagnostics()));
    }
}

TEST_CASE("Compiling the same description twice gives equal diagrams", "[compiler]") {
    const auto g = loop_graph();
    auto a = test::compile(g);
    auto b = test::compile(g);
    REQUIRE(a->structurally_equal(*b));
    REQUIRE(a->to_json() == b->to_json());
}

TEST_CASE("Validation errors", "[compiler]") {
    SECTION("empty diagram") {
        auto result = DiagramCompiler().compile_with_diagnostics(GraphDescription{});
        REQUIRE(has_diagnostic(result.diagnostics, DiagnosticPhase::VALIDATION, Severity::ERROR, "no nodes"));
    }
    SECTION("unknown type and duplicate id") {
        GraphDescription g;
        g.nodes = {node("start", "start"), node("x", "teleport"), node("start", "endpoint")};
        auto result = DiagramCompiler().compile_with_diagnostics(g);
        REQUIRE_FALSE(result.success);
        REQUIRE(has_diagnostic(result.diagnostics, DiagnosticPhase::VALIDATION, Severity::ERROR, "Unknown node type"));
        REQUIRE(has_diagnostic(result.diagnostics, DiagnosticPhase::VALIDATION, Severity::ERROR, "Duplicate node id"));
    }
    SECTION("missing start") {
        GraphDescription g;
        g.nodes = {node("end", "endpoint")};
        auto result = DiagramCompiler().compile_with_diagnostics(g);
        REQUIRE(has_diagnostic(result.diagnostics, DiagnosticPhase::VALIDATION, Severity::ERROR, "no start node"));
    }
    SECTION("dangling connection") {
        auto g = linear_graph();
        g.connections.push_back(link("job", "nowhere"));
        auto result = DiagramCompiler().compile_with_diagnostics(g);
        REQUIRE(has_diagnostic(result.diagnostics, DiagnosticPhase::VALIDATION, Severity::ERROR, "nowhere"));
    }
    SECTION("undeclared source port") {
        auto g = linear_graph();
        g.connections.push_back(link("job", "end", "summary"));
        auto result = DiagramCompiler().compile_with_diagnostics(g);
        REQUIRE(has_diagnostic(result.diagnostics, DiagnosticPhase::VALIDATION, Severity::ERROR,
                               "no output port 'summary'"));
    }
    SECTION("missing endpoint is only a warning") {
        GraphDescription g;
        g.nodes = {node("start", "start"), node("job", "code_job", {{"code", "x"}})};
        g.connections = {link("start", "job")};
        auto result = DiagramCompiler().compile_with_diagnostics(g);
        REQUIRE(result.success);
        REQUIRE(has_diagnostic(result.diagnostics, DiagnosticPhase::VALIDATION, Severity::WARNING, "no endpoint"));
    }
}

TEST_CASE("Connections into start or out of endpoint are edge building errors", "[compiler]") {
    auto g = linear_graph();
    g.connections.push_back(link("job", "start"));
    auto result = DiagramCompiler().compile_with_diagnostics(g);
    REQUIRE_FALSE(result.success);
    REQUIRE(has_diagnostic(result.diagnostics, DiagnosticPhase::EDGE_BUILDING, Severity::ERROR,
                           "cannot receive input"));
}

TEST_CASE("Diagnostics mode aggregates errors from several phases", "[compiler]") {
    auto g = linear_graph();
    g.nodes.push_back(node("ghost", "no_such_type"));
    g.connections.push_back(link("job", "start"));

    DiagramCompiler::Config config;
    config.mode = DiagramCompiler::Mode::DIAGNOSTICS;
    auto all = DiagramCompiler(config).compile_with_diagnostics(g);
    REQUIRE_FALSE(all.success);
    REQUIRE(has_diagnostic(all.diagnostics, DiagnosticPhase::VALIDATION, Severity::ERROR, "Unknown node type"));
    REQUIRE(has_diagnostic(all.diagnostics, DiagnosticPhase::EDGE_BUILDING, Severity::ERROR, "cannot receive"));

    auto first = DiagramCompiler().compile_with_diagnostics(g);
    REQUIRE(has_diagnostic(first.diagnostics, DiagnosticPhase::VALIDATION, Severity::ERROR, "Unknown node type"));
    REQUIRE_FALSE(has_diagnostic(first.diagnostics, DiagnosticPhase::EDGE_BUILDING, Severity::ERROR, "cannot receive"));
}

TEST_CASE("Transformation applies per-type descriptors", "[compiler]") {
    GraphDescription g;
    g.nodes = {
        node("start", "start", {{"position", {{"x", 1}, {"y", 2}}}}),
        node("ask", "person_job", {{"default_prompt", "hi"}, {"flipped", true}}),
        node("check", "condition", {{"expression", "true"}}),
        node("code", "code_job", {{"filePath", "a.py"}, {"functionName", "main"}}),
        node("db", "db", {{"subType", "fixed_prompt"}}),
        node("hook", "hook", {{"command", "ls"}}),
        node("end", "endpoint"),
    };
    g.connections = {
        link("start", "ask"), link("ask", "check"),
        link("check", "code", "condtrue"), link("check", "db", "condfalse"),
        link("code", "hook"), link("db", "end"), link("hook", "end", std::nullopt, "hooked"),
    };
    auto diagram = test::compile(g);

    REQUIRE_FALSE(diagram->node("start").config.contains("position"));
    const Node& ask = diagram->node("ask");
    REQUIRE(ask.config["max_iteration"] == 1);
    REQUIRE(ask.max_iteration == 1);
    REQUIRE_FALSE(ask.config.contains("flipped"));

    REQUIRE(diagram->node("check").config["condition_type"] == "custom");
    REQUIRE(diagram->node("check").config["skippable"] == false);

    const Node& code = diagram->node("code");
    REQUIRE(code.config["file_path"] == "a.py");
    REQUIRE(code.config["function_name"] == "main");
    REQUIRE_FALSE(code.config.contains("filePath"));

    REQUIRE(diagram->node("db").config["sub_type"] == "fixed_prompt");
    REQUIRE(diagram->node("db").config["format"] == "json");

    const Node& hook = diagram->node("hook");
    REQUIRE(hook.config["hook_type"] == "shell");
    REQUIRE(hook.config["timeout"] == 60);
    REQUIRE(hook.config["retry_count"] == 0);
    REQUIRE(hook.timeout_ms == 60000);

    REQUIRE(diagram->node("end").inputs == std::vector<PortName>{"default", "hooked"});
}

TEST_CASE("Custom transform table", "[compiler]") {
    NodeTransformTable table;
    TransformDescriptor descriptor;
    descriptor.renames = {{"tpl", "template"}};
    descriptor.defaults = {{"engine", "inja"}};
    descriptor.hook = [](const NodeId& id, nlohmann::json& data, Diagnostics& diagnostics) {
        data["seen_by_hook"] = id;
        diagnostics.push_back({DiagnosticPhase::TRANSFORMATION, Severity::INFO, "hooked", id, std::nullopt});
    };
    table.register_descriptor(NodeType::TEMPLATE_JOB, descriptor);

    GraphDescription g;
    g.nodes = {node("start", "start"), node("t", "template_job", {{"tpl", "x"}}), node("end", "endpoint")};
    g.connections = {link("start", "t"), link("t", "end")};

    DiagramCompiler::Config config;
    config.transform_table = &table;
    auto result = DiagramCompiler(config).compile_with_diagnostics(g);
    REQUIRE(result.success);
    const Node& t = result.diagram->node("t");
    REQUIRE(t.config["template"] == "x");
    REQUIRE(t.config["engine"] == "inja");
    REQUIRE(t.config["seen_by_hook"] == "t");
    REQUIRE(has_diagnostic(result.diagnostics, DiagnosticPhase::TRANSFORMATION, Severity::INFO, "hooked"));
}

TEST_CASE("Resolution by label, node:port reference and handle", "[compiler]") {
    GraphDescription g;
    RawNode start = node("n1", "start");
    start.label = "Begin";
    RawNode check = node("n2", "condition", {{"expression", "true"}});
    check.label = "Gate";
    g.nodes = {start, check, node("n3", "endpoint"), node("n4", "endpoint")};
    g.handles = {RawHandle{"h-false", "n2", "condfalse", "output"}};

    RawConnection labelled = link("Begin", "Gate");
    labelled.label = "question";
    g.connections = {labelled, link("Gate:condtrue", "n3"), link("h-false", "n4")};

    auto diagram = test::compile(g);
    REQUIRE(diagram->find_edge(Edge{"n1", "default", "n2", "question"}).has_value());
    REQUIRE(diagram->find_edge(Edge{"n2", "condtrue", "n3", "default"}).has_value());
    REQUIRE(diagram->find_edge(Edge{"n2", "condfalse", "n4", "default"}).has_value());
    REQUIRE(diagram->node("n2").label == "Gate");
}

TEST_CASE("Edges carry merged transforms and skippable flags", "[compiler]") {
    GraphDescription g;
    g.nodes = {
        node("start", "start"),
        node("ask", "person_job", {{"default_prompt", "p"}}),
        node("check", "condition", {{"expression", "true"}, {"skippable", true}}),
        node("a", "api_job"),
        node("b", "api_job"),
        node("end", "endpoint"),
    };
    g.connections = {
        link("start", "ask"),
        link("ask", "check", std::nullopt, std::nullopt, {{"transform", {{"content_type", "object"}, {"extract", "x"}}}}),
        link("check", "a", "condtrue"),
        link("check", "b", "condfalse"),
        link("a", "end", std::nullopt, std::nullopt, {{"skippable", true}}),
        link("b", "end", std::nullopt, "other"),
    };
    auto diagram = test::compile(g);

    const auto& ask_check = diagram->edge(*diagram->find_edge(Edge{"ask", "default", "check", "default"}));
    REQUIRE(ask_check.transform["content_type"] == "object");
    REQUIRE(ask_check.transform["extract"] == "x");
    REQUIRE_FALSE(ask_check.skippable);

    REQUIRE(diagram->edge(*diagram->find_edge(Edge{"check", "condtrue", "a", "default"})).skippable);
    REQUIRE(diagram->edge(*diagram->find_edge(Edge{"check", "condfalse", "b", "default"})).skippable);
    REQUIRE(diagram->edge(*diagram->find_edge(Edge{"a", "default", "end", "default"})).skippable);
    REQUIRE_FALSE(diagram->edge(*diagram->find_edge(Edge{"b", "default", "end", "other"})).skippable);
}

TEST_CASE("Duplicate connections collapse with a warning", "[compiler]") {
    auto g = linear_graph();
    g.connections.push_back(link("job", "end"));
    auto result = DiagramCompiler().compile_with_diagnostics(g);
    REQUIRE(result.success);
    REQUIRE(result.diagram->edges().size() == 2);
    REQUIRE(has_diagnostic(result.diagnostics, DiagnosticPhase::EDGE_BUILDING, Severity::WARNING, "Duplicate"));
}

TEST_CASE("Loop-back edges are classified and loops recorded", "[compiler][loop]") {
    auto diagram = test::compile(loop_graph());

    const auto back = diagram->find_edge(Edge{"check", "condfalse", "work", "default"});
    REQUIRE(back.has_value());
    REQUIRE(diagram->edge(*back).loop_back);
    REQUIRE_FALSE(diagram->edge(*diagram->find_edge(Edge{"work", "default", "check", "default"})).loop_back);

    REQUIRE(diagram->loops().size() == 1);
    const LoopInfo& loop = diagram->loops().front();
    REQUIRE(loop.back_edge == *back);
    REQUIRE(loop.head == "work");
    REQUIRE(loop.tail == "check");
    REQUIRE(loop.members == std::vector<NodeId>{"work", "check"});
    REQUIRE(diagram->loop_for_edge(*back) == &loop);
    REQUIRE(diagram->loops_containing("end").empty());

    // topological order ignores the loop-back edge
    REQUIRE(diagram->topological_order() == std::vector<NodeId>{"start", "work", "check", "end"});
    // two incoming edges, one of them loop-back
    REQUIRE(diagram->node("work").join_policy == JoinPolicy::any());
}

TEST_CASE("A cycle without branch or bound is rejected", "[compiler][loop]") {
    GraphDescription g;
    g.nodes = {node("start", "start"), node("a", "api_job"), node("b", "api_job"), node("end", "endpoint")};
    g.connections = {link("start", "a"), link("a", "b"), link("b", "a"), link("b", "end")};
    auto result = DiagramCompiler().compile_with_diagnostics(g);
    REQUIRE_FALSE(result.success);
    REQUIRE(has_diagnostic(result.diagnostics, DiagnosticPhase::OPTIMIZATION, Severity::ERROR, "Unrecognized cycle"));
}

TEST_CASE("Unreachable nodes are reported as warnings", "[compiler]") {
    auto g = linear_graph();
    g.nodes.push_back(node("island", "api_job"));
    auto result = DiagramCompiler().compile_with_diagnostics(g);
    REQUIRE(result.success);
    REQUIRE(has_diagnostic(result.diagnostics, DiagnosticPhase::OPTIMIZATION, Severity::WARNING, "unreachable"));
}

TEST_CASE("Default join policies", "[compiler][policy]") {
    SECTION("fan-in after a plain fan-out is ALL") {
        GraphDescription g;
        g.nodes = {node("start", "start"), node("x", "api_job"), node("y", "api_job"), node("end", "endpoint")};
        g.connections = {link("start", "x"), link("start", "y"), link("x", "end"), link("y", "end", std::nullopt, "y")};
        auto diagram = test::compile(g);
        REQUIRE(diagram->node("end").join_policy == JoinPolicy::all());
    }
    SECTION("fan-in below a branch is ANY") {
        GraphDescription g;
        g.nodes = {node("start", "start"), node("c", "condition", {{"expression", "true"}}),
                   node("x", "api_job"), node("y", "api_job"), node("end", "endpoint")};
        g.connections = {link("start", "c"), link("c", "x", "condtrue"), link("c", "y", "condfalse"),
                         link("x", "end"), link("y", "end", std::nullopt, "y")};
        auto diagram = test::compile(g);
        REQUIRE(diagram->node("end").join_policy == JoinPolicy::any());
        REQUIRE(diagram->node("x").join_policy == JoinPolicy::all());
    }
}

TEST_CASE("Explicit policies and their validation", "[compiler][policy]") {
    auto build = [](nlohmann::json join) {
        GraphDescription g;
        g.nodes = {node("start", "start"), node("x", "api_job"), node("y", "api_job"),
                   node("merge", "code_job", {{"code", "x"}, {"join_policy", std::move(join)},
                                              {"concurrency", {{"kind", "bounded"}, {"max_concurrent", 2}}}}),
                   node("end", "endpoint")};
        g.connections = {link("start", "x"), link("start", "y"), link("x", "merge", std::nullopt, "x"),
                         link("y", "merge", std::nullopt, "y"), link("merge", "end")};
        return g;
    };

    auto ok = test::compile(build("k_of_n:1"));
    REQUIRE(ok->node("merge").join_policy == JoinPolicy::k_of_n(1));
    REQUIRE(ok->node("merge").concurrency_policy == ConcurrencyPolicy::bounded(2));

    auto any = test::compile(build({{"kind", "any"}}));
    REQUIRE(any->node("merge").join_policy == JoinPolicy::any());

    auto too_many = DiagramCompiler().compile_with_diagnostics(build("k_of_n:3"));
    REQUIRE_FALSE(too_many.success);
    REQUIRE(has_diagnostic(too_many.diagnostics, DiagnosticPhase::ASSEMBLY, Severity::ERROR, "k_of_n"));

    auto unknown = DiagramCompiler().compile_with_diagnostics(build("most"));
    REQUIRE(has_diagnostic(unknown.diagnostics, DiagnosticPhase::TRANSFORMATION, Severity::ERROR,
                           "Unknown join policy"));
}

TEST_CASE("Integer settings outside int range are rejected", "[compiler][policy]") {
    auto with_work = [](nlohmann::json data) {
        GraphDescription g = linear_graph();
        data["code"] = "return 1";
        g.nodes[1].data = std::move(data);
        return DiagramCompiler().compile_with_diagnostics(g);
    };

    const auto wrapped = with_work({{"max_iteration", 4294967297LL}});
    REQUIRE_FALSE(wrapped.success);
    REQUIRE(has_diagnostic(wrapped.diagnostics, DiagnosticPhase::TRANSFORMATION, Severity::ERROR, "max_iteration"));

    const auto unsigned_big = with_work({{"timeout_ms", std::uint64_t{1} << 40}});
    REQUIRE_FALSE(unsigned_big.success);
    REQUIRE(has_diagnostic(unsigned_big.diagnostics, DiagnosticPhase::TRANSFORMATION, Severity::ERROR, "timeout_ms"));

    const auto bounded = with_work({{"concurrency", {{"kind", "bounded"}, {"max_concurrent", 8589934594LL}}}});
    REQUIRE_FALSE(bounded.success);
    REQUIRE(has_diagnostic(bounded.diagnostics, DiagnosticPhase::TRANSFORMATION, Severity::ERROR, "max_concurrent"));

    const auto fine = with_work({{"max_iteration", 2147483647LL}, {"timeout_ms", 2500}});
    REQUIRE(fine.success);
    REQUIRE(fine.diagram->node("job").max_iteration == 2147483647);
    REQUIRE(fine.diagram->node("job").timeout_ms == 2500);
}

TEST_CASE("Timeouts in seconds convert to milliseconds", "[compiler][policy]") {
    auto with_timeout = [](nlohmann::json seconds) {
        GraphDescription g = linear_graph();
        g.nodes[1].data["timeout"] = std::move(seconds);
        return DiagramCompiler().compile_with_diagnostics(g);
    };

    const auto ok = with_timeout(1.5);
    REQUIRE(ok.success);
    REQUIRE(ok.diagram->node("job").timeout_ms == 1500);
    REQUIRE(with_timeout(0.001).diagram->node("job").timeout_ms == 1);

    // would round to 0 ms, which means no timeout at all
    const auto tiny = with_timeout(0.0004);
    REQUIRE_FALSE(tiny.success);
    REQUIRE(has_diagnostic(tiny.diagnostics, DiagnosticPhase::TRANSFORMATION, Severity::ERROR, "at least 1 ms"));

    REQUIRE_FALSE(with_timeout(1e12).success);
    REQUIRE_FALSE(with_timeout(-2).success);
    REQUIRE_FALSE(with_timeout("soon").success);
}
