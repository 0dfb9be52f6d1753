// tests/test_scheduler.cpp
#include <catch2/catch_test_macros.hpp>
#include "test_helpers.h"
#include "modules/handlers/builtin_handlers.h"
#include "modules/scheduler/scheduler.h"
#include "modules/trace/trace_exporter.h"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>

using namespace tokenflow;
using tokenflow::test::link;
using tokenflow::test::node;

namespace {

using namespace std::chrono_literals;

Scheduler::Config fast_config() {
    Scheduler::Config config;
    config.max_workers = 4;
    config.poll_interval = 10ms;
    return config;
}

HandlerRegistry builtins() {
    HandlerRegistry registry;
    register_builtin_handlers(registry);
    return registry;
}

bool has_diagnostic(const ExecutionResult& result, Severity severity, const std::string& fragment) {
    return std::any_of(result.diagnostics.begin(), result.diagnostics.end(), [&](const Diagnostic& d) {
        return d.severity == severity && d.message.find(fragment) != std::string::npos;
    });
}

// Blocks until the run's cancellation token fires (or a generous safety limit passes)
HandlerResult wait_for_cancel(const RunContext& ctx) {
    const auto limit = std::chrono::steady_clock::now() + 5s;
    while (!ctx.is_cancelled() && std::chrono::steady_clock::now() < limit) {
        std::this_thread::sleep_for(5ms);
    }
    return HandlerResult::failure("cancelled");
}

// start -> work -> check ; check.condfalse -> work ; check.condtrue -> end
GraphDescription review_loop(nlohmann::json work_data, nlohmann::json check_data) {
    GraphDescription g;
    g.nodes = {node("start", "start"), node("work", "api_job", std::move(work_data)),
               node("check", "condition", std::move(check_data)), node("end", "endpoint")};
    g.connections = {link("start", "work"), link("work", "check"), link("check", "work", "condfalse"),
                     link("check", "end", "condtrue")};
    return g;
}

void register_drafter(HandlerRegistry& registry) {
    registry.register_handler(NodeType::API_JOB, [](const PortMap&, const nlohmann::json&, const RunContext& ctx) {
        return HandlerResult::ok({{"default", make_envelope("draft " + std::to_string(ctx.execution_number))}});
    });
}

} // namespace

TEST_CASE("start -> endpoint passes the run inputs through", "[scheduler]") {
    GraphDescription g;
    g.nodes = {node("start", "start"), node("end", "endpoint")};
    g.connections = {link("start", "end")};
    auto registry = builtins();

    Scheduler scheduler(test::compile(g), registry, fast_config());
    const ExecutionResult result = scheduler.run({{"topic", "tokens"}});

    REQUIRE(result.success);
    REQUIRE(result.status == RunStatus::COMPLETED);
    REQUIRE(result.final_epoch == 0);
    REQUIRE(result.nodes.at("start").execution_count == 1);
    REQUIRE(result.nodes.at("end").execution_count == 1);
    REQUIRE(result.nodes.at("end").status == NodeStatus::COMPLETED);
    REQUIRE(result.outputs["end"]["default"]["topic"] == "tokens");
    REQUIRE(!result.execution_id.empty());
}

TEST_CASE("Join waits for both branches before running", "[scheduler]") {
    GraphDescription g;
    g.nodes = {node("start", "start"), node("a", "api_job"), node("b", "api_job"),
               node("c", "code_job", {{"code", "merge"}}), node("end", "endpoint")};
    g.connections = {link("start", "a"), link("start", "b"), link("a", "c", std::nullopt, "a"),
                     link("b", "c", std::nullopt, "b"), link("c", "end")};

    auto registry = builtins();
    registry.register_handler(NodeType::API_JOB, [](const PortMap&, const nlohmann::json&, const RunContext& ctx) {
        if (ctx.node_id == "a") std::this_thread::sleep_for(30ms);
        return HandlerResult::ok({{"default", make_envelope(ctx.node_id)}});
    });
    registry.register_handler(NodeType::CODE_JOB, [](const PortMap& inputs, const nlohmann::json&, const RunContext&) {
        nlohmann::json merged = {{"a", *inputs.at("a")}, {"b", *inputs.at("b")}};
        return HandlerResult::ok({{"default", make_envelope(merged)}});
    });

    Scheduler scheduler(test::compile(g), registry, fast_config());
    const ExecutionResult result = scheduler.run();

    REQUIRE(result.success);
    REQUIRE(result.nodes.at("c").execution_count == 1);
    REQUIRE(result.outputs["end"]["default"] == nlohmann::json({{"a", "a"}, {"b", "b"}}));
}

TEST_CASE("Loop runs until max_iteration is reached", "[scheduler][loop]") {
    auto registry = builtins();
    register_drafter(registry);

    Scheduler scheduler(test::compile(review_loop({{"max_iteration", 3}},
                                                  {{"condition_type", "detect_max_iterations"}})),
                        registry, fast_config());
    const ExecutionResult result = scheduler.run();

    REQUIRE(result.success);
    REQUIRE(result.nodes.at("work").execution_count == 3);
    REQUIRE(result.nodes.at("check").execution_count == 3);
    REQUIRE(result.nodes.at("end").execution_count == 1);
    REQUIRE(result.final_epoch == 2);
    REQUIRE(result.outputs["end"]["default"] == "draft 3");
}

TEST_CASE("Exhausted loop drops the loop-back token", "[scheduler][loop]") {
    auto registry = builtins();
    register_drafter(registry);
    registry.register_handler(NodeType::CONDITION, [](const PortMap& inputs, const nlohmann::json&, const RunContext&) {
        return HandlerResult::ok({{"condfalse", merge_inputs(inputs)}});
    });

    Scheduler scheduler(test::compile(review_loop({{"max_iteration", 2}}, {{"expression", "false"}})),
                        registry, fast_config());
    const ExecutionResult result = scheduler.run();

    REQUIRE(result.success);
    REQUIRE(result.nodes.at("work").execution_count == 2);
    REQUIRE(result.nodes.at("end").status == NodeStatus::SKIPPED);
    REQUIRE(result.final_epoch == 1);
    REQUIRE(has_diagnostic(result, Severity::WARNING, "exhausted"));
}

TEST_CASE("max_epochs stops an unbounded loop", "[scheduler][loop]") {
    auto registry = builtins();
    register_drafter(registry);
    registry.register_handler(NodeType::CONDITION, [](const PortMap& inputs, const nlohmann::json&, const RunContext&) {
        return HandlerResult::ok({{"condfalse", merge_inputs(inputs)}});
    });

    auto config = fast_config();
    config.max_epochs = 3;
    Scheduler scheduler(test::compile(review_loop(nlohmann::json::object(), {{"expression", "false"}})),
                        registry, config);
    const ExecutionResult result = scheduler.run();

    REQUIRE(result.success);
    REQUIRE(result.final_epoch == 3);
    REQUIRE(result.nodes.at("work").execution_count == 4);
    REQUIRE(has_diagnostic(result, Severity::WARNING, "max_epochs"));
}

TEST_CASE("Failure is routed to the error port", "[scheduler][errors]") {
    GraphDescription g;
    g.nodes = {node("start", "start"), node("risky", "api_job"),
               node("recover", "code_job", {{"code", "fallback"}}),
               node("end", "endpoint", {{"join_policy", "any"}})};
    g.connections = {link("start", "risky"), link("risky", "end", std::nullopt, "ok"),
                     link("risky", "recover", "error"), link("recover", "end", std::nullopt, "recovered")};

    auto registry = builtins();
    registry.register_handler(NodeType::API_JOB, [](const PortMap&, const nlohmann::json&, const RunContext&) {
        return HandlerResult::failure("upstream unavailable");
    });
    registry.register_handler(NodeType::CODE_JOB, [](const PortMap& inputs, const nlohmann::json&, const RunContext&) {
        return HandlerResult::ok({{"default", make_envelope({{"handled", inputs.at("default")->at("error")}})}});
    });

    Scheduler scheduler(test::compile(g), registry, fast_config());
    const ExecutionResult result = scheduler.run();

    REQUIRE(result.success);
    REQUIRE(result.nodes.at("risky").status == NodeStatus::FAILED);
    REQUIRE(result.nodes.at("risky").error == "upstream unavailable");
    REQUIRE(result.nodes.at("recover").execution_count == 1);
    REQUIRE(result.nodes.at("end").execution_count == 1);
    REQUIRE(result.outputs["end"]["recovered"]["handled"] == "upstream unavailable");
    REQUIRE(has_diagnostic(result, Severity::WARNING, "error port"));
}

TEST_CASE("Unrouted failure fails the run", "[scheduler][errors]") {
    GraphDescription g;
    g.nodes = {node("start", "start"), node("bad", "api_job"), node("end", "endpoint")};
    g.connections = {link("start", "bad"), link("bad", "end")};

    auto registry = builtins();
    registry.register_handler(NodeType::API_JOB, [](const PortMap&, const nlohmann::json&, const RunContext&) -> HandlerResult {
        throw std::runtime_error("boom");
    });

    Scheduler scheduler(test::compile(g), registry, fast_config());
    const ExecutionResult result = scheduler.run();

    REQUIRE_FALSE(result.success);
    REQUIRE(result.status == RunStatus::FAILED);
    REQUIRE(result.nodes.at("bad").status == NodeStatus::FAILED);
    REQUIRE(result.nodes.at("end").status == NodeStatus::SKIPPED);
    REQUIRE(has_diagnostic(result, Severity::ERROR, "boom"));
    REQUIRE(result.to_json()["status"] == "failed");
}

TEST_CASE("Missing handler fails the node", "[scheduler][errors]") {
    GraphDescription g;
    g.nodes = {node("start", "start"), node("job", "api_job"), node("end", "endpoint")};
    g.connections = {link("start", "job"), link("job", "end")};
    auto registry = builtins();

    Scheduler scheduler(test::compile(g), registry, fast_config());
    const ExecutionResult result = scheduler.run();

    REQUIRE(result.status == RunStatus::FAILED);
    REQUIRE(result.nodes.at("job").status == NodeStatus::FAILED);
    REQUIRE(result.nodes.at("job").error.has_value());
}

TEST_CASE("Branching node emitting on both exclusive ports fails", "[scheduler][errors]") {
    GraphDescription g;
    g.nodes = {node("start", "start"), node("d", "condition", {{"expression", "true"}}),
               node("yes", "endpoint"), node("no", "endpoint")};
    g.connections = {link("start", "d"), link("d", "yes", "condtrue"), link("d", "no", "condfalse")};

    auto registry = builtins();
    registry.register_handler(NodeType::CONDITION, [](const PortMap&, const nlohmann::json&, const RunContext&) {
        return HandlerResult::ok({{"condtrue", make_envelope(1)}, {"condfalse", make_envelope(2)}});
    });

    Scheduler scheduler(test::compile(g), registry, fast_config());
    const ExecutionResult result = scheduler.run();

    REQUIRE(result.status == RunStatus::FAILED);
    REQUIRE(result.nodes.at("d").status == NodeStatus::FAILED);
    REQUIRE(result.nodes.at("yes").status == NodeStatus::SKIPPED);
    REQUIRE(result.nodes.at("no").status == NodeStatus::SKIPPED);
}

TEST_CASE("Bounded concurrency caps parallel runs of one node", "[scheduler][concurrency]") {
    GraphDescription g;
    g.nodes = {node("start", "start"),
               node("worker", "code_job", {{"code", "x"},
                                           {"join_policy", "any"},
                                           {"concurrency", {{"kind", "bounded"}, {"max_concurrent", 2}}}})};
    for (int i = 1; i <= 6; ++i) {
        const std::string id = "s" + std::to_string(i);
        g.nodes.push_back(node(id, "api_job"));
        g.connections.push_back(link("start", id));
        g.connections.push_back(link(id, "worker", std::nullopt, "p" + std::to_string(i)));
    }

    std::atomic<int> active{0};
    std::atomic<int> peak{0};
    auto registry = builtins();
    registry.register_handler(NodeType::API_JOB, [](const PortMap&, const nlohmann::json&, const RunContext& ctx) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5 * std::stoi(ctx.node_id.substr(1))));
        return HandlerResult::ok({{"default", make_envelope(ctx.node_id)}});
    });
    registry.register_handler(NodeType::CODE_JOB, [&](const PortMap& inputs, const nlohmann::json&, const RunContext&) {
        const int now = ++active;
        int seen = peak.load();
        while (now > seen && !peak.compare_exchange_weak(seen, now)) {}
        std::this_thread::sleep_for(30ms);
        --active;
        return HandlerResult::ok({{"default", merge_inputs(inputs)}});
    });

    Scheduler::Config config = fast_config();
    config.max_workers = 6;
    Scheduler scheduler(test::compile(g), registry, config);
    const ExecutionResult result = scheduler.run();

    REQUIRE(result.success);
    REQUIRE(result.nodes.at("worker").execution_count >= 1);
    REQUIRE(peak.load() >= 1);
    REQUIRE(peak.load() <= 2);
}

TEST_CASE("Cancel from another thread stops the run", "[scheduler][cancel]") {
    GraphDescription g;
    g.nodes = {node("start", "start"), node("slow", "api_job"), node("end", "endpoint")};
    g.connections = {link("start", "slow"), link("slow", "end")};

    auto registry = builtins();
    registry.register_handler(NodeType::API_JOB, [](const PortMap&, const nlohmann::json&, const RunContext& ctx) {
        return wait_for_cancel(ctx);
    });

    Scheduler scheduler(test::compile(g), registry, fast_config());
    std::thread canceller([&scheduler] {
        std::this_thread::sleep_for(50ms);
        scheduler.cancel();
    });
    const ExecutionResult result = scheduler.run();
    canceller.join();

    REQUIRE(result.status == RunStatus::CANCELLED);
    REQUIRE_FALSE(result.success);
    REQUIRE(result.nodes.at("slow").status == NodeStatus::FAILED);
    REQUIRE(result.nodes.at("end").status == NodeStatus::SKIPPED);
}

TEST_CASE("Node timeout fails the node and ignores the late result", "[scheduler][timeout]") {
    GraphDescription g;
    g.nodes = {node("start", "start"), node("slow", "api_job", {{"timeout_ms", 50}}), node("end", "endpoint")};
    g.connections = {link("start", "slow"), link("slow", "end")};

    auto registry = builtins();
    registry.register_handler(NodeType::API_JOB, [](const PortMap&, const nlohmann::json&, const RunContext& ctx) {
        return wait_for_cancel(ctx);
    });

    Scheduler scheduler(test::compile(g), registry, fast_config());
    const ExecutionResult result = scheduler.run();

    REQUIRE(result.status == RunStatus::FAILED);
    REQUIRE(result.nodes.at("slow").status == NodeStatus::FAILED);
    REQUIRE(result.nodes.at("slow").error->find("timed out") != std::string::npos);
    REQUIRE(result.nodes.at("end").status == NodeStatus::SKIPPED);
}

TEST_CASE("Run timeout ends the run as timed out", "[scheduler][timeout]") {
    GraphDescription g;
    g.nodes = {node("start", "start"), node("slow", "api_job"), node("end", "endpoint")};
    g.connections = {link("start", "slow"), link("slow", "end")};

    auto registry = builtins();
    registry.register_handler(NodeType::API_JOB, [](const PortMap&, const nlohmann::json&, const RunContext& ctx) {
        return wait_for_cancel(ctx);
    });

    auto config = fast_config();
    config.run_timeout = 100ms;
    Scheduler scheduler(test::compile(g), registry, config);
    const ExecutionResult result = scheduler.run();

    REQUIRE(result.status == RunStatus::TIMED_OUT);
    REQUIRE(result.message == "Execution timed out");
    REQUIRE(result.nodes.at("slow").status == NodeStatus::FAILED);
}

TEST_CASE("TraceExporter records node runs and epochs", "[scheduler][trace]") {
    auto registry = builtins();
    register_drafter(registry);

    TraceExporter trace("trace-1");
    Scheduler scheduler(test::compile(review_loop({{"max_iteration", 2}},
                                                  {{"condition_type", "detect_max_iterations"}})),
                        registry, fast_config());
    scheduler.add_observer(&trace);
    const ExecutionResult result = scheduler.run();
    REQUIRE(result.success);

    const auto traces = trace.get_traces();
    REQUIRE(traces.size() == 6); // start, work x2, check x2, end
    for (const auto& record : traces) {
        REQUIRE(record.trace_id == "trace-1");
        REQUIRE(record.status == "success");
        REQUIRE(record.end_time >= record.start_time);
    }
    REQUIRE(trace.get_epochs().size() == 1);
    REQUIRE(trace.get_epochs()[0].epoch == 1);
    REQUIRE(trace.get_epochs()[0].loop_head == "work");
    REQUIRE(trace.run_summary()["status"] == "completed");

    const auto j = trace.to_json();
    REQUIRE(j["traces"].size() == 6);
    trace.clear_traces();
    REQUIRE(trace.get_traces().empty());
}

TEST_CASE("Restored scheduler resumes without rerunning finished nodes", "[scheduler][snapshot]") {
    GraphDescription g;
    g.nodes = {node("start", "start"), node("end", "endpoint")};
    g.connections = {link("start", "end")};
    const auto diagram = test::compile(g);

    // state of a run that was interrupted right after start completed
    TokenManager tokens(diagram);
    tokens.publish_token(Edge{"start", "default", "end", "default"}, make_envelope({{"resumed", true}}), 0);
    RuntimeState state(*diagram);
    REQUIRE(state.try_admit("start", ConcurrencyPolicy::singleton()));
    state.begin_run("start", ConcurrencyPolicy::singleton());
    state.complete_run("start");

    auto registry = builtins();
    Scheduler scheduler(diagram, registry, fast_config());
    scheduler.restore({{"tokens", tokens.snapshot()}, {"runtime", state.snapshot()}});
    const ExecutionResult result = scheduler.run({{"resumed", false}});

    REQUIRE(result.success);
    REQUIRE(result.nodes.at("start").execution_count == 1);
    REQUIRE(result.nodes.at("end").execution_count == 1);
    REQUIRE(result.outputs["end"]["default"]["resumed"] == true);

    REQUIRE_THROWS_AS(scheduler.restore({{"tokens", tokens.snapshot()}, {"runtime", state.snapshot()}}),
                      std::logic_error);
}

TEST_CASE("Scheduler runs only once", "[scheduler]") {
    GraphDescription g;
    g.nodes = {node("start", "start"), node("end", "endpoint")};
    g.connections = {link("start", "end")};
    auto registry = builtins();

    Scheduler scheduler(test::compile(g), registry, fast_config());
    REQUIRE(scheduler.run().success);
    REQUIRE_THROWS_AS(scheduler.run(), std::logic_error);

    Scheduler::Config bad = fast_config();
    bad.max_workers = 0;
    REQUIRE_THROWS_AS(Scheduler(test::compile(g), registry, bad), std::invalid_argument);
}

TEST_CASE("Loop member with an input from outside the loop runs every iteration", "[scheduler][loop]") {
    // start -> a -> c -> cond ; start -> b -> c.ctx ; cond.condfalse -> a ; cond.condtrue -> end
    GraphDescription g;
    g.nodes = {node("start", "start"), node("a", "api_job", {{"max_iteration", 5}}), node("b", "api_job"),
               node("c", "code_job", {{"code", "x"}}), node("cond", "condition", {{"expression", "false"}}),
               node("end", "endpoint")};
    g.connections = {link("start", "a"), link("start", "b"), link("a", "c"), link("b", "c", std::nullopt, "ctx"),
                     link("c", "cond"), link("cond", "a", "condfalse"), link("cond", "end", "condtrue")};
    const auto diagram = test::compile(g);
    REQUIRE(diagram->node("c").join_policy == JoinPolicy::all());

    auto registry = builtins();
    registry.register_handler(NodeType::API_JOB, [](const PortMap&, const nlohmann::json&, const RunContext& ctx) {
        return HandlerResult::ok({{"default", make_envelope(ctx.node_id + " #" + std::to_string(ctx.execution_number))}});
    });
    registry.register_handler(NodeType::CODE_JOB, [](const PortMap& inputs, const nlohmann::json&, const RunContext&) {
        nlohmann::json out = {{"draft", *inputs.at("default")}, {"ctx", *inputs.at("ctx")}};
        return HandlerResult::ok({{"default", make_envelope(out)}});
    });
    registry.register_handler(NodeType::CONDITION, [](const PortMap& inputs, const nlohmann::json&, const RunContext& ctx) {
        const char* port = ctx.execution_number == 3 ? "condtrue" : "condfalse";
        return HandlerResult::ok({{port, merge_inputs(inputs)}});
    });

    Scheduler scheduler(diagram, registry, fast_config());
    const ExecutionResult result = scheduler.run();

    INFO(result.to_json().dump(2));
    REQUIRE(result.success);
    REQUIRE(result.final_epoch == 2);
    REQUIRE(result.nodes.at("a").execution_count == 3);
    REQUIRE(result.nodes.at("b").execution_count == 1);
    REQUIRE(result.nodes.at("c").execution_count == 3);
    REQUIRE(result.nodes.at("cond").execution_count == 3);
    REQUIRE(result.nodes.at("end").status == NodeStatus::COMPLETED);
    REQUIRE(result.outputs["end"]["default"]["draft"] == "a #3");
    REQUIRE(result.outputs["end"]["default"]["ctx"] == "b #1");
}

TEST_CASE("Every bounded loop member runs max_iteration times", "[scheduler][loop]") {
    // start -> work -> polish -> check ; check.condfalse -> work ; check.condtrue -> end
    GraphDescription g;
    g.nodes = {node("start", "start"), node("work", "api_job", {{"max_iteration", 3}}),
               node("polish", "code_job", {{"code", "x"}, {"max_iteration", 3}}),
               node("check", "condition", {{"condition_type", "detect_max_iterations"}}), node("end", "endpoint")};
    g.connections = {link("start", "work"), link("work", "polish"), link("polish", "check"),
                     link("check", "work", "condfalse"), link("check", "end", "condtrue")};
    const auto diagram = test::compile(g);
    REQUIRE(diagram->loops().size() == 1);
    REQUIRE(diagram->loops()[0].members.size() == 3);

    auto registry = builtins();
    register_drafter(registry);
    registry.register_handler(NodeType::CODE_JOB, [](const PortMap& inputs, const nlohmann::json&, const RunContext& ctx) {
        const std::string draft = inputs.at("default")->get<std::string>();
        return HandlerResult::ok({{"default", make_envelope(draft + " polished " + std::to_string(ctx.execution_number))}});
    });

    Scheduler scheduler(diagram, registry, fast_config());
    const ExecutionResult result = scheduler.run();

    REQUIRE(result.success);
    REQUIRE(result.final_epoch == 2);
    REQUIRE(result.nodes.at("work").execution_count == 3);
    REQUIRE(result.nodes.at("polish").execution_count == 3);
    REQUIRE(result.nodes.at("check").execution_count == 3);
    REQUIRE(result.nodes.at("end").execution_count == 1);
    REQUIRE(result.outputs["end"]["default"] == "draft 3 polished 3");
}

TEST_CASE("Timed out run keeps its slot until the handler returns", "[scheduler][timeout][concurrency]") {
    GraphDescription g;
    g.nodes = {node("start", "start"), node("w", "api_job", {{"join_policy", "any"}, {"timeout_ms", 50}}),
               node("x", "code_job", {{"code", "x"}}), node("end", "endpoint")};
    g.connections = {link("start", "w"), link("start", "x"), link("x", "w", std::nullopt, "late"),
                     link("w", "end")};

    std::atomic<int> active{0};
    std::atomic<int> peak{0};
    auto registry = builtins();
    // ignores cancellation
    registry.register_handler(NodeType::API_JOB, [&](const PortMap&, const nlohmann::json&, const RunContext&) {
        const int now = ++active;
        int seen = peak.load();
        while (now > seen && !peak.compare_exchange_weak(seen, now)) {}
        std::this_thread::sleep_for(300ms);
        --active;
        return HandlerResult::ok({{"default", make_envelope("late")}});
    });
    registry.register_handler(NodeType::CODE_JOB, [](const PortMap&, const nlohmann::json&, const RunContext&) {
        std::this_thread::sleep_for(100ms);
        return HandlerResult::ok({{"default", make_envelope("x")}});
    });

    Scheduler scheduler(test::compile(g), registry, fast_config());
    const ExecutionResult result = scheduler.run();

    REQUIRE(peak.load() == 1);
    REQUIRE(result.status == RunStatus::FAILED);
    REQUIRE(result.nodes.at("w").execution_count == 2);
    REQUIRE(result.nodes.at("w").status == NodeStatus::FAILED);
    REQUIRE(result.nodes.at("w").error->find("timed out") != std::string::npos);
    REQUIRE(result.nodes.at("end").status == NodeStatus::SKIPPED);
    REQUIRE(scheduler.state().get("w").in_flight == 0);
}

TEST_CASE("Scheduler with the default config", "[scheduler]") {
    GraphDescription g;
    g.nodes = {node("start", "start"), node("end", "endpoint")};
    g.connections = {link("start", "end")};
    auto registry = builtins();

    Scheduler scheduler(test::compile(g), registry);
    REQUIRE_FALSE(scheduler.execution_id().empty());
    REQUIRE(scheduler.run({{"k", 1}}).outputs["end"]["default"]["k"] == 1);
}
