#include <benchmark/benchmark.h>
#include "clinmcp/catalog.hpp"
#include "clinmcp/discovery.hpp"
#include "clinmcp/dispatcher.hpp"
#include "clinmcp/docstring.hpp"
#include "clinmcp/router.hpp"
#include "clinmcp/server.hpp"
#include <memory>
#include <string>

using namespace clinmcp;

// Create a router with N methods registered
static std::unique_ptr<Router> make_router(int n_methods) {
    auto router = std::make_unique<Router>();
    for (int i = 0; i < n_methods; ++i) {
        router->on_request("method_" + std::to_string(i),
            [](const nlohmann::json&) -> HandlerResult {
                return nlohmann::json{{"result", "ok"}};
            });
    }
    router->on_request("ping", [](const nlohmann::json&) -> HandlerResult {
        return nlohmann::json{{"pong", true}};
    });
    return router;
}

static const ToolRegistry& catalog() {
    static const ToolRegistry registry = ToolDiscovery().discover(builtin_tool_modules());
    return registry;
}

static void BM_RouteKnownMethod(benchmark::State& state) {
    auto router = make_router(static_cast<int>(state.range(0)));

    JsonRpcRequest req;
    req.id = RequestId{int64_t{1}};
    req.method = "ping";

    for (auto _ : state) {
        auto resp = router->dispatch(req);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_RouteKnownMethod)->Arg(1)->Arg(100)->MinTime(1.0);

static void BM_RouteUnknownMethod(benchmark::State& state) {
    auto router = make_router(1);

    JsonRpcRequest req;
    req.id = RequestId{int64_t{1}};
    req.method = "not_registered_method";

    for (auto _ : state) {
        auto resp = router->dispatch(req);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_RouteUnknownMethod)->MinTime(1.0);

static void BM_DiscoverCatalog(benchmark::State& state) {
    auto modules = builtin_tool_modules();
    for (auto _ : state) {
        auto registry = ToolDiscovery().discover(modules);
        benchmark::DoNotOptimize(registry);
    }
}
BENCHMARK(BM_DiscoverCatalog)->MinTime(1.0);

static void BM_ParseDocstring(benchmark::State& state) {
    auto modules = builtin_tool_modules();
    const std::string& doc = modules.front().docstring;
    for (auto _ : state) {
        auto parsed = DocstringParser::parse(doc);
        benchmark::DoNotOptimize(parsed);
    }
}
BENCHMARK(BM_ParseDocstring)->MinTime(1.0);

static void BM_InvokeEcho(benchmark::State& state) {
    Dispatcher dispatcher(catalog());
    const nlohmann::json args = {{"text", "Hello"}};
    for (auto _ : state) {
        auto result = dispatcher.invoke("test_echo", args);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_InvokeEcho)->MinTime(1.0);

static void BM_InvokePvalueAdjuster(benchmark::State& state) {
    Dispatcher dispatcher(catalog());
    nlohmann::json pvalues = nlohmann::json::array();
    for (int i = 0; i < state.range(0); ++i) pvalues.push_back(0.001 * (i + 1));
    const nlohmann::json args = {{"pvalues", pvalues}, {"method", "fdr_bh"}};
    for (auto _ : state) {
        auto result = dispatcher.invoke("pvalue_adjuster", args);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_InvokePvalueAdjuster)->Arg(10)->Arg(1000)->MinTime(1.0);

// Frame body in, serialized response out, through the whole engine.
static void BM_EndToEndToolCall(benchmark::State& state) {
    McpServer server(McpServer::Options{}, catalog());
    server.handle_message(R"({"jsonrpc":"2.0","id":0,"method":"initialize","params":{}})");

    const std::string call =
        R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":{"name":"test_echo","arguments":{"text":"Hello"}}})";
    for (auto _ : state) {
        auto reply = server.handle_message(call);
        benchmark::DoNotOptimize(reply);
    }
}
BENCHMARK(BM_EndToEndToolCall)->MinTime(1.0);
