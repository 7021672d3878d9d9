#include <benchmark/benchmark.h>
#include "mcplite/mcplite.hpp"
#include <memory>
#include <string>
#include <vector>

using namespace mcplite;

// Server with N integer tools plus "add"
static std::unique_ptr<McpServer> make_server(int n_tools) {
    McpServer::Options opts;
    opts.enable_logging = false;
    auto server = std::make_unique<McpServer>(opts);
    for (int i = 0; i < n_tools; ++i) {
        server->add_tool("tool_" + std::to_string(i), {std::nullopt, "Numbered tool", ""},
            [i](int value) { return value + i; },
            {arg("value")});
    }
    server->add_tool("add", {std::nullopt, "Add two numbers", "x: First\ny: Second"},
        [](int x, int y) { return x + y; },
        {arg("x"), arg("y")});
    return server;
}

static void BM_RouterDispatch(benchmark::State& state) {
    Router router;
    router.on_request("tools/list", [](const nlohmann::json&) -> HandlerResult {
        return nlohmann::json{{"tools", nlohmann::json::array()}};
    });

    JsonRpcRequest req;
    req.id = nlohmann::json(1);
    req.method = "tools/list";

    for (auto _ : state) {
        auto resp = router.dispatch(req);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_RouterDispatch)->MinTime(1.0);

static void BM_ToolsList(benchmark::State& state) {
    auto server = make_server(static_cast<int>(state.range(0)));
    const nlohmann::json req = {{"jsonrpc", "2.0"}, {"id", 1}, {"method", "tools/list"}};

    for (auto _ : state) {
        auto resp = server->handle(req);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_ToolsList)->Arg(1)->Arg(100)->MinTime(1.0);

static void BM_ToolsCall(benchmark::State& state) {
    auto server = make_server(100);
    const nlohmann::json req = {
        {"jsonrpc", "2.0"}, {"id", 1}, {"method", "tools/call"},
        {"params", {{"name", "add"}, {"arguments", {{"x", 10}, {"y", 25}}}}}
    };

    for (auto _ : state) {
        auto resp = server->handle(req);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_ToolsCall)->MinTime(1.0);

static void BM_DirectCallFromText(benchmark::State& state) {
    auto server = make_server(100);
    const std::string raw = R"({"jsonrpc":"2.0","id":9,"method":"add","params":{"x":2,"y":3}})";

    for (auto _ : state) {
        auto resp = server->handle_text(raw);
        benchmark::DoNotOptimize(resp);
    }
    state.SetBytesProcessed(state.iterations() * raw.size());
}
BENCHMARK(BM_DirectCallFromText)->MinTime(1.0);

static void BM_UnknownTool(benchmark::State& state) {
    auto server = make_server(100);
    const nlohmann::json req = {{"jsonrpc", "2.0"}, {"id", 1}, {"method", "not_registered"}};

    for (auto _ : state) {
        auto resp = server->handle(req);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_UnknownTool)->MinTime(1.0);

static void BM_SchemaInference(benchmark::State& state) {
    SchemaInference inference;
    std::vector<ParameterInfo> params = {
        {"query", ConcreteType{"str"}, false},
        {"limit", ConcreteType{"int"}, true},
        {"tags", GenericType{"list", {ConcreteType{"str"}}}, true},
        {"filters", ForwardRef{"Dict[str, str]"}, true},
    };
    const std::string doc = "Search the index.\n    query: Text to search\n    limit: Max results";

    for (auto _ : state) {
        auto result = inference.infer_all(params, doc);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_SchemaInference)->MinTime(1.0);
