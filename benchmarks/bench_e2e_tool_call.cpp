#include <benchmark/benchmark.h>
#include "mcpconn/registry.hpp"
#include <stdexcept>

using namespace mcpconn;

#ifndef FAKE_MCP_SERVER_PATH
#error "FAKE_MCP_SERVER_PATH must point at the fake_mcp_server executable"
#endif

// A registry with one live connection to the fake server.
struct E2EFixture {
    ConnectionRegistry registry;
    std::string connection_id;

    E2EFixture() : registry(make_config()) {
        auto r = registry.connect("bench", {FAKE_MCP_SERVER_PATH});
        if (!is_ok(r)) throw std::runtime_error(get_error(r).message);
        connection_id = get_value(r).connection_id;
    }

    static RegistryConfig make_config() {
        RegistryConfig cfg;
        cfg.log_level = spdlog::level::warn;
        cfg.termination_grace = std::chrono::milliseconds(500);
        return cfg;
    }
};

static void BM_ToolCallStdio(benchmark::State& state) {
    E2EFixture fixture;
    const nlohmann::json args = {{"text", "hello benchmark"}};

    for (auto _ : state) {
        auto result = fixture.registry.execute_tool(fixture.connection_id, "echo", args);
        benchmark::DoNotOptimize(result);
    }
    state.SetLabel("stdio tools/call roundtrip");
}
BENCHMARK(BM_ToolCallStdio)->MinTime(2.0)->UseRealTime();

static void BM_StatusWithLiveness(benchmark::State& state) {
    E2EFixture fixture;

    for (auto _ : state) {
        auto status = fixture.registry.get_status(fixture.connection_id);
        benchmark::DoNotOptimize(status);
    }
    state.SetLabel("get_status incl. waitpid");
}
BENCHMARK(BM_StatusWithLiveness)->MinTime(1.0)->UseRealTime();

static void BM_ConnectDisconnect(benchmark::State& state) {
    ConnectionRegistry registry{E2EFixture::make_config()};

    for (auto _ : state) {
        auto r = registry.connect("bench", {FAKE_MCP_SERVER_PATH});
        if (!is_ok(r)) {
            state.SkipWithError(get_error(r).message.c_str());
            break;
        }
        auto d = registry.disconnect(get_value(r).connection_id);
        benchmark::DoNotOptimize(d);
    }
    state.SetLabel("spawn + handshake + terminate");
}
BENCHMARK(BM_ConnectDisconnect)->MinTime(2.0)->UseRealTime();
