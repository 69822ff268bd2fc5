#include <benchmark/benchmark.h>
#include "mcpconn/codec.hpp"
#include "mcpconn/framing.hpp"
#include "mcpconn/json_rpc.hpp"
#include <string>

using namespace mcpconn;

// tools/call request as the client writes it
static const std::string kToolCallRequest =
    R"({"jsonrpc":"2.0","id":42,"method":"tools/call","params":{"name":"get_weather","arguments":{"location":"Warsaw","units":"celsius"}}})";

// Small tools/call response
static const std::string kToolCallResponse =
    R"({"jsonrpc":"2.0","id":42,"result":{"content":[{"type":"text","text":"12 C, overcast"}],"isError":false}})";

// tools/list response with N descriptors, as seen during discovery
static std::string make_tools_list_response(int n) {
    nlohmann::json tools = nlohmann::json::array();
    for (int i = 0; i < n; ++i) {
        tools.push_back({
            {"name", "tool_" + std::to_string(i)},
            {"description", "A tool for doing something useful, number " + std::to_string(i)},
            {"inputSchema", {
                {"type", "object"},
                {"properties", {
                    {"param1", {{"type", "string"}, {"description", "First parameter"}}},
                    {"param2", {{"type", "integer"}, {"description", "Second parameter"}}}
                }},
                {"required", {"param1"}}
            }}
        });
    }
    nlohmann::json resp = {
        {"jsonrpc", "2.0"},
        {"id", 2},
        {"result", {{"tools", tools}}}
    };
    return resp.dump();
}

static const std::string kToolsListResponse = make_tools_list_response(100);

// ---- Parse benchmarks ----

static void BM_ParseToolCallResponse(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kToolCallResponse);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kToolCallResponse.size());
}
BENCHMARK(BM_ParseToolCallResponse)->MinTime(1.0);

static void BM_ParseToolsListResponse(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kToolsListResponse);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kToolsListResponse.size());
}
BENCHMARK(BM_ParseToolsListResponse)->MinTime(1.0);

static void BM_ParseInvalidLine(benchmark::State& state) {
    const std::string bad = "server starting on port 8080...";
    for (auto _ : state) {
        try {
            auto msg = Codec::parse(bad);
            benchmark::DoNotOptimize(msg);
        } catch (const ParseError&) {}
    }
}
BENCHMARK(BM_ParseInvalidLine)->MinTime(1.0);

// ---- Serialize benchmarks ----

static void BM_SerializeToolCallRequest(benchmark::State& state) {
    JsonRpcRequest req;
    req.id = RequestId{int64_t{42}};
    req.method = "tools/call";
    req.params = nlohmann::json{{"name", "get_weather"},
                                {"arguments", {{"location", "Warsaw"}, {"units", "celsius"}}}};

    for (auto _ : state) {
        auto s = Codec::serialize(req);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_SerializeToolCallRequest)->MinTime(1.0);

// ---- Framing ----

static void BM_FrameChunkedStream(benchmark::State& state) {
    const auto chunk_size = static_cast<size_t>(state.range(0));
    std::string stream;
    for (int i = 0; i < 50; ++i) stream += LineFramer::frame(kToolCallResponse);

    for (auto _ : state) {
        LineFramer framer;
        std::string line;
        size_t lines = 0;
        for (size_t off = 0; off < stream.size(); off += chunk_size) {
            framer.feed(std::string_view(stream).substr(off, chunk_size));
            while (framer.next_line(line)) ++lines;
        }
        benchmark::DoNotOptimize(lines);
    }
    state.SetBytesProcessed(state.iterations() * stream.size());
}
BENCHMARK(BM_FrameChunkedStream)->Arg(7)->Arg(512)->Arg(65536)->MinTime(1.0);

static void BM_RoundTrip(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kToolCallRequest);
        auto serialized = Codec::serialize(msg);
        benchmark::DoNotOptimize(serialized);
    }
}
BENCHMARK(BM_RoundTrip)->MinTime(1.0);
