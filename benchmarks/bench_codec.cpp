#include <benchmark/benchmark.h>
#include "toolbridge/codec.hpp"
#include "toolbridge/framing.hpp"
#include "toolbridge/json_rpc.hpp"
#include <algorithm>
#include <string>

using namespace toolbridge;

static const std::string kToolCallRequest =
    R"({"jsonrpc":"2.0","id":42,"method":"tools/call","params":{"name":"search_listings","arguments":{"location":"Lisbon","guests":2}}})";

static const std::string kToolResult =
    R"({"jsonrpc":"2.0","id":42,"result":{"content":[{"type":"text","text":"3 listings found"}],"isError":false}})";

// tools/list response with n tools
static std::string make_tools_list(int n) {
    nlohmann::json tools = nlohmann::json::array();
    for (int i = 0; i < n; ++i) {
        tools.push_back({
            {"name", "tool_" + std::to_string(i)},
            {"description", "Looks something up, variant " + std::to_string(i)},
            {"inputSchema", {
                {"type", "object"},
                {"properties", {
                    {"query", {{"type", "string"}}},
                    {"limit", {{"type", "integer"}, {"minimum", 1}}}
                }},
                {"required", {"query"}}
            }}
        });
    }
    return nlohmann::json{{"jsonrpc", "2.0"}, {"id", 1}, {"result", {{"tools", tools}}}}.dump();
}

static const std::string kToolsList = make_tools_list(100);

// ---- Parse ----

static void BM_ParseToolResult(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kToolResult);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kToolResult.size());
}
BENCHMARK(BM_ParseToolResult)->MinTime(1.0);

static void BM_ParseToolsList(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kToolsList);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kToolsList.size());
}
BENCHMARK(BM_ParseToolsList)->MinTime(1.0);

static void BM_ParseInvalidJson(benchmark::State& state) {
    const std::string bad = "{this is not valid json at all!!!";
    for (auto _ : state) {
        try {
            auto msg = Codec::parse(bad);
            benchmark::DoNotOptimize(msg);
        } catch (const ParseError& e) {
            benchmark::DoNotOptimize(e);
        }
    }
}
BENCHMARK(BM_ParseInvalidJson)->MinTime(1.0);

// ---- Serialize ----

static void BM_SerializeToolCall(benchmark::State& state) {
    JsonRpcRequest req;
    req.id = RequestId{int64_t{42}};
    req.method = "tools/call";
    req.params = nlohmann::json{{"name", "search_listings"}, {"arguments", {{"location", "Lisbon"}}}};

    for (auto _ : state) {
        auto s = Codec::serialize(req);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_SerializeToolCall)->MinTime(1.0);

// ---- Framing ----

static void BM_DecodeFrames(benchmark::State& state) {
    const auto framing = static_cast<Framing>(state.range(0));
    std::string stream;
    for (int i = 0; i < 64; ++i) stream += encode_frame(framing, kToolCallRequest);

    for (auto _ : state) {
        FrameDecoder decoder(framing);
        decoder.feed(stream.data(), stream.size());
        int frames = 0;
        while (decoder.next()) ++frames;
        benchmark::DoNotOptimize(frames);
    }
    state.SetBytesProcessed(state.iterations() * stream.size());
}
BENCHMARK(BM_DecodeFrames)
    ->Arg(static_cast<int>(Framing::Newline))
    ->Arg(static_cast<int>(Framing::ContentLength))
    ->MinTime(1.0);

// Bytes arriving in small chunks, as from a pipe.
static void BM_DecodeChunked(benchmark::State& state) {
    const size_t chunk = static_cast<size_t>(state.range(0));
    std::string stream;
    for (int i = 0; i < 64; ++i) stream += encode_frame(Framing::ContentLength, kToolCallRequest);

    for (auto _ : state) {
        FrameDecoder decoder(Framing::ContentLength);
        int frames = 0;
        for (size_t off = 0; off < stream.size(); off += chunk) {
            decoder.feed(stream.data() + off, std::min(chunk, stream.size() - off));
            while (decoder.next()) ++frames;
        }
        benchmark::DoNotOptimize(frames);
    }
    state.SetBytesProcessed(state.iterations() * stream.size());
}
BENCHMARK(BM_DecodeChunked)->Arg(16)->Arg(512)->Arg(4096)->MinTime(1.0);
