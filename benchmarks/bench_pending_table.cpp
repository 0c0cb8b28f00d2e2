#include <benchmark/benchmark.h>
#include "toolbridge/pending_table.hpp"
#include "toolbridge/schema.hpp"
#include <string>
#include <vector>

using namespace toolbridge;

static void BM_InsertComplete(benchmark::State& state) {
    PendingTable table;
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::hours(1);
    const nlohmann::json result = {{"content", nlohmann::json::array()}};

    for (auto _ : state) {
        auto id = table.next_id();
        auto fut = table.insert(id, "tools/call", std::string(), deadline);
        table.complete(id, result);
        benchmark::DoNotOptimize(fut.get());
    }
}
BENCHMARK(BM_InsertComplete)->MinTime(1.0);

// Completion cost with N other requests outstanding.
static void BM_CompleteUnderLoad(benchmark::State& state) {
    PendingTable table;
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::hours(1);
    std::vector<std::future<nlohmann::json>> outstanding;
    for (int64_t i = 0; i < state.range(0); ++i) {
        auto id = table.next_id();
        outstanding.push_back(table.insert(id, "tools/call", std::string(), deadline));
    }

    for (auto _ : state) {
        auto id = table.next_id();
        auto fut = table.insert(id, "tools/call", std::string(), deadline);
        table.complete(id, nlohmann::json::object());
        benchmark::DoNotOptimize(fut.get());
    }
    state.counters["outstanding"] = static_cast<double>(table.size());
}
BENCHMARK(BM_CompleteUnderLoad)->Arg(10)->Arg(1000)->MinTime(1.0);

static void BM_ValidateArguments(benchmark::State& state) {
    const nlohmann::json schema = {
        {"type", "object"},
        {"properties", {
            {"location", {{"type", "string"}, {"minLength", 1}}},
            {"guests", {{"type", "integer"}, {"minimum", 1}, {"maximum", 16}}},
            {"amenities", {{"type", "array"}, {"items", {{"type", "string"}, {"enum", {"wifi", "pool", "parking"}}}}}}
        }},
        {"required", {"location"}},
        {"additionalProperties", false}
    };
    const nlohmann::json args = {{"location", "Lisbon"}, {"guests", 4}, {"amenities", {"wifi", "pool"}}};

    for (auto _ : state) {
        validate_arguments(schema, args);
        benchmark::ClobberMemory();
    }
}
BENCHMARK(BM_ValidateArguments)->MinTime(1.0);
