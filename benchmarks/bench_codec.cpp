#include <benchmark/benchmark.h>
#include "fsgate/codec.hpp"
#include "fsgate/error.hpp"
#include "fsgate/json_rpc.hpp"
#include <string>

using namespace fsgate;

static const std::string kPing =
    R"({"jsonrpc":"2.0","id":1,"method":"ping","params":{}})";

static const std::string kReadFileCall =
    R"({"jsonrpc":"2.0","id":42,"method":"tools/call","params":{"name":"readFile","arguments":{"path":"/srv/data/src/main.cpp","encoding":"UTF-8"}}})";

// A tools/call response carrying a file of n lines
static JsonRpcResponse make_file_response(int n) {
    std::string text;
    for (int i = 0; i < n; ++i) {
        text += "    int value_" + std::to_string(i) + " = compute(" + std::to_string(i) + ");\n";
    }
    JsonRpcResponse resp;
    resp.id = RequestId{int64_t{7}};
    resp.result = nlohmann::json{{"content", {{{"type", "text"}, {"text", text}}}}};
    return resp;
}

// ---- Parse benchmarks ----

static void BM_ParsePing(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kPing);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kPing.size());
}
BENCHMARK(BM_ParsePing)->MinTime(1.0);

static void BM_ParseToolCall(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kReadFileCall);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kReadFileCall.size());
}
BENCHMARK(BM_ParseToolCall)->MinTime(1.0);

static void BM_ParseInvalidJson(benchmark::State& state) {
    const std::string bad = "{this is not valid json at all!!!";
    for (auto _ : state) {
        try {
            auto msg = Codec::parse(bad);
            benchmark::DoNotOptimize(msg);
        } catch (const FormatError& e) {
            benchmark::DoNotOptimize(e.what());
        }
    }
}
BENCHMARK(BM_ParseInvalidJson)->MinTime(1.0);

// ---- Serialize benchmarks ----

static void BM_SerializeFileResponse(benchmark::State& state) {
    auto resp = make_file_response(static_cast<int>(state.range(0)));
    size_t bytes = Codec::serialize(resp).size();

    for (auto _ : state) {
        auto line = Codec::serialize(resp);
        benchmark::DoNotOptimize(line);
    }
    state.SetBytesProcessed(state.iterations() * bytes);
}
BENCHMARK(BM_SerializeFileResponse)->Arg(10)->Arg(1000)->Arg(10000)->MinTime(1.0);

static void BM_SerializeSafe(benchmark::State& state) {
    auto resp = make_file_response(100);
    for (auto _ : state) {
        auto line = Codec::serialize_safe(resp);
        benchmark::DoNotOptimize(line);
    }
}
BENCHMARK(BM_SerializeSafe)->MinTime(1.0);

static void BM_RoundTrip(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kReadFileCall);
        auto serialized = Codec::serialize(msg);
        benchmark::DoNotOptimize(serialized);
    }
}
BENCHMARK(BM_RoundTrip)->MinTime(1.0);
