#include <benchmark/benchmark.h>
#include "fsgate/sanitizer.hpp"
#include <string>

using namespace fsgate;

static std::string make_source_text(int lines, bool with_controls) {
    std::string text;
    for (int i = 0; i < lines; ++i) {
        text += "    printf(\"row %d: caf\xC3\xA9 \xE2\x9C\x93\\n\", " + std::to_string(i) + ");";
        if (with_controls && i % 10 == 0) {
            text += "\x1b[31m\x07\x7f";
        }
        text += "\n";
    }
    return text;
}

static nlohmann::json make_listing(int entries) {
    auto arr = nlohmann::json::array();
    for (int i = 0; i < entries; ++i) {
        arr.push_back({{"name", "file_" + std::to_string(i) + ".txt"},
                       {"path", "/srv/data/file_" + std::to_string(i) + ".txt"},
                       {"type", "file"},
                       {"size", i * 128},
                       {"modified", "2025-01-01T00:00:00Z"}});
    }
    return arr;
}

static void BM_CleanTextClean(benchmark::State& state) {
    auto text = make_source_text(static_cast<int>(state.range(0)), false);
    for (auto _ : state) {
        auto out = Sanitizer::clean_text(text);
        benchmark::DoNotOptimize(out);
    }
    state.SetBytesProcessed(state.iterations() * text.size());
}
BENCHMARK(BM_CleanTextClean)->Arg(10)->Arg(1000)->MinTime(1.0);

static void BM_CleanTextWithControls(benchmark::State& state) {
    auto text = make_source_text(static_cast<int>(state.range(0)), true);
    for (auto _ : state) {
        auto out = Sanitizer::clean_text(text);
        benchmark::DoNotOptimize(out);
    }
    state.SetBytesProcessed(state.iterations() * text.size());
}
BENCHMARK(BM_CleanTextWithControls)->Arg(10)->Arg(1000)->MinTime(1.0);

static void BM_IsClean(benchmark::State& state) {
    auto text = make_source_text(1000, false);
    for (auto _ : state) {
        bool clean = Sanitizer::is_clean(text);
        benchmark::DoNotOptimize(clean);
    }
    state.SetBytesProcessed(state.iterations() * text.size());
}
BENCHMARK(BM_IsClean)->MinTime(1.0);

static void BM_SanitizeListing(benchmark::State& state) {
    auto listing = make_listing(static_cast<int>(state.range(0)));
    for (auto _ : state) {
        auto out = Sanitizer::sanitize(listing);
        benchmark::DoNotOptimize(out);
    }
}
BENCHMARK(BM_SanitizeListing)->Arg(10)->Arg(500)->MinTime(1.0);

static void BM_ScrubEncoded(benchmark::State& state) {
    nlohmann::json doc = {{"text", make_source_text(200, true)}};
    std::string encoded = doc.dump();
    for (auto _ : state) {
        auto out = Sanitizer::scrub_encoded(encoded);
        benchmark::DoNotOptimize(out);
    }
    state.SetBytesProcessed(state.iterations() * encoded.size());
}
BENCHMARK(BM_ScrubEncoded)->MinTime(1.0);
