#include <benchmark/benchmark.h>
#include "fsgate/config.hpp"
#include "fsgate/logging.hpp"
#include "fsgate/path_normalizer.hpp"
#include "fsgate/server.hpp"
#include <unistd.h>
#include <filesystem>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace fsgate;
namespace fs = std::filesystem;

namespace {

// One sandbox directory shared by every benchmark in the process
struct Sandbox {
    fs::path root;

    Sandbox() {
        std::string tmpl = (fs::temp_directory_path() / "fsgate-bench-XXXXXX").string();
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');
        if (::mkdtemp(buf.data()) == nullptr) {
            throw std::runtime_error("mkdtemp failed");
        }
        root = fs::canonical(buf.data());

        std::ofstream(root / "small.txt") << "hello from the benchmark sandbox\n";
        fs::create_directories(root / "tree");
        for (int i = 0; i < 50; ++i) {
            std::ofstream(root / "tree" / ("file_" + std::to_string(i) + ".txt"))
                << "line " << i << "\nneedle " << i << "\n";
        }
    }

    ~Sandbox() {
        std::error_code ec;
        fs::remove_all(root, ec);
    }
};

Sandbox& sandbox() {
    static Sandbox s;
    return s;
}

std::unique_ptr<GatewayServer> make_server() {
    ServerConfig cfg;
    cfg.allowed_directories = {sandbox().root.generic_string()};
    cfg.path_style = PathStyle::Posix;
    cfg.log_level = "off";
    ConfigLoader::finalize(cfg);
    init_logging(cfg.log_level);
    return std::make_unique<GatewayServer>(std::move(cfg));
}

std::string tool_call(const std::string& name, const nlohmann::json& arguments) {
    return nlohmann::json{{"jsonrpc", "2.0"}, {"id", 1}, {"method", "tools/call"},
                          {"params", {{"name", name}, {"arguments", arguments}}}}
        .dump();
}

} // namespace

static void BM_DispatchPing(benchmark::State& state) {
    auto server = make_server();
    const std::string line = R"({"jsonrpc":"2.0","id":1,"method":"ping"})";
    for (auto _ : state) {
        auto out = server->handle_line(line);
        benchmark::DoNotOptimize(out);
    }
}
BENCHMARK(BM_DispatchPing)->MinTime(1.0);

static void BM_DispatchToolsList(benchmark::State& state) {
    auto server = make_server();
    const std::string line = R"({"jsonrpc":"2.0","id":1,"method":"tools/list"})";
    for (auto _ : state) {
        auto out = server->handle_line(line);
        benchmark::DoNotOptimize(out);
    }
}
BENCHMARK(BM_DispatchToolsList)->MinTime(1.0);

static void BM_DispatchMethodNotFound(benchmark::State& state) {
    auto server = make_server();
    const std::string line = R"({"jsonrpc":"2.0","id":1,"method":"no/such/method"})";
    for (auto _ : state) {
        auto out = server->handle_line(line);
        benchmark::DoNotOptimize(out);
    }
}
BENCHMARK(BM_DispatchMethodNotFound)->MinTime(1.0);

static void BM_ReadFile(benchmark::State& state) {
    auto server = make_server();
    const std::string line = tool_call("readFile", {{"path", (sandbox().root / "small.txt").generic_string()}});
    for (auto _ : state) {
        auto out = server->handle_line(line);
        benchmark::DoNotOptimize(out);
    }
}
BENCHMARK(BM_ReadFile)->MinTime(1.0);

static void BM_ReadFileDenied(benchmark::State& state) {
    auto server = make_server();
    const std::string line = tool_call("readFile", {{"path", "/etc/hostname"}});
    for (auto _ : state) {
        auto out = server->handle_line(line);
        benchmark::DoNotOptimize(out);
    }
}
BENCHMARK(BM_ReadFileDenied)->MinTime(1.0);

static void BM_SearchFiles(benchmark::State& state) {
    auto server = make_server();
    const std::string line = tool_call("searchFiles", {{"directory", (sandbox().root / "tree").generic_string()},
                                                       {"contentPattern", "needle 4\\d"}});
    for (auto _ : state) {
        auto out = server->handle_line(line);
        benchmark::DoNotOptimize(out);
    }
}
BENCHMARK(BM_SearchFiles)->MinTime(0.5);

static void BM_NormalizePath(benchmark::State& state) {
    PathNormalizer::Options opts;
    opts.style = PathStyle::Posix;
    opts.base_directory = "/srv/work";
    PathNormalizer normalizer(opts);
    for (auto _ : state) {
        auto p = normalizer.normalize("C:\\Users\\dev\\projects\\..\\src\\.\\main.cpp");
        benchmark::DoNotOptimize(p);
    }
}
BENCHMARK(BM_NormalizePath)->MinTime(1.0);
