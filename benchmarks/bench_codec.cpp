#include <benchmark/benchmark.h>
#include "clinmcp/codec.hpp"
#include "clinmcp/framing.hpp"
#include "clinmcp/json_rpc.hpp"
#include <unistd.h>
#include <string>

using namespace clinmcp;

// Small message (~60 bytes)
static const std::string kSmallRequest =
    R"({"jsonrpc":"2.0","id":1,"method":"ping","params":{}})";

// Tool call request
static const std::string kToolCallRequest =
    R"({"jsonrpc":"2.0","id":42,"method":"tools/call","params":{"name":"pvalue_adjuster","arguments":{"pvalues":[0.01,0.04,0.03,0.005],"method":"holm"}}})";

// A redaction request carrying a document of roughly n bytes
static std::string make_large_request(size_t n) {
    std::string text;
    while (text.size() < n) {
        text += "Subject 1001-023 was seen by Dr. Smith on 03/14/2024, phone 555-123-4567. ";
    }
    nlohmann::json req = {
        {"jsonrpc", "2.0"},
        {"id", 7},
        {"method", "tools/call"},
        {"params", {{"name", "document_redaction_tool"}, {"arguments", {{"text", text}}}}}
    };
    return req.dump();
}

static const std::string kLargeRequest = make_large_request(64 * 1024);

// ---- Parse benchmarks ----

static void BM_ParseSmallMessage(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kSmallRequest);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kSmallRequest.size());
}
BENCHMARK(BM_ParseSmallMessage)->MinTime(1.0);

static void BM_ParseToolCallRequest(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kToolCallRequest);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kToolCallRequest.size());
}
BENCHMARK(BM_ParseToolCallRequest)->MinTime(1.0);

static void BM_ParseLargeRequest(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kLargeRequest);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kLargeRequest.size());
}
BENCHMARK(BM_ParseLargeRequest)->MinTime(1.0);

static void BM_SalvageIdFromGarbage(benchmark::State& state) {
    const std::string garbage = R"({"jsonrpc":"2.0","id":99,"method":"tools/call","params":{"name":)";
    for (auto _ : state) {
        auto id = Codec::salvage_id(garbage);
        benchmark::DoNotOptimize(id);
    }
}
BENCHMARK(BM_SalvageIdFromGarbage)->MinTime(1.0);

// ---- Serialize benchmarks ----

static void BM_SerializeResponse(benchmark::State& state) {
    JsonRpcResponse resp;
    resp.id = RequestId{int64_t{42}};
    resp.result = nlohmann::json{
        {"content", {{{"type", "text"}, {"text", R"({"output":"Hello"})"}}}},
        {"isError", false},
        {"structuredContent", {{"output", "Hello"}}}
    };
    JsonRpcMessage msg = resp;

    for (auto _ : state) {
        auto s = Codec::serialize(msg);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_SerializeResponse)->MinTime(1.0);

// ---- Framing ----

// Writes N framed messages into a pipe and reads them back.
static void BM_FrameRoundTrip(benchmark::State& state) {
    const int n = static_cast<int>(state.range(0));
    int fds[2];
    if (pipe(fds) != 0) {
        state.SkipWithError("pipe failed");
        return;
    }
    FrameWriter writer(fds[1]);
    FrameReader reader(fds[0]);

    for (auto _ : state) {
        for (int i = 0; i < n; ++i) {
            writer.write_frame(kToolCallRequest);
            auto body = reader.read_frame();
            benchmark::DoNotOptimize(body);
        }
    }
    state.SetItemsProcessed(state.iterations() * n);

    close(fds[0]);
    close(fds[1]);
}
BENCHMARK(BM_FrameRoundTrip)->Arg(100)->Arg(1000)->MinTime(1.0);
