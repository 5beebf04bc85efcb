/**
 * @file bench_http_parsing.cpp
 * @brief Benchmarks for HTTP head framing, response parsing and node replies
 */

#include <benchmark/benchmark.h>

#include <kcenon/media_relay/core/http_message.h>
#include <kcenon/media_relay/core/json_utils.h>

#include <string>
#include <vector>

namespace kcenon::media_relay::benchmark {

namespace {

auto make_response(std::size_t body_size) -> std::vector<std::byte> {
    std::string body(body_size, 'x');
    std::string text =
        "HTTP/1.1 200 OK\r\n"
        "Content-Type: application/json\r\n"
        "Server: node\r\n"
        "Content-Length: " + std::to_string(body.size()) + "\r\n"
        "\r\n" + body;
    return to_bytes(text);
}

auto make_catalog(std::size_t entries) -> std::string {
    std::string json = "[";
    for (std::size_t i = 0; i < entries; ++i) {
        if (i != 0) {
            json += ", ";
        }
        json += "\"clip_" + std::to_string(i) + ".mp4\"";
    }
    json += "]";
    return json;
}

}  // namespace

/**
 * @brief Locate the end of the head in a buffered response
 */
static void BM_FindHeaderEnd(::benchmark::State& state) {
    auto bytes = make_response(static_cast<std::size_t>(state.range(0)));

    for (auto _ : state) {
        auto end = find_header_end(bytes);
        ::benchmark::DoNotOptimize(end);
    }

    state.SetBytesProcessed(static_cast<int64_t>(bytes.size()) *
                            static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Full response parse including the body copy
 */
static void BM_ParseResponse(::benchmark::State& state) {
    auto bytes = make_response(static_cast<std::size_t>(state.range(0)));

    for (auto _ : state) {
        auto response = parse_response(bytes);
        if (!response) {
            state.SkipWithError("Failed to parse response");
            return;
        }
        ::benchmark::DoNotOptimize(response->status_code);
    }

    state.SetBytesProcessed(static_cast<int64_t>(bytes.size()) *
                            static_cast<int64_t>(state.iterations()));
}

static void BM_SerializeUploadHead(::benchmark::State& state) {
    http_request request;
    request.method = http_method::post;
    request.path = "/project/command?name=add&param1=" + url_encode("clip 0001 (final).mp4");
    request.headers["Authorization"] = "Bearer 0123456789abcdef";
    request.headers["Session"] = "s-42";
    request.headers["Content-Type"] = "application/octet-stream";

    for (auto _ : state) {
        auto head = serialize_request_head(request, 64 * 1024 * 1024);
        ::benchmark::DoNotOptimize(head);
    }
}

/**
 * @brief Parse the node's data-folder catalog
 */
static void BM_ParseCatalog(::benchmark::State& state) {
    auto json = make_catalog(static_cast<std::size_t>(state.range(0)));

    for (auto _ : state) {
        auto names = json::parse_string_array(json);
        if (!names) {
            state.SkipWithError("Failed to parse catalog");
            return;
        }
        ::benchmark::DoNotOptimize(names);
    }

    state.SetItemsProcessed(state.range(0) * static_cast<int64_t>(state.iterations()));
}

// ============================================================================
// Benchmark Registrations
// ============================================================================

BENCHMARK(BM_FindHeaderEnd)
    ->Arg(0)
    ->Arg(1024)
    ->Arg(64 * 1024);

BENCHMARK(BM_ParseResponse)
    ->Arg(64)
    ->Arg(4 * 1024)
    ->Arg(256 * 1024);

BENCHMARK(BM_SerializeUploadHead);

BENCHMARK(BM_ParseCatalog)
    ->Arg(10)
    ->Arg(100)
    ->Arg(1000);

}  // namespace kcenon::media_relay::benchmark
