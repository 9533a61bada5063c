/**
 * @file bench_path_resolution.cpp
 * @brief Benchmarks for request path decoding and containment checks
 */

#include <benchmark/benchmark.h>

#include <fileshare/core/url_codec.h>
#include <fileshare/server/path_resolver.h>

#include "utils/benchmark_helpers.h"

#include <string>

namespace fileshare::benchmark {

static void BM_UrlDecode(::benchmark::State& state) {
    const std::string encoded = "photos%2F2024%2Fsummer%20trip%2Fbeach%20day%20%2312.jpg";

    for (auto _ : state) {
        auto decoded = url_codec::url_decode(encoded);
        ::benchmark::DoNotOptimize(decoded);
    }

    state.SetBytesProcessed(static_cast<int64_t>(state.iterations() * encoded.size()));
}
BENCHMARK(BM_UrlDecode);

/**
 * @brief Resolve paths of increasing depth to existing files
 */
static void BM_PathResolver_Resolve(::benchmark::State& state) {
    const auto depth = static_cast<std::size_t>(state.range(0));

    temp_tree tree("fileshare_bench_resolve");
    std::string relative;
    for (std::size_t i = 0; i < depth; ++i) {
        relative += "level" + std::to_string(i) + "/";
    }
    relative += "leaf.bin";
    tree.create_file(relative, 16);

    auto resolver = path_resolver::create(tree.root());
    if (!resolver) {
        state.SkipWithError("Failed to create resolver");
        return;
    }
    const auto encoded = url_codec::url_encode(relative, true);

    for (auto _ : state) {
        auto resolved = resolver.value().resolve(encoded);
        if (!resolved) {
            state.SkipWithError("Resolution failed");
            return;
        }
        ::benchmark::DoNotOptimize(resolved);
    }
}
BENCHMARK(BM_PathResolver_Resolve)->Arg(1)->Arg(4)->Arg(16);

/**
 * @brief Rejection cost for traversal attempts
 */
static void BM_PathResolver_RejectTraversal(::benchmark::State& state) {
    temp_tree tree("fileshare_bench_reject");
    auto resolver = path_resolver::create(tree.root());
    if (!resolver) {
        state.SkipWithError("Failed to create resolver");
        return;
    }

    for (auto _ : state) {
        auto resolved = resolver.value().resolve("..%2F..%2Fetc%2Fpasswd");
        ::benchmark::DoNotOptimize(resolved);
    }
}
BENCHMARK(BM_PathResolver_RejectTraversal);

}  // namespace fileshare::benchmark
