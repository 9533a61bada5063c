/**
 * @file bench_listing.cpp
 * @brief Benchmarks for directory listing and listing document encoding
 */

#include <benchmark/benchmark.h>

#include <fileshare/core/json_codec.h>
#include <fileshare/server/listing_service.h>

#include "utils/benchmark_helpers.h"

namespace fileshare::benchmark {

/**
 * @brief Walk a tree of N files spread over 16 directories
 */
static void BM_ListingService_Walk(::benchmark::State& state) {
    const auto file_count = static_cast<std::size_t>(state.range(0));

    temp_tree tree("fileshare_bench_listing");
    tree.populate("share", file_count, 16, 64);

    auto resolver = path_resolver::create(tree.root());
    if (!resolver) {
        state.SkipWithError("Failed to create resolver");
        return;
    }
    listing_service service(resolver.value());

    for (auto _ : state) {
        auto files = service.list("share");
        if (!files || files.value().size() != file_count) {
            state.SkipWithError("Listing failed");
            return;
        }
        ::benchmark::DoNotOptimize(files);
    }

    state.SetItemsProcessed(static_cast<int64_t>(state.iterations() * file_count));
}
BENCHMARK(BM_ListingService_Walk)->Arg(100)->Arg(1000)->Unit(::benchmark::kMillisecond);

static void BM_Listing_EncodeDecode(::benchmark::State& state) {
    const auto file_count = static_cast<std::size_t>(state.range(0));

    listing files;
    for (std::size_t i = 0; i < file_count; ++i) {
        files.emplace_back("dir" + std::to_string(i % 32) + "/file " + std::to_string(i) +
                               ".bin",
                           static_cast<int64_t>(i * 1024));
    }

    for (auto _ : state) {
        auto json = json_codec::encode_listing(files);
        auto decoded = json_codec::decode_listing(json);
        if (!decoded) {
            state.SkipWithError("Decode failed");
            return;
        }
        ::benchmark::DoNotOptimize(decoded);
    }

    state.SetItemsProcessed(static_cast<int64_t>(state.iterations() * file_count));
    state.SetLabel(format_bytes(json_codec::encode_listing(files).size()));
}
BENCHMARK(BM_Listing_EncodeDecode)->Arg(100)->Arg(10000);

}  // namespace fileshare::benchmark
