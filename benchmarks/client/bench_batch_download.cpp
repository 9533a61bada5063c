/**
 * @file bench_batch_download.cpp
 * @brief Benchmarks for directory download scheduling overhead
 */

#include <benchmark/benchmark.h>

#include <fileshare/client/batch_download.h>
#include <fileshare/core/json_codec.h>

#include <memory>
#include <string>

namespace fileshare::benchmark {

namespace {

/**
 * @brief Answers every request with the same listing document
 */
class fixed_listing_client : public http_client_interface {
public:
    explicit fixed_listing_client(std::size_t file_count) {
        listing files;
        for (std::size_t i = 0; i < file_count; ++i) {
            files.emplace_back("bench/file" + std::to_string(i), 1024);
        }
        response_.status_code = 200;
        auto body = json_codec::encode_listing(files);
        response_.body.assign(body.begin(), body.end());
    }

    auto get(const std::string&) -> result<http_response> override { return response_; }

private:
    http_response response_;
};

}  // namespace

/**
 * @brief Queue, pool and aggregation cost with transfers that do no I/O
 */
static void BM_BatchDownload_Scheduling(::benchmark::State& state) {
    const auto file_count = static_cast<std::size_t>(state.range(0));
    const auto workers = static_cast<std::size_t>(state.range(1));

    auto http = std::make_shared<fixed_listing_client>(file_count);
    batch_download_orchestrator orchestrator(
        http, "http://bench",
        [](const file_record& task, const cancellation_token&, std::size_t) {
            transfer_outcome outcome;
            outcome.path = task.path;
            outcome.status = transfer_status::downloaded;
            outcome.bytes_written = task.size;
            return outcome;
        },
        workers);

    for (auto _ : state) {
        auto summary = orchestrator.run("bench", cancellation_token{});
        if (!summary || summary.value().downloaded != file_count) {
            state.SkipWithError("Batch failed");
            return;
        }
        ::benchmark::DoNotOptimize(summary);
    }

    state.SetItemsProcessed(static_cast<int64_t>(state.iterations() * file_count));
}
BENCHMARK(BM_BatchDownload_Scheduling)
    ->Args({100, 1})
    ->Args({100, 5})
    ->Args({1000, 5})
    ->Args({1000, 16})
    ->Unit(::benchmark::kMillisecond);

}  // namespace fileshare::benchmark
