// bench_orchestrator.cpp

#include "bench_utils.hpp"

#include "jobforge/job/batch_job.hpp"
#include "jobforge/orchestrator/orchestrator.hpp"
#include "jobforge/util/log.hpp"

#include <benchmark/benchmark.h>

#include <boost/asio/thread_pool.hpp>

#include <cstdint>
#include <numeric>
#include <span>
#include <string>
#include <vector>

namespace jobforge {
namespace {

using CountJob = BatchJob<int, std::size_t, std::size_t>;

auto count_options() -> CountJob::Options {
  return CountJob::Options{
      .chunk_size = 1,
      .build_instruction =
          [](std::span<const int> chunk) {
            return std::to_string(chunk.front());
          },
      .parse_response = [](std::string_view text) -> Result<std::size_t> {
        return ok(text.size());
      },
      .reduce = [](std::vector<std::size_t> parts) -> Result<std::size_t> {
        return ok(std::accumulate(parts.begin(), parts.end(), std::size_t{0}));
      },
  };
}

auto make_items(int n) -> std::vector<int> {
  std::vector<int> items(static_cast<std::size_t>(n));
  std::iota(items.begin(), items.end(), 0);
  return items;
}

void BM_OrchestratorWaves(benchmark::State &state) {
  const auto subtasks = static_cast<int>(state.range(0));
  const auto concurrency = static_cast<std::size_t>(state.range(1));
  log::set_level(log::Level::Error);

  bench::EchoCapability cap;
  Orchestrator orch(cap, JobConfig{.concurrency_limit = concurrency});
  CountJob job(JobId{"job-bench"}, "bench", make_items(subtasks), count_options(),
               cap);
  boost::asio::io_context io;

  for (auto _ : state) {
    auto result = bench::run_on_io(io, orch.run(job));
    benchmark::DoNotOptimize(result);
  }
  state.SetItemsProcessed(static_cast<int64_t>(subtasks) * state.iterations());
}

void BM_OrchestratorThreadPool(benchmark::State &state) {
  const auto subtasks = static_cast<int>(state.range(0));
  const auto threads = static_cast<std::size_t>(state.range(1));
  log::set_level(log::Level::Error);

  boost::asio::thread_pool pool(threads);
  bench::EchoCapability cap;
  Orchestrator orch(cap, pool.get_executor(),
                    JobConfig{.concurrency_limit = threads * 2});
  CountJob job(JobId{"job-bench"}, "bench", make_items(subtasks), count_options(),
               cap);

  for (auto _ : state) {
    auto result = orch.run_sync(job);
    benchmark::DoNotOptimize(result);
  }
  pool.join();
  state.SetItemsProcessed(static_cast<int64_t>(subtasks) * state.iterations());
}

BENCHMARK(BM_OrchestratorWaves)
    ->Args({bench::kSmallSize, 3})
    ->Args({bench::kMediumSize, 3})
    ->Args({bench::kMediumSize, 16})
    ->Args({bench::kLargeSize, 16})
    ->Unit(benchmark::kMicrosecond);

BENCHMARK(BM_OrchestratorThreadPool)
    ->Args({bench::kMediumSize, 2})
    ->Args({bench::kLargeSize, 4})
    ->Args({bench::kLargeSize, 8})
    ->Unit(benchmark::kMillisecond);

} // namespace
} // namespace jobforge
