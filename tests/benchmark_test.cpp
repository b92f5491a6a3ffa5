#include <benchmark/benchmark.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <random>
#include <string>
#include <vector>

#include "../include/chunk_fetcher.hpp"
#include "../include/dataset.hpp"
#include "../include/logger.hpp"
#include "../include/row_range.hpp"
#include "test_utils.hpp"

namespace pqlens::benchmark {

// A parquet file with many small row groups, written once per process.
class BenchmarkFixture {
 private:
  std::string dir_;
  std::string path_;

 public:
  explicit BenchmarkFixture(int64_t rows, int64_t group_size) {
    dir_ = test::get_test_dir_name("pqlens_bench");
    std::filesystem::create_directories(dir_);
    path_ = dir_ + "/sequence.parquet";
    test::write_parquet(*test::make_sequence_table(rows), path_, group_size);
  }

  ~BenchmarkFixture() {
    if (std::filesystem::exists(dir_)) {
      std::filesystem::remove_all(dir_);
    }
  }

  std::shared_ptr<DatasetHandle> open() const {
    return FileMetadataInspector::inspect(path_).ValueOrDie();
  }
};

static BenchmarkFixture& shared_fixture() {
  static BenchmarkFixture fixture(200000, 1000);
  return fixture;
}

static void BM_ResolveRange(::benchmark::State& state) {
  const std::vector<int64_t> counts(state.range(0), 1000);
  const auto descriptors = make_descriptors(counts);
  const int64_t total = state.range(0) * 1000;
  std::mt19937 rng(42);
  std::uniform_int_distribution<int64_t> start(0, total - 1);

  for (auto _ : state) {
    const int64_t s = start(rng);
    auto resolved = RowRangeResolver::resolve(
        descriptors, RowRange{s, std::min(s + 100, total)});
    ::benchmark::DoNotOptimize(resolved);
  }
}

static void BM_LazyFetchCold(::benchmark::State& state) {
  auto dataset = shared_fixture().open();
  std::mt19937 rng(42);
  std::uniform_int_distribution<int64_t> start(0, dataset->total_rows() - 1);

  for (auto _ : state) {
    state.PauseTiming();
    ChunkFetcher fetcher(dataset, LoadStrategy::Lazy);
    const int64_t s = start(rng);
    state.ResumeTiming();

    auto chunk = fetcher.fetch(RowRange{s, s + state.range(0)});
    ::benchmark::DoNotOptimize(chunk);
  }
}

static void BM_LazyFetchCached(::benchmark::State& state) {
  auto dataset = shared_fixture().open();
  ChunkFetcher fetcher(dataset, LoadStrategy::Lazy);
  const RowRange range{5000, 5000 + state.range(0)};
  fetcher.fetch(range).ValueOrDie();

  for (auto _ : state) {
    auto chunk = fetcher.fetch(range);
    ::benchmark::DoNotOptimize(chunk);
  }
}

// Timing sanity checks that run with the regular test suite
TEST(FetchPerformanceTest, PagingThroughFileStaysFast) {
  Logger::getInstance().setLevel(LogLevel::OFF);
  auto dataset = shared_fixture().open();
  ChunkFetcher fetcher(dataset, LoadStrategy::Lazy, std::nullopt, 4);

  auto start = std::chrono::high_resolution_clock::now();
  for (int64_t top = 0; top < dataset->total_rows(); top += 100) {
    auto chunk = fetcher.fetch(RowRange{top, top + 100});
    ASSERT_TRUE(chunk.ok());
    ASSERT_EQ((*chunk)->num_rows(), 100);
  }
  auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::high_resolution_clock::now() - start);

  std::cout << "Paged through " << dataset->total_rows() << " rows in "
            << duration.count() << "ms" << std::endl;
  EXPECT_LT(duration.count(), 30000);
  // Each page lies inside one row group of 1000 rows
  EXPECT_EQ(fetcher.decode_calls(), 2000u);
}

}  // namespace pqlens::benchmark

BENCHMARK(pqlens::benchmark::BM_ResolveRange)
    ->RangeMultiplier(10)
    ->Range(10, 100000);

BENCHMARK(pqlens::benchmark::BM_LazyFetchCold)
    ->RangeMultiplier(10)
    ->Range(10, 10000)
    ->Unit(::benchmark::kMicrosecond);

BENCHMARK(pqlens::benchmark::BM_LazyFetchCached)
    ->RangeMultiplier(10)
    ->Range(10, 10000)
    ->Unit(::benchmark::kMicrosecond);

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);

  bool run_benchmarks = false;
  for (int i = 1; i < argc; ++i) {
    if (std::string(argv[i]) == "--benchmark") {
      run_benchmarks = true;
      break;
    }
  }

  if (!run_benchmarks) {
    return RUN_ALL_TESTS();
  }

  // Strip --benchmark before handing the rest to google benchmark
  std::vector<char*> filtered_args;
  filtered_args.push_back(argv[0]);
  for (int i = 1; i < argc; ++i) {
    if (std::string(argv[i]) != "--benchmark") {
      filtered_args.push_back(argv[i]);
    }
  }
  int filtered_argc = static_cast<int>(filtered_args.size());
  char** filtered_argv = filtered_args.data();

  ::benchmark::Initialize(&filtered_argc, filtered_argv);
  if (::benchmark::ReportUnrecognizedArguments(filtered_argc, filtered_argv)) {
    return 1;
  }
  ::benchmark::RunSpecifiedBenchmarks();
  return 0;
}
