// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#include <benchmark/benchmark.h>

#include <cstdint>
#include <paged_tree/tied_top_bounded_heap.hpp>
#include <queue>
#include <random>
#include <vector>

using namespace kressler::paged_tree;

// Benchmark configuration
constexpr std::size_t STREAM_SIZE = 100000;  // Candidates per query

// Candidate distances; a narrow range produces many ties at the boundary
static std::vector<std::int32_t> make_stream(std::int32_t range) {
  std::mt19937 rng(12345);
  std::uniform_int_distribution<std::int32_t> dist(0, range);
  std::vector<std::int32_t> stream(STREAM_SIZE);
  for (auto& value : stream) {
    value = dist(rng);
  }
  return stream;
}

// Baseline: bounded max-heap dropping ties
static void BM_PriorityQueue_TopK(benchmark::State& state) {
  const auto k = static_cast<std::size_t>(state.range(0));
  const auto stream = make_stream(static_cast<std::int32_t>(state.range(1)));

  for (auto _ : state) {
    std::priority_queue<std::int32_t> heap;
    for (std::int32_t value : stream) {
      if (heap.size() < k) {
        heap.push(value);
      } else if (value < heap.top()) {
        heap.pop();
        heap.push(value);
      }
    }
    benchmark::DoNotOptimize(heap.top());
  }

  state.SetItemsProcessed(state.iterations() * STREAM_SIZE);
}
BENCHMARK(BM_PriorityQueue_TopK)
    ->Args({10, 1000000})
    ->Args({100, 1000000})
    ->Args({10, 100})
    ->Args({100, 100});

static void BM_TiedHeap_TopK(benchmark::State& state) {
  const auto k = static_cast<std::size_t>(state.range(0));
  const auto stream = make_stream(static_cast<std::int32_t>(state.range(1)));

  for (auto _ : state) {
    tied_top_bounded_heap<std::int32_t> heap(k);
    for (std::int32_t value : stream) {
      heap.insert(value);
    }
    benchmark::DoNotOptimize(heap.size());
  }

  state.SetItemsProcessed(state.iterations() * STREAM_SIZE);
}
BENCHMARK(BM_TiedHeap_TopK)
    ->Args({10, 1000000})
    ->Args({100, 1000000})
    ->Args({10, 100})
    ->Args({100, 100});

// Drain the result set the way a k-nearest-neighbor query reports it
static void BM_TiedHeap_Drain(benchmark::State& state) {
  const auto k = static_cast<std::size_t>(state.range(0));
  const auto stream = make_stream(100);

  for (auto _ : state) {
    state.PauseTiming();
    tied_top_bounded_heap<std::int32_t> heap(k);
    for (std::int32_t value : stream) {
      heap.insert(value);
    }
    state.ResumeTiming();

    while (auto value = heap.poll()) {
      benchmark::DoNotOptimize(*value);
    }
  }
}
BENCHMARK(BM_TiedHeap_Drain)->Arg(10)->Arg(100);

BENCHMARK_MAIN();
