// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#include <benchmark/benchmark.h>

#include <array>
#include <memory>
#include <paged_tree/index_tree.hpp>
#include <paged_tree/memory_page_file.hpp>
#include <paged_tree/tree_entry.hpp>
#include <paged_tree/tree_node.hpp>
#include <random>
#include <vector>

using namespace kressler::paged_tree;

using point = std::array<double, 2>;
using entry = tree_entry<point>;
using node = tree_node<entry>;
using tree = index_tree<node>;

constexpr std::size_t PAGE_SIZE = 4096;
constexpr std::size_t NUM_LEAVES = 64;

// Two-level tree: a directory root over NUM_LEAVES full leaves
static std::unique_ptr<tree> build_tree() {
  auto file = std::make_shared<memory_page_file<node>>(PAGE_SIZE);
  auto t = std::make_unique<tree>(file);
  t->initialize(entry::make_leaf({0.0, 0.0}));

  std::mt19937_64 rng(12345);
  std::uniform_real_distribution<double> dist(0.0, 1.0);

  // The directory replaces the empty root leaf on the root page
  node root = t->create_directory_node();
  root.set_page_id(t->get_root_id());
  for (std::size_t i = 0; i < NUM_LEAVES; ++i) {
    node leaf = t->create_leaf_node();
    while (leaf.num_entries() < t->leaf_capacity() - 1) {
      leaf.add_entry(entry::make_leaf({dist(rng), dist(rng)}));
    }
    root.add_entry(entry::make_directory(t->write_node(leaf)));
  }
  t->write_node(root);
  return t;
}

static void BM_IndexTree_GetRoot(benchmark::State& state) {
  auto t = build_tree();
  for (auto _ : state) {
    node root = t->get_root();
    benchmark::DoNotOptimize(root.num_entries());
  }
}
BENCHMARK(BM_IndexTree_GetRoot);

// Visit every leaf through the directory entries of the root
static void BM_IndexTree_ScanLeaves(benchmark::State& state) {
  auto t = build_tree();
  for (auto _ : state) {
    node root = t->get_root();
    double sum = 0.0;
    for (const auto& child : root) {
      node leaf = t->get_node(child);
      for (const auto& e : leaf) {
        sum += e.payload()[0];
      }
    }
    benchmark::DoNotOptimize(sum);
  }
  state.SetItemsProcessed(state.iterations() * NUM_LEAVES);
}
BENCHMARK(BM_IndexTree_ScanLeaves);

BENCHMARK_MAIN();
