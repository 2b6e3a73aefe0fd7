// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <cmath>
#include <cstdint>
#include <iostream>
#include <lyra/lyra.hpp>
#include <memory>
#include <paged_tree/errors.hpp>
#include <paged_tree/index_tree.hpp>
#include <paged_tree/memory_page_file.hpp>
#include <paged_tree/tied_top_bounded_heap.hpp>
#include <paged_tree/tree_entry.hpp>
#include <paged_tree/tree_node.hpp>
#include <random>
#include <vector>

using namespace kressler::paged_tree;

using entry = tree_entry<std::vector<double>>;
using node = tree_node<entry>;
using tree = index_tree<node>;

namespace {

struct neighbor {
  double distance;
  std::size_t position;
};

struct closer {
  bool operator()(const neighbor& a, const neighbor& b) const {
    return a.distance < b.distance;
  }
};

// Manhattan distance snapped to a grid so equal distances actually occur
double grid_distance(const std::vector<double>& a, const std::vector<double>& b,
                     double grid) {
  double sum = 0.0;
  for (std::size_t i = 0; i < a.size(); ++i) {
    sum += std::abs(a[i] - b[i]);
  }
  return std::round(sum / grid) * grid;
}

}  // namespace

int main(int argc, char** argv) {
  bool show_help = false;
  bool verbose = false;
  bool dump = false;
  std::size_t page_size = memory_page_file<node>::default_page_size;
  std::size_t dimension = 2;
  std::size_t k = 5;
  double grid = 0.05;
  uint64_t seed = 12345;

  // Define command line interface
  auto cli =
      lyra::cli() | lyra::help(show_help) |
      lyra::opt(page_size, "bytes")["-p"]["--page-size"]("Page size in bytes") |
      lyra::opt(dimension, "dimension")["-d"]["--dimension"](
          "Number of coordinates per point") |
      lyra::opt(k, "k")["-k"]["--neighbors"]("Number of neighbors to report") |
      lyra::opt(grid, "grid")["-g"]["--grid"](
          "Distance resolution; coarser grids produce more ties") |
      lyra::opt(seed, "seed")["-s"]["--seed"]("Random seed") |
      lyra::opt(verbose)["-v"]["--verbose"]("Print tree debug messages") |
      lyra::opt(dump)["--dump"]("Print the tree structure");

  // Parse command line
  auto result = cli.parse({argc, argv});
  if (!result) {
    std::cerr << "Error in command line: " << result.message() << std::endl;
    std::cerr << cli << std::endl;
    return 1;
  }

  // Show help if requested
  if (show_help) {
    std::cout << cli << std::endl;
    return 0;
  }

  if (dimension == 0 || k == 0 || grid <= 0.0) {
    std::cerr << "Dimension, neighbors and grid must be positive" << std::endl;
    return 1;
  }

  std::mt19937_64 rng(seed);
  std::uniform_real_distribution<double> dist(0.0, 1.0);
  auto random_point = [&]() {
    std::vector<double> p(dimension);
    for (auto& x : p) {
      x = dist(rng);
    }
    return p;
  };

  auto file = std::make_shared<memory_page_file<node>>(page_size);

  // Build a tree and fill its root leaf
  try {
    tree builder(file);
    if (verbose) {
      builder.set_debug_stream(&std::cerr);
    }
    builder.initialize(entry::make_leaf(std::vector<double>(dimension)));

    node root = builder.get_root();
    while (root.num_entries() < builder.leaf_capacity() - 1) {
      entry e = entry::make_leaf(random_point());
      builder.pre_insert(e);
      root.add_entry(std::move(e));
    }
    builder.write_node(root);
  } catch (const configuration_mismatch& e) {
    std::cerr << "Cannot build tree: " << e.what() << std::endl;
    return 1;
  }

  // Reattach with deliberately wrong capacities; the stored ones win
  tree reader(file, basic_tree_variant<node>(), tree_capacities{3, 3, 1, 1});
  if (verbose) {
    reader.set_debug_stream(&std::cerr);
  }
  reader.initialize();
  reader.reset_page_access();

  fmt::print("page size {}, dimension {}\n", reader.page_size(), dimension);
  fmt::print("directory nodes: {}..{} entries\n", reader.dir_minimum(),
             reader.dir_capacity() - 1);
  fmt::print("leaf nodes:      {}..{} entries\n", reader.leaf_minimum(),
             reader.leaf_capacity() - 1);
  if (dump) {
    reader.dump(std::cout);
  }

  // Tied k-nearest-neighbor scan over the root leaf
  std::vector<double> query = random_point();
  node root = reader.get_root();
  tied_top_bounded_heap<neighbor, closer> heap(k);
  for (std::size_t i = 0; i < root.num_entries(); ++i) {
    heap.insert({grid_distance(root.entry(i).payload(), query, grid), i});
  }

  fmt::print("query {::.3f}: {} results for k = {} ({} tied)\n", query,
             heap.size(), k, heap.num_ties());
  for (const neighbor& n : heap.to_sorted_vector()) {
    fmt::print("  {:>6.3f}  #{:<5} {::.3f}\n", n.distance, n.position,
               root.entry(n.position).payload());
  }

  const auto& stats = reader.get_page_file_statistics();
  fmt::print("page reads {}, page writes {}\n", stats.read_operations(),
             stats.write_operations());
  return 0;
}
