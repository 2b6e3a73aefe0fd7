// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <cstddef>

namespace kressler::paged_tree {

/**
 * Node capacities of a tree.
 *
 * A capacity is one plus the maximum number of entries a node of that kind
 * may hold: capacity - 1 entries fit, reaching capacity means the node must
 * be split. Minimums bound underflow of every node except the root.
 */
struct tree_capacities {
  std::size_t dir_capacity{0};
  std::size_t leaf_capacity{0};
  std::size_t dir_minimum{0};
  std::size_t leaf_minimum{0};

  bool operator==(const tree_capacities&) const = default;
};

/**
 * Persisted record describing the layout of a tree: the page size of the
 * file it lives in and the capacities it was built with.
 *
 * The first handle to attach claims the file with a provisional header
 * (built == false) carrying whatever capacities it was configured with.
 * Building the tree rewrites it with the final capacities and built == true;
 * only such a header is adopted on reattach.
 */
struct tree_index_header {
  std::size_t page_size{0};
  tree_capacities capacities;
  bool built{false};

  tree_index_header() = default;

  tree_index_header(std::size_t page_size, const tree_capacities& capacities,
                    bool built = false)
      : page_size(page_size), capacities(capacities), built(built) {}

  std::size_t dir_capacity() const { return capacities.dir_capacity; }
  std::size_t leaf_capacity() const { return capacities.leaf_capacity; }
  std::size_t dir_minimum() const { return capacities.dir_minimum; }
  std::size_t leaf_minimum() const { return capacities.leaf_minimum; }

  bool operator==(const tree_index_header&) const = default;
};

}  // namespace kressler::paged_tree
