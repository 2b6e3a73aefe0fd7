// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <ranges>
#include <type_traits>

#include "errors.hpp"
#include "page_file.hpp"
#include "tree_index_header.hpp"

namespace kressler::paged_tree {

/**
 * Hooks a concrete tree variant (R-tree, M-tree, ...) supplies to the
 * generic index_tree. The variant is a policy object held by the tree and
 * receives the tree as first argument of every hook.
 *
 * - initialize_capacities: derive capacities and minimums from the page size
 *   and one representative leaf entry. Must be deterministic.
 * - create_empty_root: create the empty root leaf and write it.
 * - create_root_entry: build the entry designating the root. Called on every
 *   bootstrap, so it must not depend on node contents.
 * - create_new_leaf_node / create_new_directory_node: create an unwritten
 *   node sized with the tree's capacities.
 */
template <typename Variant, typename Tree>
concept TreeVariant =
    requires(Variant variant, Tree& tree, const Tree& ctree,
             const typename Tree::entry_type& entry) {
      {
        variant.initialize_capacities(ctree, entry)
      } -> std::same_as<tree_capacities>;
      variant.create_empty_root(tree, entry);
      {
        variant.create_root_entry(ctree)
      } -> std::same_as<typename Tree::entry_type>;
      {
        variant.create_new_leaf_node(tree)
      } -> std::same_as<typename Tree::node_type>;
      {
        variant.create_new_directory_node(tree)
      } -> std::same_as<typename Tree::node_type>;
    };

/**
 * Optional hook run by a variant before it inserts an entry.
 */
template <typename Variant, typename Tree>
concept HasPreInsert = requires(Variant variant, Tree& tree,
                                const typename Tree::entry_type& entry) {
  variant.pre_insert(tree, entry);
};

/**
 * Optional hook run by a variant after it removed an entry.
 */
template <typename Variant, typename Tree>
concept HasPostDelete = requires(Variant variant, Tree& tree,
                                 const typename Tree::entry_type& entry) {
  variant.post_delete(tree, entry);
};

/**
 * Optional hook validating capacities read back from an existing page file.
 * Throws configuration_mismatch to refuse the file.
 */
template <typename Variant, typename Tree>
concept HasCapacityCheck = requires(Variant variant, const Tree& tree,
                                    const tree_capacities& capacities) {
  variant.check_capacities(tree, capacities);
};

/**
 * Number of bytes one payload occupies in a page.
 *
 * Contiguous ranges (std::vector<double> feature vectors, strings, ...)
 * count their elements; everything else must be trivially copyable and is
 * stored as is.
 */
template <typename T>
std::size_t payload_size(const T& payload) {
  if constexpr (std::ranges::contiguous_range<T> &&
                std::ranges::sized_range<T>) {
    return std::ranges::size(payload) *
           sizeof(std::ranges::range_value_t<T>);
  } else {
    static_assert(std::is_trivially_copyable_v<T>,
                  "payload_size: payload must be trivially copyable or a "
                  "contiguous range");
    return sizeof(T);
  }
}

/**
 * Capacity for nodes of the given entry size (one plus the number of
 * entries fitting into a page after the node header).
 *
 * @throws configuration_mismatch if fewer than two entries fit
 */
inline std::size_t capacity_for_page(std::size_t page_size,
                                     std::size_t node_overhead,
                                     std::size_t entry_size) {
  if (entry_size == 0) {
    throw configuration_mismatch("Entries must occupy at least one byte");
  }
  std::size_t fitting =
      page_size > node_overhead ? (page_size - node_overhead) / entry_size : 0;
  if (fitting < 2) {
    throw configuration_mismatch(fmt::format(
        "Node size of {} bytes is chosen too small for entries of {} bytes",
        page_size, entry_size));
  }
  return fitting + 1;
}

/**
 * Minimum fill for nodes of the given capacity:
 * round((capacity - 1) * relative_min_fill), clamped to [1, capacity - 1].
 *
 * @throws configuration_mismatch if relative_min_fill is not in [0, 1]
 */
inline std::size_t minimum_for_capacity(std::size_t capacity,
                                        double relative_min_fill) {
  if (!std::isfinite(relative_min_fill) || relative_min_fill < 0.0 ||
      relative_min_fill > 1.0) {
    throw configuration_mismatch(fmt::format(
        "Relative minimum fill {} is outside [0, 1]", relative_min_fill));
  }
  const long max_entries = static_cast<long>(capacity) - 1;
  const long minimum =
      std::lround(static_cast<double>(max_entries) * relative_min_fill);
  return static_cast<std::size_t>(
      std::clamp(minimum, 1L, std::max(max_entries, 1L)));
}

/**
 * Ready-made hook policy sizing nodes the way R*-trees do.
 *
 * Every node starts with a fixed header (node_overhead bytes: page id, entry
 * count and leaf flag). Leaf entries store their payload, directory entries
 * a child page id plus routing_size bytes of routing data. The root always
 * lives on page 0; growing the tree moves the old root's entries to a new
 * page and rewrites page 0 as their parent.
 *
 * Variants with their own insertion algorithm can use this policy as is or
 * wrap it to add pre_insert/post_delete bookkeeping.
 *
 * @tparam Node The node type (tree_node<tree_entry<...>>)
 */
template <typename Node>
struct basic_tree_variant {
  using node_type = Node;
  using entry_type = typename Node::entry_type;
  using routing_type = typename entry_type::routing_type;

  static constexpr page_id_type root_page_id = 0;
  static constexpr std::size_t default_node_overhead =
      sizeof(page_id_type) + sizeof(std::uint32_t) + 1;
  static constexpr std::size_t default_routing_size =
      std::is_empty_v<routing_type> ? 0 : sizeof(routing_type);

  double relative_min_fill = 0.4;
  std::size_t node_overhead = default_node_overhead;
  std::size_t routing_size = default_routing_size;

  template <typename Tree>
  tree_capacities initialize_capacities(const Tree& tree,
                                        const entry_type& example_leaf) const {
    const std::size_t leaf_entry_size = payload_size(example_leaf.payload());
    const std::size_t dir_entry_size = sizeof(page_id_type) + routing_size;

    tree_capacities capacities;
    capacities.dir_capacity =
        capacity_for_page(tree.page_size(), node_overhead, dir_entry_size);
    capacities.leaf_capacity =
        capacity_for_page(tree.page_size(), node_overhead, leaf_entry_size);
    capacities.dir_minimum =
        minimum_for_capacity(capacities.dir_capacity, relative_min_fill);
    capacities.leaf_minimum =
        minimum_for_capacity(capacities.leaf_capacity, relative_min_fill);
    return capacities;
  }

  template <typename Tree>
  void create_empty_root(Tree& tree,
                         [[maybe_unused]] const entry_type& example_leaf) {
    Node root = create_new_leaf_node(tree);
    root.set_page_id(root_page_id);
    tree.write_node(root);
  }

  template <typename Tree>
  entry_type create_root_entry([[maybe_unused]] const Tree& tree) const {
    return entry_type::make_directory(root_page_id);
  }

  template <typename Tree>
  Node create_new_leaf_node(Tree& tree) const {
    return Node(tree.leaf_capacity(), true);
  }

  template <typename Tree>
  Node create_new_directory_node(Tree& tree) const {
    return Node(tree.dir_capacity(), false);
  }
};

}  // namespace kressler::paged_tree
