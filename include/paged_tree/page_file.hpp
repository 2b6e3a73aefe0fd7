// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>

#include "tree_index_header.hpp"

namespace kressler::paged_tree {

/**
 * Identifier of one page in a page file.
 */
using page_id_type = std::int32_t;

/**
 * Page id of a node that has not been written yet.
 */
inline constexpr page_id_type invalid_page_id = -1;

/**
 * Page access counters of a page file.
 *
 * Note: Not thread-safe (consistent with the page files that own them).
 */
struct page_file_statistics {
  using size_type = std::size_t;

  size_type reads{0};   // Pages read
  size_type writes{0};  // Pages written or deleted

  void record_read() { ++reads; }

  void record_write() { ++writes; }

  void reset() {
    reads = 0;
    writes = 0;
  }

  size_type read_operations() const { return reads; }
  size_type write_operations() const { return writes; }
};

/**
 * Minimal node interface a page file needs: an assignable page id.
 */
template <typename Node>
concept PageNode = requires(Node node, const Node cnode, page_id_type id) {
  { cnode.page_id() } -> std::convertible_to<page_id_type>;
  node.set_page_id(id);
};

/**
 * Requirements on the durable store backing an index tree.
 *
 * - initialize(header) returns true if the store already held a header; the
 *   stored header is then copied into the argument. Otherwise the argument
 *   is recorded and false is returned.
 * - write_header(header) replaces the recorded header once capacities are
 *   final.
 * - write_page(node) assigns a page id to a node that has none and returns
 *   the id the node was stored under.
 * - read_page/delete_page throw std::out_of_range for unknown ids.
 */
template <typename File, typename Node>
concept PageStore =
    PageNode<Node> &&
    requires(File file, const File cfile, Node& node, tree_index_header& header,
             const tree_index_header& cheader, page_id_type id) {
      { cfile.page_size() } -> std::convertible_to<std::size_t>;
      { file.initialize(header) } -> std::same_as<bool>;
      file.write_header(cheader);
      { file.read_page(id) } -> std::same_as<Node>;
      { file.write_page(node) } -> std::same_as<page_id_type>;
      file.delete_page(id);
      { cfile.statistics() } -> std::same_as<const page_file_statistics&>;
      file.reset_page_access();
    };

}  // namespace kressler::paged_tree
