// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include "page_file.hpp"
#include "tree_index_header.hpp"

namespace kressler::paged_tree {

/**
 * Page file that keeps its pages in main memory.
 *
 * Nodes are stored by value; read_page() hands out a copy, so a node must be
 * written back with write_page() for changes to become visible. The header
 * lives as long as the page file object, which lets several tree handles
 * attach to the same store one after the other (share it through a
 * std::shared_ptr).
 *
 * Page ids are assigned densely from 0. Deleted ids are reused, most
 * recently freed first.
 *
 * Implementation notes:
 * - Not thread-safe; a page file belongs to a single tree at a time
 * - Deleting a page counts as a write access
 *
 * @tparam Node The node type stored in the pages
 */
template <typename Node>
  requires PageNode<Node>
class memory_page_file {
 public:
  using node_type = Node;
  using size_type = std::size_t;

  static constexpr size_type default_page_size = 4096;

  /**
   * Construct an empty page file.
   *
   * @param page_size Size of one page in bytes, used by tree variants to
   * derive node capacities
   */
  explicit memory_page_file(size_type page_size = default_page_size)
      : page_size_(page_size) {
    if (page_size_ == 0) {
      throw std::invalid_argument("memory_page_file: page size must be > 0");
    }
  }

  // Non-copyable: a copy would silently fork the tree stored in it
  memory_page_file(const memory_page_file&) = delete;
  memory_page_file& operator=(const memory_page_file&) = delete;

  size_type page_size() const { return page_size_; }

  /**
   * Attach to this file.
   *
   * @param header Header describing the tree; overwritten with the stored
   * header if one exists
   * @return true if the file already contained a header
   */
  bool initialize(tree_index_header& header) {
    if (header_.has_value()) {
      header = *header_;
      return true;
    }
    header_ = header;
    return false;
  }

  /**
   * Replace the stored header.
   */
  void write_header(const tree_index_header& header) { header_ = header; }

  /**
   * Returns the stored header, if the file has been initialized.
   */
  const std::optional<tree_index_header>& header() const { return header_; }

  /**
   * Read the node stored under the given page id.
   *
   * @throws std::out_of_range if no such page exists
   */
  Node read_page(page_id_type page_id) {
    auto it = pages_.find(page_id);
    if (it == pages_.end()) {
      throw std::out_of_range("memory_page_file::read_page: no page " +
                              std::to_string(page_id));
    }
    stats_.record_read();
    return it->second;
  }

  /**
   * Store a node. A node without page id is assigned one first.
   *
   * @return The page id the node was stored under
   */
  page_id_type write_page(Node& node) {
    if (node.page_id() == invalid_page_id) {
      node.set_page_id(allocate_page_id());
    } else if (node.page_id() >= next_page_id_) {
      // Caller chose the id; keep the allocator ahead of it
      next_page_id_ = node.page_id() + 1;
    }
    stats_.record_write();
    pages_.insert_or_assign(node.page_id(), node);
    return node.page_id();
  }

  /**
   * Remove a page and make its id available again.
   *
   * @throws std::out_of_range if no such page exists
   */
  void delete_page(page_id_type page_id) {
    if (pages_.erase(page_id) == 0) {
      throw std::out_of_range("memory_page_file::delete_page: no page " +
                              std::to_string(page_id));
    }
    stats_.record_write();
    free_ids_.push_back(page_id);
  }

  /**
   * Check whether a page id is currently in use.
   */
  bool contains(page_id_type page_id) const {
    return pages_.find(page_id) != pages_.end();
  }

  /**
   * Number of pages currently stored.
   */
  size_type num_pages() const { return pages_.size(); }

  const page_file_statistics& statistics() const { return stats_; }

  void reset_page_access() { stats_.reset(); }

 private:
  page_id_type allocate_page_id() {
    while (!free_ids_.empty()) {
      page_id_type id = free_ids_.back();
      free_ids_.pop_back();
      // An explicitly written page may have claimed a freed id meanwhile
      if (!contains(id)) {
        return id;
      }
    }
    return next_page_id_++;
  }

  const size_type page_size_;
  std::optional<tree_index_header> header_;
  std::unordered_map<page_id_type, Node> pages_;
  std::vector<page_id_type> free_ids_;
  page_id_type next_page_id_{0};
  page_file_statistics stats_;
};

}  // namespace kressler::paged_tree
