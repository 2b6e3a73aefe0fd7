// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "page_file.hpp"

namespace kressler::paged_tree {

/**
 * In-memory image of one page of an index tree.
 *
 * A node is either a leaf (all entries are leaf entries) or a directory
 * node (all entries reference child nodes). Its identity is its page id:
 * two nodes with the same page id are the same stored node read at
 * different times. A freshly created node has no page id until it is
 * written to the page file.
 *
 * The node accepts up to capacity entries. Since a capacity is one more
 * than the number of entries a node may keep, a node holding capacity
 * entries is overflowing and must be split by the tree variant before it
 * is written.
 *
 * @tparam Entry The entry type (see tree_entry)
 */
template <typename Entry>
class tree_node {
 public:
  using entry_type = Entry;
  using size_type = std::size_t;
  using iterator = typename std::vector<Entry>::iterator;
  using const_iterator = typename std::vector<Entry>::const_iterator;

  /**
   * Create an empty node.
   *
   * @param capacity One plus the maximum number of entries
   * @param is_leaf True for a leaf node
   */
  tree_node(size_type capacity, bool is_leaf)
      : page_id_(invalid_page_id), capacity_(capacity), is_leaf_(is_leaf) {
    entries_.reserve(capacity);
  }

  page_id_type page_id() const { return page_id_; }

  void set_page_id(page_id_type page_id) { page_id_ = page_id; }

  [[nodiscard]] bool is_leaf() const { return is_leaf_; }

  size_type capacity() const { return capacity_; }

  size_type num_entries() const { return entries_.size(); }

  [[nodiscard]] bool empty() const { return entries_.empty(); }

  /**
   * True once the node holds capacity entries and needs a split.
   */
  [[nodiscard]] bool is_overflowing() const {
    return entries_.size() >= capacity_;
  }

  /**
   * Append an entry.
   *
   * @return Index of the new entry
   * @throws std::invalid_argument if the entry kind does not match the node
   * @throws std::runtime_error if the node already holds capacity entries
   */
  size_type add_entry(Entry entry) {
    if (entry.is_leaf_entry() != is_leaf_) {
      throw std::invalid_argument(
          is_leaf_ ? "Cannot add directory entry to a leaf node"
                   : "Cannot add leaf entry to a directory node");
    }
    if (entries_.size() >= capacity_) {
      throw std::runtime_error("Cannot add entry: node is full");
    }
    entries_.push_back(std::move(entry));
    return entries_.size() - 1;
  }

  const Entry& entry(size_type index) const {
    check_index(index);
    return entries_[index];
  }

  Entry& entry(size_type index) {
    check_index(index);
    return entries_[index];
  }

  /**
   * Remove the entry at index, shifting later entries down.
   */
  void delete_entry(size_type index) {
    check_index(index);
    entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(index));
  }

  /**
   * Remove the entry at index and return it.
   */
  Entry remove_entry(size_type index) {
    check_index(index);
    Entry removed = std::move(entries_[index]);
    entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(index));
    return removed;
  }

  void clear() { entries_.clear(); }

  iterator begin() { return entries_.begin(); }
  iterator end() { return entries_.end(); }
  const_iterator begin() const { return entries_.begin(); }
  const_iterator end() const { return entries_.end(); }

 private:
  void check_index(size_type index) const {
    if (index >= entries_.size()) {
      throw std::out_of_range("tree_node: entry index " +
                              std::to_string(index) + " out of range (" +
                              std::to_string(entries_.size()) + " entries)");
    }
  }

  page_id_type page_id_;
  size_type capacity_;
  bool is_leaf_;
  std::vector<Entry> entries_;
};

}  // namespace kressler::paged_tree
