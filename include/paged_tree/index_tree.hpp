// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <fmt/format.h>
#include <fmt/ostream.h>

#include <cstddef>
#include <memory>
#include <optional>
#include <ostream>
#include <utility>

#include "errors.hpp"
#include "memory_page_file.hpp"
#include "page_file.hpp"
#include "tree_index_header.hpp"
#include "tree_path.hpp"
#include "tree_variant.hpp"

namespace kressler::paged_tree {

/**
 * Generic page-based index tree, the common core of R-trees, M-trees and
 * similar balanced spatial/metric indexes.
 *
 * The tree maps nodes to pages of a page file, owns the root entry and the
 * capacity parameters, and offers the node access path every variant uses.
 * How entries are inserted, split, merged or searched is up to the variant:
 * its algorithms call into the tree for nodes, and the tree calls back into
 * the variant policy (see TreeVariant) for everything that depends on the
 * concrete node layout.
 *
 * ## Bootstrap
 *
 * initialize() attaches to the page file. If the file already holds a built
 * tree, its stored capacities replace the ones configured on this handle: a
 * reattach always uses the capacities the stored tree was built with. A file
 * that was only claimed by another handle leaves this one uninitialized. The
 * root entry is (re)computed by the variant either way, so the root must
 * stay on the page the variant names.
 *
 * initialize(example_leaf) builds a brand-new tree: the variant derives the
 * capacities from the page size and the example entry, the header is
 * finalised and the variant writes an empty root leaf. Variants usually
 * call ensure_initialized() on first insert.
 *
 * ## Invariants
 *
 * Every non-root node of kind K holds between minimum_K and capacity_K - 1
 * entries. The tree does not enforce this when writing nodes; the capacity
 * accessors are the single source of truth variant algorithms consult, and
 * is_overflowing()/is_underflowing() check a node against them.
 *
 * Implementation notes:
 * - Not thread-safe: one owner drives structural changes at a time
 * - The page file is shared so a later handle can reattach to it, but only
 *   one tree may use it at a time
 * - Page file errors (e.g. std::out_of_range for unknown pages) propagate
 *   unchanged; nothing is retried
 *
 * @tparam Node The node type (see tree_node)
 * @tparam Variant Hook policy of the concrete tree variant
 * @tparam PageFile The page file type (see PageStore)
 */
template <typename Node, typename Variant = basic_tree_variant<Node>,
          typename PageFile = memory_page_file<Node>>
  requires PageStore<PageFile, Node>
class index_tree {
 public:
  using node_type = Node;
  using entry_type = typename Node::entry_type;
  using variant_type = Variant;
  using page_file_type = PageFile;
  using path_type = tree_path<entry_type>;
  using size_type = std::size_t;

  /**
   * Create a tree handle on a page file. Nothing is read or written until
   * initialize() is called.
   *
   * @param file The page file storing the nodes
   * @param variant Hook policy of the tree variant
   * @param capacities Capacities to advertise for a fresh page file. They
   * are replaced by the stored ones when attaching to an existing tree.
   */
  explicit index_tree(std::shared_ptr<PageFile> file,
                      Variant variant = Variant(),
                      const tree_capacities& capacities = tree_capacities());

  // Non-copyable: two handles must not drive the same page file
  index_tree(const index_tree&) = delete;
  index_tree& operator=(const index_tree&) = delete;

  index_tree(index_tree&&) = default;
  index_tree& operator=(index_tree&&) = default;

  /**
   * Attach to the page file and compute the root entry.
   *
   * @throws configuration_mismatch if the stored header is unusable
   */
  void initialize();

  /**
   * Build a new tree: compute capacities from example_leaf, finalise the
   * header and write an empty root. Attaches to the page file first if
   * initialize() has not been called.
   *
   * @param example_leaf An entry of the kind that will be stored
   * @throws std::logic_error if the tree is already initialized
   * @throws configuration_mismatch if the variant's capacities are unusable
   */
  void initialize(const entry_type& example_leaf);

  /**
   * Attach if needed and build the tree unless the page file already held
   * one. Intended to be called by variants on their first insert.
   */
  void ensure_initialized(const entry_type& example_leaf);

  /**
   * True once capacities are fixed, either read from the page file or
   * computed by initialize(example_leaf).
   */
  [[nodiscard]] bool initialized() const {
    return state_ == tree_state::ready;
  }

  /**
   * Returns the entry representing the root.
   *
   * @throws tree_not_initialized before initialize()
   */
  const entry_type& get_root_entry() const;

  /**
   * Page id of the root node.
   *
   * @throws tree_not_initialized before initialize()
   */
  page_id_type get_root_id() const { return get_page_id(get_root_entry()); }

  /**
   * Reads the root node from the page file. Every call reads the page.
   */
  Node get_root() { return file_->read_page(get_root_id()); }

  /**
   * Test if a node is the root.
   */
  [[nodiscard]] bool is_root(const Node& node) const {
    return node.page_id() == get_root_id();
  }

  /**
   * Returns the single-component path consisting of the root entry.
   */
  path_type get_root_path() const {
    return path_type(typename path_type::component_type(get_root_entry(),
                                                        std::nullopt));
  }

  /**
   * Replace the in-memory root entry, e.g. to refresh its routing data after
   * the root node changed. The root stays on the page chosen by the variant:
   * a root split moves the old root's entries to a new page and rewrites the
   * root page, so reattaching handles find the same root.
   *
   * @throws std::invalid_argument for leaf entries
   * @throws unsupported_operation if the entry references another page
   * @throws tree_not_initialized before initialize()
   */
  void replace_root_entry(entry_type entry);

  /**
   * Convert a directory entry to the page id of its child.
   *
   * @throws unsupported_operation for leaf entries
   */
  page_id_type get_page_id(const entry_type& entry) const;

  /**
   * Returns the node stored on the given page.
   */
  Node get_node(page_id_type page_id);

  /**
   * Returns the node an entry refers to.
   *
   * @throws unsupported_operation for leaf entries
   */
  Node get_node(const entry_type& entry) { return get_node(get_page_id(entry)); }

  /**
   * Write a node to the page file, assigning a page id if it has none.
   *
   * @return The page id of the node
   */
  page_id_type write_node(Node& node) { return file_->write_page(node); }

  /**
   * Delete a node from the page file.
   */
  void delete_node(const Node& node) { file_->delete_page(node.page_id()); }

  /**
   * Create an unwritten leaf node through the variant.
   *
   * @throws tree_not_initialized if no capacities are known yet
   */
  Node create_leaf_node();

  /**
   * Create an unwritten directory node through the variant.
   *
   * @throws tree_not_initialized if no capacities are known yet
   */
  Node create_directory_node();

  /**
   * Bookkeeping before a variant inserts entry. No-op unless the variant
   * defines pre_insert.
   */
  void pre_insert(const entry_type& entry);

  /**
   * Bookkeeping after a variant removed entry. No-op unless the variant
   * defines post_delete.
   */
  void post_delete(const entry_type& entry);

  size_type dir_capacity() const { return capacities_.dir_capacity; }
  size_type leaf_capacity() const { return capacities_.leaf_capacity; }
  size_type dir_minimum() const { return capacities_.dir_minimum; }
  size_type leaf_minimum() const { return capacities_.leaf_minimum; }
  const tree_capacities& capacities() const { return capacities_; }

  /**
   * True if node holds as many entries as its capacity and must be split.
   */
  [[nodiscard]] bool is_overflowing(const Node& node) const;

  /**
   * True if a non-root node holds fewer entries than its kind's minimum.
   */
  [[nodiscard]] bool is_underflowing(const Node& node) const;

  /**
   * Page access counters of the page file.
   */
  const page_file_statistics& get_page_file_statistics() const {
    return file_->statistics();
  }

  void reset_page_access() { file_->reset_page_access(); }

  /**
   * Page size of the page file.
   */
  size_type page_size() const { return file_->page_size(); }

  Variant& variant() { return variant_; }
  const Variant& variant() const { return variant_; }

  /**
   * Send debug messages to os; nullptr disables them.
   */
  void set_debug_stream(std::ostream* os) { debug_stream_ = os; }

  /**
   * Print the tree, one node per line indented by depth. Reads every page.
   */
  void dump(std::ostream& os);

 private:
  enum class tree_state { uninitialized, ready };

  /**
   * Header advertising the current capacities.
   */
  tree_index_header create_header(bool built) const {
    return tree_index_header(file_->page_size(), capacities_, built);
  }

  /**
   * Adopt the capacities of an existing tree.
   */
  void initialize_from_file(const tree_index_header& header);

  /**
   * Fix the capacities, finalise the header and write the empty root.
   */
  void create_tree(const entry_type& example_leaf);

  /**
   * Sanity checks shared by both bootstrap paths.
   */
  static void validate_capacities(const tree_capacities& capacities);

  void dump_node(std::ostream& os, const Node& node, size_type depth);

  template <typename... Args>
  void debug(fmt::format_string<Args...> format, Args&&... args) const {
    if (debug_stream_ != nullptr) {
      fmt::print(*debug_stream_, format, std::forward<Args>(args)...);
      *debug_stream_ << '\n';
    }
  }

  std::shared_ptr<PageFile> file_;
  [[no_unique_address]] Variant variant_;
  tree_capacities capacities_;
  tree_state state_{tree_state::uninitialized};
  std::optional<entry_type> root_entry_;
  std::ostream* debug_stream_{nullptr};
};

}  // namespace kressler::paged_tree

// Include implementation
#include "index_tree.ipp"
