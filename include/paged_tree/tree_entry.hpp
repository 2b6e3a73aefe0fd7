// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <string>
#include <utility>
#include <variant>

#include "errors.hpp"
#include "page_file.hpp"

namespace kressler::paged_tree {

/**
 * Routing data of a directory entry for variants that need none.
 */
struct no_routing {
  bool operator==(const no_routing&) const = default;
};

/**
 * An entry of an index tree node.
 *
 * An entry is either
 * - a leaf entry, holding the payload stored in the tree, or
 * - a directory entry, referencing the page of a child node together with
 *   the routing data the variant keeps for that child (a bounding box, a
 *   covering radius, ...).
 *
 * The kind is a tag (std::variant), so code inspecting entries branches on
 * is_leaf_entry() or visit() instead of on a class hierarchy.
 *
 * @tparam Payload The data stored in leaf entries
 * @tparam Routing The data stored beside child ids in directory entries
 */
template <typename Payload, typename Routing = no_routing>
class tree_entry {
 public:
  using payload_type = Payload;
  using routing_type = Routing;

  struct leaf_data {
    Payload payload;

    bool operator==(const leaf_data&) const = default;
  };

  struct directory_data {
    page_id_type page_id;
    Routing routing;

    bool operator==(const directory_data&) const = default;
  };

  /**
   * Create a leaf entry holding the given payload.
   */
  static tree_entry make_leaf(Payload payload) {
    return tree_entry(leaf_data{std::move(payload)});
  }

  /**
   * Create a directory entry referencing the node stored on page_id.
   */
  static tree_entry make_directory(page_id_type page_id,
                                   Routing routing = Routing()) {
    return tree_entry(directory_data{page_id, std::move(routing)});
  }

  [[nodiscard]] bool is_leaf_entry() const {
    return std::holds_alternative<leaf_data>(data_);
  }

  /**
   * Returns the page id of the referenced child node.
   *
   * @throws unsupported_operation for leaf entries
   */
  page_id_type page_id() const {
    if (const auto* dir = std::get_if<directory_data>(&data_)) {
      return dir->page_id;
    }
    throw unsupported_operation("Leaf entries do not have page ids");
  }

  /**
   * Returns the payload of a leaf entry.
   *
   * @throws unsupported_operation for directory entries
   */
  const Payload& payload() const {
    if (const auto* leaf = std::get_if<leaf_data>(&data_)) {
      return leaf->payload;
    }
    throw unsupported_operation("Directory entries do not carry a payload");
  }

  /**
   * Returns the routing data of a directory entry.
   *
   * @throws unsupported_operation for leaf entries
   */
  const Routing& routing() const {
    if (const auto* dir = std::get_if<directory_data>(&data_)) {
      return dir->routing;
    }
    throw unsupported_operation("Leaf entries do not carry routing data");
  }

  /**
   * Replace the routing data of a directory entry, e.g. after the child
   * node grew.
   *
   * @throws unsupported_operation for leaf entries
   */
  void set_routing(Routing routing) {
    auto* dir = std::get_if<directory_data>(&data_);
    if (dir == nullptr) {
      throw unsupported_operation("Leaf entries do not carry routing data");
    }
    dir->routing = std::move(routing);
  }

  /**
   * Apply a visitor to the leaf_data or directory_data alternative.
   */
  template <typename Visitor>
  decltype(auto) visit(Visitor&& visitor) const {
    return std::visit(std::forward<Visitor>(visitor), data_);
  }

  bool operator==(const tree_entry&) const = default;

 private:
  explicit tree_entry(leaf_data data) : data_(std::move(data)) {}
  explicit tree_entry(directory_data data) : data_(std::move(data)) {}

  std::variant<leaf_data, directory_data> data_;
};

}  // namespace kressler::paged_tree
