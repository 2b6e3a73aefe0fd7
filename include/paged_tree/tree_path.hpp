// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <algorithm>
#include <cstddef>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

namespace kressler::paged_tree {

/**
 * One step of a path through an index tree: the entry that was followed and
 * its position inside the parent node (none for the root entry).
 */
template <typename Entry>
struct tree_path_component {
  Entry entry;
  std::optional<std::size_t> index;

  tree_path_component(Entry entry, std::optional<std::size_t> index)
      : entry(std::move(entry)), index(index) {}
};

/**
 * Immutable path from the root of an index tree down to one entry.
 *
 * Paths form a persistent singly-linked list: extending a path with
 * path_by_adding_child() shares all ancestors with the original, so a
 * variant can descend, keep the intermediate paths around and backtrack
 * without copying or re-reading anything. Copying a path is O(1).
 *
 * @tparam Entry The entry type of the tree
 */
template <typename Entry>
class tree_path {
 public:
  using component_type = tree_path_component<Entry>;

  /**
   * Create a path consisting of a single (root) component.
   */
  explicit tree_path(component_type root)
      : last_(std::make_shared<const link>(std::move(root), nullptr)) {}

  /**
   * Returns the component at the end of this path.
   */
  const component_type& last_component() const { return last_->component; }

  /**
   * Entry at the end of this path.
   */
  const Entry& entry() const { return last_->component.entry; }

  /**
   * Position of the last entry inside its parent node.
   */
  std::optional<std::size_t> index() const { return last_->component.index; }

  /**
   * Returns the path without its last component, or std::nullopt for a
   * single-component path.
   */
  std::optional<tree_path> parent_path() const {
    if (last_->parent == nullptr) {
      return std::nullopt;
    }
    return tree_path(last_->parent);
  }

  /**
   * Number of components, i.e. the depth of the last entry plus one.
   */
  std::size_t path_count() const { return last_->count; }

  [[nodiscard]] bool is_root() const { return last_->parent == nullptr; }

  /**
   * Returns a new path extending this one by child. This path is unchanged.
   */
  tree_path path_by_adding_child(component_type child) const {
    return tree_path(std::make_shared<const link>(std::move(child), last_));
  }

  tree_path path_by_adding_child(Entry entry, std::size_t index) const {
    return path_by_adding_child(component_type(std::move(entry), index));
  }

  /**
   * Returns all components, root first.
   */
  std::vector<component_type> components() const {
    std::vector<component_type> result;
    result.reserve(last_->count);
    for (const link* l = last_.get(); l != nullptr; l = l->parent.get()) {
      result.push_back(l->component);
    }
    std::reverse(result.begin(), result.end());
    return result;
  }

  /**
   * True if both paths end in the same shared component.
   */
  [[nodiscard]] bool shares_tail_with(const tree_path& other) const {
    return last_ == other.last_;
  }

 private:
  struct link {
    component_type component;
    std::shared_ptr<const link> parent;
    std::size_t count;

    link(component_type component, std::shared_ptr<const link> parent)
        : component(std::move(component)),
          parent(std::move(parent)),
          count(this->parent == nullptr ? 1 : this->parent->count + 1) {}
  };

  explicit tree_path(std::shared_ptr<const link> last) : last_(std::move(last)) {}

  std::shared_ptr<const link> last_;
};

}  // namespace kressler::paged_tree
