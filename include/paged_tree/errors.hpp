// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <stdexcept>
#include <string>

namespace kressler::paged_tree {

/**
 * Thrown when an operation is requested from an entry kind that cannot
 * support it, e.g. asking a leaf entry for the page id of its child.
 * This is a programming error in the calling tree variant.
 */
class unsupported_operation : public std::logic_error {
 public:
  explicit unsupported_operation(const std::string& what)
      : std::logic_error(what) {}
};

/**
 * Thrown when the root accessors or capacity-dependent operations are used
 * before the tree finished bootstrapping.
 */
class tree_not_initialized : public std::logic_error {
 public:
  explicit tree_not_initialized(const std::string& what)
      : std::logic_error(what) {}
};

/**
 * Thrown when capacity parameters are unusable: a persisted header that does
 * not fit the page file it was read from, or a page size too small to hold
 * a node.
 */
class configuration_mismatch : public std::runtime_error {
 public:
  explicit configuration_mismatch(const std::string& what)
      : std::runtime_error(what) {}
};

}  // namespace kressler::paged_tree
