// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <functional>
#include <iterator>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

#include "tie_list.hpp"

namespace kressler::paged_tree {

/**
 * Result of tied_top_bounded_heap::insert().
 */
enum class heap_insert_result {
  inserted,         // Heap was not full
  rejected,         // Worse than the boundary of a full heap, dropped
  tie_added,        // An element tying the boundary moved to the tie set
  ties_superseded,  // Stale ties were replaced by the evicted element
  ties_cleared,     // Boundary improved, old ties dropped
};

/**
 * Size-bounded heap keeping the max_size best elements plus every element
 * tied with the worst of them.
 *
 * A plain bounded heap answering "the k best" has to drop one of two equally
 * good candidates when the k-th and (k+1)-th keys are equal, which makes
 * nearest-neighbor answers depend on insertion order. This heap moves such
 * elements into a tie set instead, so "all elements at least as good as the
 * k-th best" can be recovered exactly.
 *
 * Ordering: comp(a, b) means a is better than b. With the default
 * std::less the smallest elements (e.g. distances) are kept and the largest
 * is evicted first.
 *
 * Structure:
 * - core: binary heap of at most max_size elements, worst element on top
 *   (the boundary)
 * - ties: elements evicted from the core that are equivalent to the
 *   boundary (see tie_list)
 *
 * Implementation notes:
 * - peek() and poll() are serialized against each other; insert() is not,
 *   concurrent inserts need external locking
 * - Iteration visits the ties first, then the core, in no particular order
 *
 * @tparam T Element type
 * @tparam Compare Strict weak ordering, comp(a, b) if a is better than b
 */
template <typename T, typename Compare = std::less<T>>
  requires HeapComparator<T, Compare>
class tied_top_bounded_heap {
 public:
  using value_type = T;
  using size_type = std::size_t;
  using value_compare = Compare;

  /**
   * Forward iterator over ties then core elements.
   */
  class const_iterator {
   public:
    using iterator_category = std::forward_iterator_tag;
    using difference_type = std::ptrdiff_t;
    using value_type = T;
    using pointer = const T*;
    using reference = const T&;

    const_iterator() = default;

    reference operator*() const {
      return tie_it_ != tie_end_ ? *tie_it_ : *core_it_;
    }

    pointer operator->() const { return &**this; }

    const_iterator& operator++() {
      if (tie_it_ != tie_end_) {
        ++tie_it_;
      } else {
        ++core_it_;
      }
      return *this;
    }

    const_iterator operator++(int) {
      const_iterator tmp = *this;
      ++(*this);
      return tmp;
    }

    bool operator==(const const_iterator& other) const {
      return tie_it_ == other.tie_it_ && core_it_ == other.core_it_;
    }

    bool operator!=(const const_iterator& other) const {
      return !(*this == other);
    }

   private:
    friend class tied_top_bounded_heap;

    using tie_iterator = typename tie_list<T, Compare>::const_iterator;
    using core_iterator = typename std::vector<T>::const_iterator;

    const_iterator(tie_iterator tie_it, tie_iterator tie_end,
                   core_iterator core_it)
        : tie_it_(tie_it), tie_end_(tie_end), core_it_(core_it) {}

    tie_iterator tie_it_{};
    tie_iterator tie_end_{};
    core_iterator core_it_{};
  };

  /**
   * Create an empty heap.
   *
   * @param max_size Number of elements kept, not counting ties
   * @param comp Ordering, comp(a, b) if a is better than b
   * @throws std::invalid_argument if max_size is 0
   */
  explicit tied_top_bounded_heap(size_type max_size, Compare comp = Compare())
      : comp_(comp), ties_(comp), max_size_(max_size) {
    if (max_size_ == 0) {
      throw std::invalid_argument(
          "tied_top_bounded_heap: max_size must be > 0");
    }
    core_.reserve(max_size_ + 1);
  }

  // Non-copyable, non-movable (owns a mutex)
  tied_top_bounded_heap(const tied_top_bounded_heap&) = delete;
  tied_top_bounded_heap& operator=(const tied_top_bounded_heap&) = delete;
  tied_top_bounded_heap(tied_top_bounded_heap&&) = delete;
  tied_top_bounded_heap& operator=(tied_top_bounded_heap&&) = delete;

  /**
   * Offer an element.
   *
   * If the core is full, an element worse than the boundary is dropped.
   * Otherwise it joins the core and, if that overflows, the worst core
   * element is evicted and handed to the tie set.
   *
   * @return What the insertion did
   */
  heap_insert_result insert(T element) {
    if (core_.size() >= max_size_ && comp_(core_.front(), element)) {
      return heap_insert_result::rejected;
    }
    core_.push_back(std::move(element));
    std::push_heap(core_.begin(), core_.end(), comp_);
    if (core_.size() <= max_size_) {
      return heap_insert_result::inserted;
    }

    std::pop_heap(core_.begin(), core_.end(), comp_);
    T evicted = std::move(core_.back());
    core_.pop_back();
    switch (ties_.on_overflow(std::move(evicted), core_.front())) {
      case tie_transition::tie_added:
        return heap_insert_result::tie_added;
      case tie_transition::ties_superseded:
        return heap_insert_result::ties_superseded;
      case tie_transition::ties_cleared:
        break;
    }
    return heap_insert_result::ties_cleared;
  }

  /**
   * Number of elements, core and ties.
   */
  size_type size() const { return core_.size() + ties_.size(); }

  [[nodiscard]] bool empty() const { return size() == 0; }

  size_type max_size() const { return max_size_; }

  /**
   * Number of elements held in the tie set.
   */
  size_type num_ties() const { return ties_.size(); }

  /**
   * Worst element kept, if any. Tied elements are reported first; they are
   * equivalent to the core boundary.
   */
  std::optional<T> peek() const {
    std::lock_guard<std::mutex> lock(access_mutex_);
    if (!ties_.empty()) {
      return ties_.front();
    }
    if (core_.empty()) {
      return std::nullopt;
    }
    return core_.front();
  }

  /**
   * Remove and return the worst element, ties first.
   */
  std::optional<T> poll() {
    std::lock_guard<std::mutex> lock(access_mutex_);
    if (!ties_.empty()) {
      return ties_.pop_front();
    }
    if (core_.empty()) {
      return std::nullopt;
    }
    std::pop_heap(core_.begin(), core_.end(), comp_);
    T element = std::move(core_.back());
    core_.pop_back();
    return element;
  }

  /**
   * True if an equal element is held in the core or the tie set.
   */
  bool contains(const T& element) const
    requires std::equality_comparable<T>
  {
    return ties_.contains(element) ||
           std::find(core_.begin(), core_.end(), element) != core_.end();
  }

  void clear() {
    core_.clear();
    ties_.clear();
  }

  const_iterator begin() const {
    return const_iterator(ties_.begin(), ties_.end(), core_.begin());
  }

  const_iterator end() const {
    return const_iterator(ties_.end(), ties_.end(), core_.end());
  }

  /**
   * All elements best first; ties come last.
   */
  std::vector<T> to_sorted_vector() const {
    std::vector<T> result(core_.begin(), core_.end());
    std::sort(result.begin(), result.end(), comp_);
    result.insert(result.end(), ties_.begin(), ties_.end());
    return result;
  }

 private:
  [[no_unique_address]] Compare comp_;
  std::vector<T> core_;
  tie_list<T, Compare> ties_;
  const size_type max_size_;
  mutable std::mutex access_mutex_;
};

}  // namespace kressler::paged_tree
