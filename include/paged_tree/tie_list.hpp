// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <deque>
#include <utility>

namespace kressler::paged_tree {

/**
 * Comparator usable for bounded heaps: a strict weak ordering where
 * comp(a, b) means a is better than b.
 */
template <typename T, typename Compare>
concept HeapComparator = requires(const Compare comp, const T& a, const T& b) {
  { comp(a, b) } -> std::convertible_to<bool>;
};

/**
 * What happened to the tie set when a bounded heap evicted an element.
 */
enum class tie_transition {
  tie_added,        // Evicted element ties the boundary and was kept
  ties_superseded,  // Old ties were worse than the new tie, replaced by it
  ties_cleared,     // Boundary moved past the old ties; all dropped
};

/**
 * Elements evicted from a bounded heap that tie its boundary element.
 *
 * All members share one key (equivalent under Compare), which is the key
 * of the heap's current worst element. on_overflow() is the only mutation
 * path besides pop_front() and clear() and decides, for each evicted
 * element, which of the three tie_transitions applies.
 *
 * @tparam T Element type
 * @tparam Compare Strict weak ordering, comp(a, b) if a is better than b
 */
template <typename T, typename Compare>
  requires HeapComparator<T, Compare>
class tie_list {
 public:
  using size_type = std::size_t;
  using const_iterator = typename std::deque<T>::const_iterator;

  explicit tie_list(Compare comp = Compare()) : comp_(std::move(comp)) {}

  /**
   * Handle an element evicted from the heap.
   *
   * @param evicted The element removed from the heap
   * @param boundary The heap's worst element after the eviction
   */
  tie_transition on_overflow(T evicted, const T& boundary) {
    if (!equivalent(evicted, boundary)) {
      ties_.clear();
      return tie_transition::ties_cleared;
    }
    tie_transition transition = tie_transition::tie_added;
    if (!ties_.empty() && comp_(evicted, ties_.front())) {
      // Ties of an earlier, worse boundary
      ties_.clear();
      transition = tie_transition::ties_superseded;
    }
    ties_.push_back(std::move(evicted));
    return transition;
  }

  [[nodiscard]] bool empty() const { return ties_.empty(); }

  size_type size() const { return ties_.size(); }

  const T& front() const { return ties_.front(); }

  T pop_front() {
    T element = std::move(ties_.front());
    ties_.pop_front();
    return element;
  }

  void clear() { ties_.clear(); }

  bool contains(const T& element) const
    requires std::equality_comparable<T>
  {
    return std::find(ties_.begin(), ties_.end(), element) != ties_.end();
  }

  const_iterator begin() const { return ties_.begin(); }
  const_iterator end() const { return ties_.end(); }

 private:
  bool equivalent(const T& a, const T& b) const {
    return !comp_(a, b) && !comp_(b, a);
  }

  [[no_unique_address]] Compare comp_;
  std::deque<T> ties_;
};

}  // namespace kressler::paged_tree
