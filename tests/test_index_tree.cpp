// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#include <array>
#include <catch2/catch_test_macros.hpp>
#include <cstddef>
#include <limits>
#include <memory>
#include <paged_tree/errors.hpp>
#include <paged_tree/index_tree.hpp>
#include <paged_tree/memory_page_file.hpp>
#include <paged_tree/tree_entry.hpp>
#include <paged_tree/tree_node.hpp>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace kressler::paged_tree;

namespace {

using point = std::array<double, 2>;
using entry = tree_entry<point>;
using node = tree_node<entry>;
using page_file = memory_page_file<node>;
using tree = index_tree<node>;

// 128 byte pages, 9 byte node header:
//   leaf entries (16 bytes): 7 per node, minimum round(7 * 0.4) = 3
//   dir entries (4 bytes): 29 per node, minimum round(29 * 0.4) = 12
constexpr std::size_t small_page = 128;
const tree_capacities small_page_capacities{30, 8, 12, 3};

entry example_leaf() { return entry::make_leaf({0.0, 0.0}); }

// Variant adding bookkeeping and a capacity check to the basic hooks
struct counting_variant : basic_tree_variant<node> {
  int inserts = 0;
  int deletes = 0;
  std::size_t max_leaf_capacity = std::numeric_limits<std::size_t>::max();

  template <typename Tree>
  void pre_insert(Tree&, const entry&) {
    ++inserts;
  }

  template <typename Tree>
  void post_delete(Tree&, const entry&) {
    ++deletes;
  }

  template <typename Tree>
  void check_capacities(const Tree&, const tree_capacities& capacities) const {
    if (capacities.leaf_capacity > max_leaf_capacity) {
      throw configuration_mismatch("leaf capacity too large");
    }
  }
};

// Minimal insertion: append to the root leaf, no splitting
template <typename Tree>
void append_to_root(Tree& t, const entry& e) {
  t.ensure_initialized(e);
  t.pre_insert(e);
  node root = t.get_root();
  root.add_entry(e);
  t.write_node(root);
}

// Root split as the basic variant expects it: the old root's entries move to
// a fresh page and the root page is rewritten as a directory above them
template <typename Tree>
page_id_type grow_root(Tree& t) {
  node old_root = t.get_root();
  node moved =
      old_root.is_leaf() ? t.create_leaf_node() : t.create_directory_node();
  for (const auto& e : old_root) {
    moved.add_entry(e);
  }
  page_id_type moved_id = t.write_node(moved);

  node new_root = t.create_directory_node();
  new_root.set_page_id(t.get_root_id());
  new_root.add_entry(entry::make_directory(moved_id));
  t.write_node(new_root);
  return moved_id;
}

}  // namespace

TEST_CASE("index_tree accessors before initialize", "[index_tree]") {
  auto file = std::make_shared<page_file>(small_page);
  tree t(file);

  REQUIRE_FALSE(t.initialized());
  REQUIRE(t.page_size() == small_page);
  REQUIRE_THROWS_AS(t.get_root_entry(), tree_not_initialized);
  REQUIRE_THROWS_AS(t.get_root_id(), tree_not_initialized);
  REQUIRE_THROWS_AS(t.get_root(), tree_not_initialized);
  REQUIRE_THROWS_AS(t.get_root_path(), tree_not_initialized);
  REQUIRE_THROWS_AS(t.get_node(0), tree_not_initialized);
  REQUIRE_THROWS_AS(t.create_leaf_node(), tree_not_initialized);
  REQUIRE_THROWS_AS(t.create_directory_node(), tree_not_initialized);
  REQUIRE_THROWS_AS(t.replace_root_entry(entry::make_directory(1)),
                    tree_not_initialized);

  REQUIRE_THROWS_AS(tree(nullptr), std::invalid_argument);
}

TEST_CASE("index_tree bootstrap of a new tree", "[index_tree][bootstrap]") {
  auto file = std::make_shared<page_file>(small_page);
  tree t(file);

  t.initialize();
  REQUIRE_FALSE(t.initialized());
  REQUIRE(t.get_root_id() == 0);
  REQUIRE(file->header().has_value());
  REQUIRE_FALSE(file->header()->built);

  t.initialize(example_leaf());
  REQUIRE(t.initialized());
  REQUIRE(t.capacities() == small_page_capacities);
  REQUIRE(t.leaf_capacity() == 8);
  REQUIRE(t.dir_capacity() == 30);
  REQUIRE(t.leaf_minimum() == 3);
  REQUIRE(t.dir_minimum() == 12);

  SECTION("The header is finalised") {
    REQUIRE(file->header() == tree_index_header(
                                  small_page, small_page_capacities, true));
  }

  SECTION("An empty root leaf is written") {
    node root = t.get_root();
    REQUIRE(root.is_leaf());
    REQUIRE(root.empty());
    REQUIRE(root.capacity() == 8);
    REQUIRE(t.is_root(root));
    REQUIRE(file->num_pages() == 1);
  }

  SECTION("Root accessors agree") {
    REQUIRE(t.get_node(t.get_root_id()).page_id() ==
            t.get_root().page_id());
    REQUIRE(t.get_node(t.get_root_entry()).page_id() == t.get_root_id());
    REQUIRE(t.get_root_path().entry() == t.get_root_entry());
    REQUIRE(t.get_root_path().is_root());
  }

  SECTION("Capacities are fixed once built") {
    REQUIRE_THROWS_AS(t.initialize(example_leaf()), std::logic_error);
  }
}

TEST_CASE("index_tree initialize(example_leaf) attaches implicitly",
          "[index_tree][bootstrap]") {
  auto file = std::make_shared<page_file>(small_page);
  tree t(file);

  t.initialize(example_leaf());
  REQUIRE(t.initialized());
  REQUIRE(t.get_root_id() == 0);
  REQUIRE(t.get_root().is_leaf());
}

TEST_CASE("index_tree reattaches to an existing page file",
          "[index_tree][bootstrap]") {
  auto file = std::make_shared<page_file>(small_page);
  {
    tree first(file);
    append_to_root(first, entry::make_leaf({1.0, 2.0}));
    append_to_root(first, entry::make_leaf({3.0, 4.0}));
  }

  SECTION("Stored capacities win over configured ones") {
    tree second(file, basic_tree_variant<node>(),
                tree_capacities{50, 60, 20, 25});
    REQUIRE(second.capacities() == tree_capacities{50, 60, 20, 25});

    second.initialize();
    REQUIRE(second.initialized());
    REQUIRE(second.capacities() == small_page_capacities);
    REQUIRE(second.get_root().num_entries() == 2);
  }

  SECTION("ensure_initialized does not rebuild") {
    tree second(file);
    append_to_root(second, entry::make_leaf({5.0, 6.0}));
    REQUIRE(second.get_root().num_entries() == 3);
    REQUIRE(file->num_pages() == 1);
  }

  SECTION("The header is not rewritten") {
    tree second(file, basic_tree_variant<node>(),
                tree_capacities{50, 60, 20, 25});
    second.initialize();
    REQUIRE(file->header() == tree_index_header(
                                  small_page, small_page_capacities, true));
  }
}

TEST_CASE("index_tree reattach to a file that was never built",
          "[index_tree][bootstrap]") {
  auto file = std::make_shared<page_file>(small_page);
  {
    tree first(file);
    first.initialize();
  }

  tree second(file);
  second.initialize();
  REQUIRE_FALSE(second.initialized());

  second.initialize(example_leaf());
  REQUIRE(second.initialized());
  REQUIRE(second.capacities() == small_page_capacities);
}

TEST_CASE("index_tree ignores capacities of a handle that never built",
          "[index_tree][bootstrap]") {
  auto file = std::make_shared<page_file>(small_page);
  tree first(file, basic_tree_variant<node>(), small_page_capacities);
  first.initialize();
  REQUIRE_FALSE(first.initialized());
  REQUIRE(file->header() ==
          tree_index_header(small_page, small_page_capacities, false));

  tree second(file);
  second.initialize();
  REQUIRE_FALSE(second.initialized());
  REQUIRE(file->num_pages() == 0);

  // The second handle builds the tree and stores an entry
  append_to_root(second, entry::make_leaf({1.0, 2.0}));
  REQUIRE(second.initialized());
  REQUIRE(second.get_root().num_entries() == 1);

  SECTION("The first handle adopts the built tree") {
    append_to_root(first, entry::make_leaf({3.0, 4.0}));
    REQUIRE(first.initialized());
    REQUIRE(first.get_root().num_entries() == 2);
    REQUIRE(file->num_pages() == 1);
  }

  SECTION("Building again from the first handle is refused") {
    REQUIRE_THROWS_AS(first.initialize(example_leaf()), std::logic_error);
    REQUIRE(first.initialized());
    REQUIRE(file->header() ==
            tree_index_header(small_page, small_page_capacities, true));
    REQUIRE(first.get_root().num_entries() == 1);
  }
}

TEST_CASE("index_tree rejects unusable stored headers",
          "[index_tree][bootstrap]") {
  auto file = std::make_shared<page_file>(small_page);

  SECTION("Page size mismatch") {
    file->write_header(tree_index_header(256, small_page_capacities, true));
    tree t(file);
    REQUIRE_THROWS_AS(t.initialize(), configuration_mismatch);
    REQUIRE_FALSE(t.initialized());
  }

  SECTION("Capacity too small to split") {
    file->write_header(tree_index_header(small_page, {2, 8, 1, 3}, true));
    tree t(file);
    REQUIRE_THROWS_AS(t.initialize(), configuration_mismatch);
  }

  SECTION("Minimum out of range") {
    file->write_header(tree_index_header(small_page, {30, 8, 12, 8}, true));
    tree t(file);
    REQUIRE_THROWS_AS(t.initialize(), configuration_mismatch);
  }

  SECTION("Variant veto") {
    file->write_header(
        tree_index_header(small_page, small_page_capacities, true));
    counting_variant variant;
    variant.max_leaf_capacity = 4;
    index_tree<node, counting_variant> t(file, variant);
    REQUIRE_THROWS_AS(t.initialize(), configuration_mismatch);
  }
}

TEST_CASE("index_tree page ids of entries", "[index_tree]") {
  auto file = std::make_shared<page_file>(small_page);
  tree t(file);
  t.initialize(example_leaf());

  REQUIRE(t.get_page_id(entry::make_directory(17)) == 17);

  SECTION("Leaf entries have no page id") {
    REQUIRE_THROWS_AS(t.get_page_id(example_leaf()), unsupported_operation);
    REQUIRE_THROWS_AS(t.get_node(example_leaf()), unsupported_operation);
  }

  SECTION("Same failure for other payload shapes") {
    using vector_entry = tree_entry<std::vector<double>>;
    using vector_node = tree_node<vector_entry>;
    auto vector_file =
        std::make_shared<memory_page_file<vector_node>>(small_page);
    index_tree<vector_node> vector_tree(vector_file);
    auto leaf = vector_entry::make_leaf({1.0, 2.0, 3.0});
    vector_tree.initialize(leaf);

    REQUIRE_THROWS_AS(vector_tree.get_page_id(leaf), unsupported_operation);
    REQUIRE_THROWS_AS(vector_tree.get_page_id(vector_entry::make_leaf({})),
                      unsupported_operation);
  }
}

TEST_CASE("index_tree node access", "[index_tree]") {
  auto file = std::make_shared<page_file>(small_page);
  tree t(file);
  t.initialize(example_leaf());

  SECTION("Nodes created through the variant use the capacities") {
    node leaf = t.create_leaf_node();
    node dir = t.create_directory_node();
    REQUIRE(leaf.is_leaf());
    REQUIRE(leaf.capacity() == t.leaf_capacity());
    REQUIRE_FALSE(dir.is_leaf());
    REQUIRE(dir.capacity() == t.dir_capacity());
    REQUIRE(leaf.page_id() == invalid_page_id);
  }

  SECTION("Written nodes can be read and deleted") {
    node leaf = t.create_leaf_node();
    leaf.add_entry(entry::make_leaf({1.0, 1.0}));
    page_id_type id = t.write_node(leaf);
    REQUIRE(id == 1);
    REQUIRE(leaf.page_id() == 1);
    REQUIRE_FALSE(t.is_root(leaf));

    node read = t.get_node(id);
    REQUIRE(read.entry(0).payload() == point{1.0, 1.0});

    t.delete_node(read);
    REQUIRE_THROWS_AS(t.get_node(id), std::out_of_range);
  }

  SECTION("Missing pages surface the page file error") {
    REQUIRE_THROWS_AS(t.get_node(42), std::out_of_range);
    REQUIRE_THROWS_AS(t.get_node(entry::make_directory(42)),
                      std::out_of_range);
  }

  SECTION("Page accesses are counted") {
    t.reset_page_access();
    t.get_root();
    t.get_node(t.get_root_id());
    REQUIRE(t.get_page_file_statistics().read_operations() == 2);
    REQUIRE(t.get_page_file_statistics().write_operations() == 0);

    node leaf = t.create_leaf_node();
    t.write_node(leaf);
    REQUIRE(t.get_page_file_statistics().write_operations() == 1);
  }
}

TEST_CASE("index_tree fill checks", "[index_tree]") {
  auto file = std::make_shared<page_file>(small_page);
  tree t(file);
  t.initialize(example_leaf());

  node leaf = t.create_leaf_node();
  for (int i = 0; i < 2; ++i) {
    leaf.add_entry(entry::make_leaf({double(i), 0.0}));
  }
  t.write_node(leaf);

  SECTION("Non-root nodes below the minimum underflow") {
    REQUIRE(t.is_underflowing(leaf));
    leaf.add_entry(entry::make_leaf({2.0, 0.0}));
    REQUIRE_FALSE(t.is_underflowing(leaf));
  }

  SECTION("The root is exempt from the minimum") {
    node root = t.get_root();
    REQUIRE(root.empty());
    REQUIRE_FALSE(t.is_underflowing(root));
  }

  SECTION("Capacity entries mean overflow") {
    while (leaf.num_entries() < t.leaf_capacity() - 1) {
      leaf.add_entry(entry::make_leaf({0.0, 0.0}));
    }
    REQUIRE_FALSE(t.is_overflowing(leaf));
    leaf.add_entry(entry::make_leaf({0.0, 0.0}));
    REQUIRE(t.is_overflowing(leaf));
  }
}

TEST_CASE("index_tree root growth", "[index_tree]") {
  auto file = std::make_shared<page_file>(small_page);
  tree t(file);
  append_to_root(t, entry::make_leaf({1.0, 2.0}));
  append_to_root(t, entry::make_leaf({3.0, 4.0}));

  page_id_type leaf_id = grow_root(t);
  REQUIRE(leaf_id == 1);
  REQUIRE(t.get_root_id() == 0);
  REQUIRE_FALSE(t.get_root().is_leaf());
  REQUIRE(t.get_node(t.get_root().entry(0)).num_entries() == 2);

  SECTION("A reattached handle finds the grown root") {
    tree second(file);
    second.initialize();
    REQUIRE(second.initialized());
    REQUIRE(second.get_root_id() == 0);
    node root = second.get_root();
    REQUIRE_FALSE(root.is_leaf());
    REQUIRE(second.get_node(root.entry(0)).num_entries() == 2);
  }

  SECTION("The root entry may be refreshed in place") {
    t.replace_root_entry(entry::make_directory(0));
    REQUIRE(t.get_root_id() == 0);
  }

  SECTION("The root cannot move to another page") {
    REQUIRE_THROWS_AS(t.replace_root_entry(entry::make_directory(leaf_id)),
                      unsupported_operation);
    REQUIRE(t.get_root_id() == 0);

    tree second(file);
    second.initialize();
    REQUIRE(second.get_root_id() == t.get_root_id());
  }

  SECTION("Root entries must reference a page") {
    REQUIRE_THROWS_AS(t.replace_root_entry(example_leaf()),
                      std::invalid_argument);
    REQUIRE(t.get_root_id() == 0);
  }

  SECTION("dump walks the whole tree") {
    std::ostringstream out;
    t.dump(out);
    std::string text = out.str();
    REQUIRE(text.find("@0 dir (1 entries)") != std::string::npos);
    REQUIRE(text.find("@1 leaf (2 entries)") != std::string::npos);
  }
}

TEST_CASE("index_tree variant hooks", "[index_tree][variant]") {
  auto file = std::make_shared<page_file>(small_page);
  index_tree<node, counting_variant> t(file);

  append_to_root(t, entry::make_leaf({1.0, 1.0}));
  append_to_root(t, entry::make_leaf({2.0, 2.0}));
  REQUIRE(t.variant().inserts == 2);

  node root = t.get_root();
  entry removed = root.remove_entry(0);
  t.write_node(root);
  t.post_delete(removed);
  REQUIRE(t.variant().deletes == 1);
  REQUIRE(t.get_root().num_entries() == 1);

  SECTION("Plain variants ignore the bookkeeping calls") {
    auto other_file = std::make_shared<page_file>(small_page);
    tree plain(other_file);
    plain.initialize(example_leaf());
    plain.pre_insert(example_leaf());
    plain.post_delete(example_leaf());
    REQUIRE(plain.get_root().empty());
  }
}

TEST_CASE("index_tree debug output", "[index_tree][logging]") {
  std::ostringstream out;

  SECTION("New tree") {
    auto file = std::make_shared<page_file>(small_page);
    tree t(file);
    t.set_debug_stream(&out);
    t.initialize(example_leaf());

    std::string text = out.str();
    REQUIRE(text.find("created new tree") != std::string::npos);
    REQUIRE(text.find("maximum number of leaf entries = 7") !=
            std::string::npos);
    REQUIRE(text.find("chosen small") != std::string::npos);
  }

  SECTION("Reattach") {
    auto file = std::make_shared<page_file>(small_page);
    {
      tree first(file);
      first.initialize(example_leaf());
    }
    tree second(file);
    second.set_debug_stream(&out);
    second.initialize();
    REQUIRE(out.str().find("reattached") != std::string::npos);
  }

  SECTION("Silent by default") {
    auto file = std::make_shared<page_file>(4096);
    tree t(file);
    t.initialize(example_leaf());
    REQUIRE(out.str().empty());
  }
}
