// Implementation file for index_tree.hpp

namespace kressler::paged_tree {

// Constructor
template <typename Node, typename Variant, typename PageFile>
  requires PageStore<PageFile, Node>
index_tree<Node, Variant, PageFile>::index_tree(
    std::shared_ptr<PageFile> file, Variant variant,
    const tree_capacities& capacities)
    : file_(std::move(file)),
      variant_(std::move(variant)),
      capacities_(capacities) {
  if (file_ == nullptr) {
    throw std::invalid_argument("index_tree: page file must not be null");
  }
}

// Attach to the page file
template <typename Node, typename Variant, typename PageFile>
  requires PageStore<PageFile, Node>
void index_tree<Node, Variant, PageFile>::initialize() {
  static_assert(TreeVariant<Variant, index_tree>,
                "Variant does not provide the index_tree hooks");

  tree_index_header header = create_header(false);
  if (file_->initialize(header)) {
    initialize_from_file(header);
  }
  root_entry_ = variant_.create_root_entry(*this);
}

// Adopt the stored capacities of an existing tree
template <typename Node, typename Variant, typename PageFile>
  requires PageStore<PageFile, Node>
void index_tree<Node, Variant, PageFile>::initialize_from_file(
    const tree_index_header& header) {
  if (header.page_size != file_->page_size()) {
    throw configuration_mismatch(
        fmt::format("Stored page size {} does not match page file page size {}",
                    header.page_size, file_->page_size()));
  }
  if (!header.built) {
    // The file was claimed by an earlier handle that never built a tree
    debug("index_tree: page file holds no tree yet, keeping capacities");
    return;
  }
  validate_capacities(header.capacities);
  if constexpr (HasCapacityCheck<Variant, index_tree>) {
    variant_.check_capacities(*this, header.capacities);
  }

  capacities_ = header.capacities;
  state_ = tree_state::ready;

  debug(
      "index_tree: reattached to existing page file\n"
      " page size = {}\n"
      " maximum number of dir entries = {}\n"
      " minimum number of dir entries = {}\n"
      " maximum number of leaf entries = {}\n"
      " minimum number of leaf entries = {}",
      header.page_size, capacities_.dir_capacity - 1, capacities_.dir_minimum,
      capacities_.leaf_capacity - 1, capacities_.leaf_minimum);
}

// Build a new tree
template <typename Node, typename Variant, typename PageFile>
  requires PageStore<PageFile, Node>
void index_tree<Node, Variant, PageFile>::initialize(
    const entry_type& example_leaf) {
  if (!initialized()) {
    // Another handle may have built the tree since this one attached
    initialize();
  }
  if (initialized()) {
    throw std::logic_error(
        "index_tree::initialize: capacities are already fixed");
  }
  create_tree(example_leaf);
}

template <typename Node, typename Variant, typename PageFile>
  requires PageStore<PageFile, Node>
void index_tree<Node, Variant, PageFile>::ensure_initialized(
    const entry_type& example_leaf) {
  if (initialized()) {
    return;
  }
  initialize();
  if (!initialized()) {
    create_tree(example_leaf);
  }
}

template <typename Node, typename Variant, typename PageFile>
  requires PageStore<PageFile, Node>
void index_tree<Node, Variant, PageFile>::create_tree(
    const entry_type& example_leaf) {
  tree_capacities capacities =
      variant_.initialize_capacities(*this, example_leaf);
  validate_capacities(capacities);
  capacities_ = capacities;

  variant_.create_empty_root(*this, example_leaf);
  file_->write_header(create_header(true));
  state_ = tree_state::ready;

  debug(
      "index_tree: created new tree\n"
      " page size = {}\n"
      " maximum number of dir entries = {}\n"
      " minimum number of dir entries = {}\n"
      " maximum number of leaf entries = {}\n"
      " minimum number of leaf entries = {}\n"
      " root page = {}",
      file_->page_size(), capacities_.dir_capacity - 1,
      capacities_.dir_minimum, capacities_.leaf_capacity - 1,
      capacities_.leaf_minimum, get_root_id());
  if (capacities_.dir_capacity < 10 || capacities_.leaf_capacity < 10) {
    debug("index_tree: page size {} is chosen small, nodes hold {}/{} entries",
          file_->page_size(), capacities_.dir_capacity - 1,
          capacities_.leaf_capacity - 1);
  }
}

template <typename Node, typename Variant, typename PageFile>
  requires PageStore<PageFile, Node>
const typename index_tree<Node, Variant, PageFile>::entry_type&
index_tree<Node, Variant, PageFile>::get_root_entry() const {
  if (!root_entry_.has_value()) {
    throw tree_not_initialized(
        "index_tree: root requested before initialize()");
  }
  return *root_entry_;
}

template <typename Node, typename Variant, typename PageFile>
  requires PageStore<PageFile, Node>
void index_tree<Node, Variant, PageFile>::replace_root_entry(
    entry_type entry) {
  if (!root_entry_.has_value()) {
    throw tree_not_initialized(
        "index_tree: root replaced before initialize()");
  }
  if (entry.is_leaf_entry()) {
    throw std::invalid_argument(
        "index_tree: the root entry must reference a page");
  }
  if (entry.page_id() != root_entry_->page_id()) {
    throw unsupported_operation(fmt::format(
        "index_tree: the root lives on page {}, cannot move it to page {}",
        root_entry_->page_id(), entry.page_id()));
  }
  root_entry_ = std::move(entry);
}

template <typename Node, typename Variant, typename PageFile>
  requires PageStore<PageFile, Node>
page_id_type index_tree<Node, Variant, PageFile>::get_page_id(
    const entry_type& entry) const {
  if (entry.is_leaf_entry()) {
    throw unsupported_operation("Leaf entries do not have page ids");
  }
  return entry.page_id();
}

template <typename Node, typename Variant, typename PageFile>
  requires PageStore<PageFile, Node>
Node index_tree<Node, Variant, PageFile>::get_node(page_id_type page_id) {
  if (page_id == get_root_id()) {
    return get_root();
  }
  return file_->read_page(page_id);
}

template <typename Node, typename Variant, typename PageFile>
  requires PageStore<PageFile, Node>
Node index_tree<Node, Variant, PageFile>::create_leaf_node() {
  if (capacities_.leaf_capacity == 0) {
    throw tree_not_initialized("index_tree: leaf capacity is not known yet");
  }
  return variant_.create_new_leaf_node(*this);
}

template <typename Node, typename Variant, typename PageFile>
  requires PageStore<PageFile, Node>
Node index_tree<Node, Variant, PageFile>::create_directory_node() {
  if (capacities_.dir_capacity == 0) {
    throw tree_not_initialized(
        "index_tree: directory capacity is not known yet");
  }
  return variant_.create_new_directory_node(*this);
}

template <typename Node, typename Variant, typename PageFile>
  requires PageStore<PageFile, Node>
void index_tree<Node, Variant, PageFile>::pre_insert(const entry_type& entry) {
  if constexpr (HasPreInsert<Variant, index_tree>) {
    variant_.pre_insert(*this, entry);
  }
}

template <typename Node, typename Variant, typename PageFile>
  requires PageStore<PageFile, Node>
void index_tree<Node, Variant, PageFile>::post_delete(
    const entry_type& entry) {
  if constexpr (HasPostDelete<Variant, index_tree>) {
    variant_.post_delete(*this, entry);
  }
}

template <typename Node, typename Variant, typename PageFile>
  requires PageStore<PageFile, Node>
bool index_tree<Node, Variant, PageFile>::is_overflowing(
    const Node& node) const {
  const size_type capacity =
      node.is_leaf() ? capacities_.leaf_capacity : capacities_.dir_capacity;
  return node.num_entries() >= capacity;
}

template <typename Node, typename Variant, typename PageFile>
  requires PageStore<PageFile, Node>
bool index_tree<Node, Variant, PageFile>::is_underflowing(
    const Node& node) const {
  if (is_root(node)) {
    return false;
  }
  const size_type minimum =
      node.is_leaf() ? capacities_.leaf_minimum : capacities_.dir_minimum;
  return node.num_entries() < minimum;
}

// Capacities must leave room for two entries (the least a split can
// distribute) and minimums must be reachable
template <typename Node, typename Variant, typename PageFile>
  requires PageStore<PageFile, Node>
void index_tree<Node, Variant, PageFile>::validate_capacities(
    const tree_capacities& capacities) {
  auto check = [](const char* kind, size_type capacity, size_type minimum) {
    if (capacity < 3) {
      throw configuration_mismatch(fmt::format(
          "{} capacity {} cannot hold two entries", kind, capacity));
    }
    if (minimum < 1 || minimum > capacity - 1) {
      throw configuration_mismatch(
          fmt::format("{} minimum {} outside [1, {}]", kind, minimum,
                      capacity - 1));
    }
  };
  check("Directory", capacities.dir_capacity, capacities.dir_minimum);
  check("Leaf", capacities.leaf_capacity, capacities.leaf_minimum);
}

template <typename Node, typename Variant, typename PageFile>
  requires PageStore<PageFile, Node>
void index_tree<Node, Variant, PageFile>::dump(std::ostream& os) {
  if (!initialized()) {
    fmt::print(os, "index_tree: page size {} (not initialized)\n",
               file_->page_size());
    return;
  }
  fmt::print(os, "index_tree: page size {}, dir {}..{}, leaf {}..{} entries\n",
             file_->page_size(), capacities_.dir_minimum,
             capacities_.dir_capacity - 1, capacities_.leaf_minimum,
             capacities_.leaf_capacity - 1);
  dump_node(os, get_root(), 1);
}

template <typename Node, typename Variant, typename PageFile>
  requires PageStore<PageFile, Node>
void index_tree<Node, Variant, PageFile>::dump_node(std::ostream& os,
                                                    const Node& node,
                                                    size_type depth) {
  fmt::print(os, "{:{}}@{} {} ({} entries)\n", "", depth * 2, node.page_id(),
             node.is_leaf() ? "leaf" : "dir", node.num_entries());
  if (node.is_leaf()) {
    return;
  }
  for (const auto& entry : node) {
    dump_node(os, get_node(entry), depth + 1);
  }
}

}  // namespace kressler::paged_tree
