// chainrule expression graph library.
// Copyright (c) 2024 Gareth Cross
// For license information refer to accompanying LICENSE file.
#include "cr/node.h"

#include "cr/expressions/all_nodes.h"
#include "cr/plain_formatter.h"
#include "cr/tree_formatter.h"
#include "cr/utility/assertions.h"
#include "cr/utility_visitors.h"

namespace cr {

static_assert(std::is_same_v<std::variant_alternative_t<static_cast<std::size_t>(node_kind::leaf),
                                                        detail::node_storage::variant_type>,
                             leaf> &&
                  std::is_same_v<std::variant_alternative_t<static_cast<std::size_t>(node_kind::sum),
                                                            detail::node_storage::variant_type>,
                                 sum> &&
                  std::is_same_v<
                      std::variant_alternative_t<static_cast<std::size_t>(node_kind::product),
                                                 detail::node_storage::variant_type>,
                      product>,
              "node_kind must match the order of node_storage alternatives");

node::node(const double value, std::string name) : node(leaf{value, std::move(name)}) {}

node::node(leaf contents)
    : ptr_(std::make_unique<const detail::node_storage>(std::move(contents))) {}

node::node(sum contents)
    : ptr_(std::make_unique<const detail::node_storage>(std::move(contents))) {}

node::node(product contents)
    : ptr_(std::make_unique<const detail::node_storage>(std::move(contents))) {}

node::~node() = default;
node::node(node&& other) noexcept = default;
node& node::operator=(node&& other) noexcept = default;

node_kind node::kind() const { return static_cast<node_kind>(storage().contents.index()); }

std::string_view node::type_name() const {
  return visit(*this, [](const auto& x) { return std::decay_t<decltype(x)>::name_str; });
}

bool node::contains(const std::string_view name) const {
  return visit(*this, contains_visitor{name});
}

std::vector<std::string> node::leaf_names() const { return collect_leaf_names(*this); }

std::string node::to_string() const { return plain_formatter::convert(*this); }

std::string node::to_expression_tree_string() const {
  tree_formatter_visitor formatter{};
  formatter(*this);
  return formatter.take_output();
}

const detail::node_storage& node::storage() const {
  CR_ASSERT(ptr_, "Accessed a moved-from node.");
  return *ptr_;
}

node make_leaf(const double value, std::string name) { return node{value, std::move(name)}; }

node make_sum(node left, node right, std::string label) {
  return node{sum{std::move(left), std::move(right), std::move(label)}};
}

node make_product(node left, node right, std::string label) {
  return node{product{std::move(left), std::move(right), std::move(label)}};
}

node operator+(node a, node b) { return make_sum(std::move(a), std::move(b)); }

node operator*(node a, node b) { return make_product(std::move(a), std::move(b)); }

}  // namespace cr
