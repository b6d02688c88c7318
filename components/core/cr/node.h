// chainrule expression graph library.
// Copyright (c) 2024 Gareth Cross
// For license information refer to accompanying LICENSE file.
#pragma once
#include <memory>
#include <ostream>  // operator<<
#include <string>
#include <string_view>
#include <vector>

#include "cr/enumerations.h"
#include "cr/utility/third_party_imports.h"

CR_BEGIN_THIRD_PARTY_INCLUDES
#include <fmt/core.h>
CR_END_THIRD_PARTY_INCLUDES

namespace cr {

class leaf;
class sum;
class product;

namespace detail {
// Holds the closed variant over {leaf, sum, product}. Defined in `cr/expressions/all_nodes.h`.
struct node_storage;
}  // namespace detail

// A node in an expression graph: either a named leaf constant, or a sum/product of two child
// nodes. `node` is move-only: every composite exclusively owns its children, so graphs are trees
// and can never contain a cycle. The contents are immutable once constructed.
//
// Node identity is the address of the underlying storage, which is stable when the `node` handle
// itself is moved into a parent.
class node {
 public:
  // Construct a leaf with `value` and `name`.
  node(double value, std::string name);

  // Construct from one of the concrete node types.
  explicit node(leaf contents);
  explicit node(sum contents);
  explicit node(product contents);

  ~node();

  node(node&& other) noexcept;
  node& operator=(node&& other) noexcept;
  node(const node&) = delete;
  node& operator=(const node&) = delete;

  // False if the node has been moved-from.
  bool has_value() const noexcept { return static_cast<bool>(ptr_); }

  // Which concrete type is stored.
  node_kind kind() const;

  // Camel-case name of the concrete type.
  std::string_view type_name() const;

  // Address of the underlying storage. Used as the identity of the node.
  const void* get_address() const noexcept { return static_cast<const void*>(ptr_.get()); }

  // Test if the two handles refer to the same node.
  bool has_same_address(const node& other) const noexcept {
    return get_address() == other.get_address();
  }

  // True if any leaf in this subtree is named `name`.
  bool contains(std::string_view name) const;

  // Names of all leaves in this subtree, left to right.
  std::vector<std::string> leaf_names() const;

  // Convert to infix string, eg. `(A + B) * C`.
  std::string to_string() const;

  // Convert to a string depicting the tree structure.
  std::string to_expression_tree_string() const;

  // Access the underlying storage. Throws if the node was moved-from.
  const detail::node_storage& storage() const;

 private:
  std::unique_ptr<const detail::node_storage> ptr_;
};

// ostream support
inline std::ostream& operator<<(std::ostream& stream, const node& n) {
  stream << n.to_string();
  return stream;
}

// Create a leaf node.
node make_leaf(double value, std::string name);

// Create a sum of `left` and `right`, taking ownership of both. `label` is only used when printing.
node make_sum(node left, node right, std::string label = {});

// Create a product of `left` and `right`, taking ownership of both.
node make_product(node left, node right, std::string label = {});

// Math operators. Both operands are consumed.
node operator+(node a, node b);
node operator*(node a, node b);

}  // namespace cr

// libfmt support for cr::node.
template <>
struct fmt::formatter<cr::node> {
  constexpr auto parse(format_parse_context& ctx) -> decltype(ctx.begin()) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(const cr::node& n, FormatContext& ctx) const -> decltype(ctx.out()) {
    return fmt::format_to(ctx.out(), "{}", n.to_string());
  }
};
