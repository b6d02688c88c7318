// chainrule expression graph library.
// Copyright (c) 2024 Gareth Cross
// For license information refer to accompanying LICENSE file.
#pragma once
#include <variant>

#include "cr/expressions/leaf.h"
#include "cr/expressions/product.h"
#include "cr/expressions/sum.h"
#include "cr/utility/error_types.h"

namespace cr {
namespace detail {

struct node_storage {
  // The closed set of node types. Visitors must handle every alternative.
  using variant_type = std::variant<leaf, sum, product>;

  template <typename T>
  explicit node_storage(T&& value) : contents(std::forward<T>(value)) {}

  variant_type contents;
};

}  // namespace detail

// Invoke `visitor` with the concrete type stored in `n`.
template <typename F>
decltype(auto) visit(const node& n, F&& visitor) {
  return std::visit(std::forward<F>(visitor), n.storage().contents);
}

// Cast node to const pointer of the specified type, or nullptr if the type does not match.
// Returned pointer is valid only as long as `n` survives.
template <typename T>
const T* cast_ptr(const node& n) {
  return std::get_if<T>(&n.storage().contents);
}

// Cast node to const reference of the specified type. `type_error` is thrown if the cast is
// invalid.
template <typename T>
const T& cast_checked(const node& n) {
  if (const T* ptr = cast_ptr<T>(n); ptr != nullptr) {
    return *ptr;
  }
  throw type_error("Cannot cast node of type `{}` to `{}`", n.type_name(), T::name_str);
}

}  // namespace cr
