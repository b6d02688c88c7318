// chainrule expression graph library.
// Copyright (c) 2024 Gareth Cross
// For license information refer to accompanying LICENSE file.
#pragma once
#include "cr/expressions/binary_node.h"

namespace cr {

// left * right
class product final : public binary_node {
 public:
  static constexpr std::string_view name_str = "Product";

  product(node left, node right)
      : binary_node(std::move(left), std::move(right), std::string{}) {}

  product(node left, node right, std::string label)
      : binary_node(std::move(left), std::move(right), std::move(label)) {}
};

}  // namespace cr
