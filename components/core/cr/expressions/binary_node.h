// chainrule expression graph library.
// Copyright (c) 2024 Gareth Cross
// For license information refer to accompanying LICENSE file.
#pragma once
#include <array>
#include <string>

#include "cr/node.h"
#include "cr/utility/assertions.h"

namespace cr {

// Operands of a binary operator. `sum` and `product` share this shape, and differ only in how
// the operands are combined.
class binary_node {
 public:
  static constexpr bool is_leaf_node = false;

  binary_node(node left, node right, std::string label)
      : left_(std::move(left)), right_(std::move(right)), label_(std::move(label)) {
    CR_ASSERT(left_.has_value(), "Left operand is a moved-from node.");
    CR_ASSERT(right_.has_value(), "Right operand is a moved-from node.");
  }

  const node& left() const noexcept { return left_; }
  const node& right() const noexcept { return right_; }

  // Optional label, used for printing only. Empty if none was provided.
  const std::string& label() const noexcept { return label_; }

  // Both operands, left first.
  std::array<const node*, 2> children() const noexcept { return {&left_, &right_}; }

 private:
  node left_;
  node right_;
  std::string label_;
};

}  // namespace cr
