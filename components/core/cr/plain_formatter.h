// chainrule expression graph library.
// Copyright (c) 2024 Gareth Cross
// For license information refer to accompanying LICENSE file.
#pragma once
#include <string>

#include "cr/enumerations.h"
#include "cr/expressions/all_nodes.h"

namespace cr {

// Simple plain-text infix formatter.
class plain_formatter {
 public:
  // Convert `n` to a string, eg. `(A + B) * C`.
  static std::string convert(const node& n);

  std::string operator()(const leaf& l) const;
  std::string operator()(const sum& s) const;
  std::string operator()(const product& p) const;

 private:
  // Format both operands of `b` around `op`. The left operand is wrapped in braces if its
  // precedence is below `parent`, the right operand if it is below or equal, so that the printed
  // string preserves the shape of the tree.
  std::string format_binary(const binary_node& b, precedence parent, std::string_view op) const;
};

// Get operation precedence (order of operations) of the node type stored in `n`.
precedence get_precedence(const node& n);

}  // namespace cr
