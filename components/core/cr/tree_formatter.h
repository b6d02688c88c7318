// chainrule expression graph library.
// Copyright (c) 2024 Gareth Cross
// For license information refer to accompanying LICENSE file.
#pragma once
#include <string>
#include <vector>

#include "cr/expressions/all_nodes.h"

namespace cr {

// Recursively print nodes as a graphical utf-8 tree (mostly for diffing/debugging).
class tree_formatter_visitor {
 public:
  void operator()(const node& n);

  void operator()(const leaf& l);
  void operator()(const sum& s);
  void operator()(const product& p);

  // Get the output string. Result is returned via move.
  std::string take_output();

 private:
  void apply_indentation();

  template <typename... Args>
  void format_append(std::string_view fmt_str, Args&&... args);

  void visit_left(const node& n);
  void visit_right(const node& n);

  // Print the header line of a binary node, then both operands.
  void format_binary(std::string_view type_name, const binary_node& b);

  // The indentation pattern at our current tree depth.
  // True indicates a left branch, false indicates a right branch.
  std::vector<unsigned char> indentations_;
  // The final output
  std::string output_;
};

}  // namespace cr
