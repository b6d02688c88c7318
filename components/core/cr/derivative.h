// chainrule expression graph library.
// Copyright (c) 2024 Gareth Cross
// For license information refer to accompanying LICENSE file.
#pragma once
#include <string_view>

#include "cr/enumerations.h"
#include "cr/evaluate.h"

namespace cr {

// Visitor that takes the partial derivative of a node with respect to the leaf named `name`.
//
// Sibling values required by the product rule are read from `values`, never recomputed. Under
// `duplicate_name_behavior::first_occurrence` the first operand (left to right) that contains the
// name is differentiated and the other is ignored. A name that no reachable leaf carries raises
// `unknown_variable_error`.
class derivative_visitor {
 public:
  // `values` and `name` must remain in scope for the duration of evaluation. Throws
  // `invalid_argument_error` if `behavior` is `reject` and `name` labels several leaves.
  derivative_visitor(const evaluation& values, std::string_view name,
                     duplicate_name_behavior behavior);

  // Apply this visitor to the specified node.
  double operator()(const node& n) const;

  double operator()(const leaf& l) const;
  double operator()(const sum& s) const;
  double operator()(const product& p) const;

 private:
  // Chain rule through a binary node. `d_left` and `d_right` are the local partial derivatives of
  // the node wrt its left and right operand.
  double chain(const binary_node& b, double d_left, double d_right) const;

  const evaluation& values_;
  std::string_view name_;
  duplicate_name_behavior behavior_;
};

// Evaluate `root`, then take its partial derivative with respect to the leaf named `name`.
double derivative_over(
    const node& root, std::string_view name,
    duplicate_name_behavior behavior = duplicate_name_behavior::first_occurrence);

}  // namespace cr
