// chainrule expression graph library.
// Copyright (c) 2024 Gareth Cross
// For license information refer to accompanying LICENSE file.
#pragma once
#include "cr/node.h"

// Graphs shared between tests.
namespace cr {

// (A + B) * C * D, with A = 10, B = 5, C = 20, D = 25.
inline node make_abcd_graph() {
  node f1 = make_sum(make_leaf(10.0, "A"), make_leaf(5.0, "B"), "A+B");
  node f2 = make_product(std::move(f1), make_leaf(20.0, "C"), "(A+B)C");
  return make_product(std::move(f2), make_leaf(25.0, "D"), "(A+B)CD");
}

// ((x * y) + (z * (x0 + w))) * (v + u * t), with non-trivial values on every leaf.
inline node make_mixed_graph() {
  node left = make_leaf(1.5, "x") * make_leaf(-2.0, "y") +
              make_leaf(3.0, "z") * (make_leaf(0.25, "x0") + make_leaf(4.0, "w"));
  node right = make_leaf(-1.0, "v") + make_leaf(2.5, "u") * make_leaf(0.5, "t");
  return std::move(left) * std::move(right);
}

}  // namespace cr
