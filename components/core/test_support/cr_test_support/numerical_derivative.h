// chainrule expression graph library.
// Copyright (c) 2024 Gareth Cross
// For license information refer to accompanying LICENSE file.
#pragma once
#include <string_view>

#include "cr/evaluate.h"
#include "cr/node.h"
#include "cr/utility/overloaded_visit.h"

// Methods for testing derivatives by comparing to the numerical approximation.
namespace cr {

/**
 * Numerically compute first derivative of f(x) via central difference. Uses the third-order
 * approximation, which has error in O(h^6).
 *
 * The function `func` is presumed to be centered on the linearization point `x`, such that only
 * the step increment `dx` (a scalar) is passed as an argument.
 */
template <typename Function>
double numerical_derivative(const double dx, Function&& func) {
  const double dx2 = dx * 2;
  const double dx3 = dx * 3;
  const double c1 = func(dx) - func(-dx);
  const double c2 = func(dx2) - func(-dx2);
  const double c3 = func(dx3) - func(-dx3);
  return (c1 * 45 - c2 * 9 + c3) / (60 * dx);
}

// Copy the graph `root`, adding `delta` to the value of every leaf named `name`.
inline node copy_with_offset(const node& root, const std::string_view name, const double delta) {
  return overloaded_visit(
      root.storage().contents,
      [&](const leaf& l) {
        return make_leaf(l.name() == name ? l.value() + delta : l.value(), l.name());
      },
      [&](const sum& s) {
        return make_sum(copy_with_offset(s.left(), name, delta),
                        copy_with_offset(s.right(), name, delta), s.label());
      },
      [&](const product& p) {
        return make_product(copy_with_offset(p.left(), name, delta),
                            copy_with_offset(p.right(), name, delta), p.label());
      });
}

// Numerically differentiate the value of `root` wrt every leaf named `name`.
inline double numerical_derivative_over(const node& root, const std::string_view name,
                                        const double h = 0.01) {
  return numerical_derivative(h, [&](const double dx) {
    const node shifted = copy_with_offset(root, name, dx);
    return evaluate(shifted).value();
  });
}

}  // namespace cr
