// chainrule expression graph library.
// Copyright (c) 2024 Gareth Cross
// For license information refer to accompanying LICENSE file.
#pragma once
#include <algorithm>
#include <cmath>
#include <string>
#include <string_view>

#include <gtest/gtest.h>

#include "cr/derivative.h"
#include "cr/evaluate.h"
#include "cr/node.h"

CR_BEGIN_THIRD_PARTY_INCLUDES
#include <fmt/format.h>
CR_END_THIRD_PARTY_INCLUDES

namespace cr {

// Convert `val2` to a string and compare to string literal `val1`.
#define ASSERT_STR_EQ(val1, val2) ASSERT_PRED_FORMAT2(cr::string_equal_test_helper, val1, val2)

// Compare the derivative of evaluation `values` wrt `name` to `expected`.
#define ASSERT_DERIVATIVE_EQ(expected, values, name) \
  ASSERT_PRED_FORMAT3(cr::derivative_equal_test_helper, expected, values, name)

// Escape all newlines in a string so they can be printed to console literally.
inline std::string escape_newlines(const std::string_view input) {
  std::string output;
  output.reserve(input.size());
  for (const char c : input) {
    if (c == '\n') {
      output += "\\n";
    } else {
      output += c;
    }
  }
  return output;
}

inline testing::AssertionResult string_equal_test_helper(const std::string_view,
                                                         const std::string_view name_b,
                                                         const std::string_view a, const node& b) {
  const std::string b_str = b.to_string();
  if (a == b_str) {
    return testing::AssertionSuccess();
  }
  return testing::AssertionFailure() << fmt::format(
             "String `{}` does not match ({}).to_string(), where:\n({}).to_string() = {}\n"
             "The expression tree for `{}` is:\n{}",
             escape_newlines(a), name_b, name_b, escape_newlines(b_str), name_b,
             b.to_expression_tree_string());
}

// Values in these tests are small integers, so we allow only a tiny relative error.
inline testing::AssertionResult derivative_equal_test_helper(
    const std::string_view name_expected, const std::string_view name_values,
    const std::string_view name_name, const double expected, const evaluation& values,
    const std::string_view name) {
  const double actual = values.derivative_over(name);
  const double tolerance = 1.0e-12 * std::max(1.0, std::abs(expected));
  if (std::abs(actual - expected) <= tolerance) {
    return testing::AssertionSuccess();
  }
  return testing::AssertionFailure() << fmt::format(
             "Derivative of `{values}` wrt {name_name} (= `{name}`) is {actual}, but {expected_name} "
             "= {expected}.\nThe expression is: {expr}\nThe expression tree is:\n{tree}",
             fmt::arg("values", name_values), fmt::arg("name_name", name_name),
             fmt::arg("name", name), fmt::arg("actual", actual),
             fmt::arg("expected_name", name_expected), fmt::arg("expected", expected),
             fmt::arg("expr", values.root().to_string()),
             fmt::arg("tree", values.root().to_expression_tree_string()));
}

// ostream operator for `node_kind`.
inline std::ostream& operator<<(std::ostream& s, const node_kind kind) {
  s << string_from_node_kind(kind);
  return s;
}

}  // namespace cr
