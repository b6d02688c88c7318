// chainrule expression graph library.
// Copyright (c) 2024 Gareth Cross
// For license information refer to accompanying LICENSE file.
#include "cr/derivative.h"
#include "cr/utility_visitors.h"

#include "cr_test_support/numerical_derivative.h"
#include "cr_test_support/test_macros.h"
#include "test_graphs.h"

// Test `derivative_over` on sums, products and nested graphs.
namespace cr {

TEST(DerivativeTest, TestSum) {
  const node s = make_leaf(3.0, "x") + make_leaf(4.0, "y");
  const evaluation values = evaluate(s);
  ASSERT_DERIVATIVE_EQ(1.0, values, "x");
  ASSERT_DERIVATIVE_EQ(1.0, values, "y");
  ASSERT_THROW(values.derivative_over("z"), unknown_variable_error);
}

TEST(DerivativeTest, TestProduct) {
  const node p = make_leaf(3.0, "x") * make_leaf(4.0, "y");
  const evaluation values = evaluate(p);
  ASSERT_DERIVATIVE_EQ(4.0, values, "x");
  ASSERT_DERIVATIVE_EQ(3.0, values, "y");
  ASSERT_THROW(values.derivative_over("z"), unknown_variable_error);
}

TEST(DerivativeTest, TestWorkedExample) {
  const node f_end = make_abcd_graph();
  const evaluation values = evaluate(f_end);
  ASSERT_EQ(7500.0, values.value());
  // d/dA [(A + B) * C * D] = C * D
  ASSERT_DERIVATIVE_EQ(500.0, values, "A");
  ASSERT_DERIVATIVE_EQ(500.0, values, "B");
  // (A + B) * D
  ASSERT_DERIVATIVE_EQ(375.0, values, "C");
  // (A + B) * C
  ASSERT_DERIVATIVE_EQ(300.0, values, "D");

  // The one-shot entry point agrees.
  ASSERT_EQ(500.0, derivative_over(f_end, "A"));
  ASSERT_EQ(300.0, derivative_over(f_end, "D"));
}

TEST(DerivativeTest, TestUnknownVariablePropagates) {
  const node f_end = make_abcd_graph();
  for (const std::string_view name : {"Z", "", "a", "AB", "A+B"}) {
    ASSERT_THROW(derivative_over(f_end, name), unknown_variable_error) << name;
  }
  try {
    derivative_over(f_end, "Z");
    FAIL() << "Expected unknown_variable_error";
  } catch (const unknown_variable_error& err) {
    // The error reaches the caller unchanged, naming the requested variable.
    ASSERT_EQ("Z", err.name());
  }
}

TEST(DerivativeTest, TestSumLinearity) {
  // d(A + B)/dn == dA/dn for n in A, and dB/dn for n in B.
  node a = make_leaf(2.0, "p") * make_leaf(3.0, "q");
  node b = make_leaf(5.0, "r") * (make_leaf(7.0, "s") + make_leaf(11.0, "t"));
  const double dp = derivative_over(a, "p");
  const double dq = derivative_over(a, "q");
  const double dr = derivative_over(b, "r");
  const double ds = derivative_over(b, "s");
  const double dt = derivative_over(b, "t");

  const node s = std::move(a) + std::move(b);
  const evaluation values = evaluate(s);
  ASSERT_DERIVATIVE_EQ(dp, values, "p");
  ASSERT_DERIVATIVE_EQ(dq, values, "q");
  ASSERT_DERIVATIVE_EQ(dr, values, "r");
  ASSERT_DERIVATIVE_EQ(ds, values, "s");
  ASSERT_DERIVATIVE_EQ(dt, values, "t");
}

TEST(DerivativeTest, TestProductRule) {
  // d(A * B)/dn == value(B) * dA/dn for n in A, and value(A) * dB/dn for n in B.
  node a = make_leaf(2.0, "p") + make_leaf(3.0, "q") * make_leaf(-4.0, "u");
  node b = make_leaf(5.0, "r") * make_leaf(6.0, "s");
  const double value_a = evaluate(a).value();
  const double value_b = evaluate(b).value();
  const double dp = derivative_over(a, "p");
  const double dq = derivative_over(a, "q");
  const double du = derivative_over(a, "u");
  const double dr = derivative_over(b, "r");
  const double ds = derivative_over(b, "s");

  const node p = std::move(a) * std::move(b);
  const evaluation values = evaluate(p);
  ASSERT_EQ(value_a * value_b, values.value());
  ASSERT_DERIVATIVE_EQ(value_b * dp, values, "p");
  ASSERT_DERIVATIVE_EQ(value_b * dq, values, "q");
  ASSERT_DERIVATIVE_EQ(value_b * du, values, "u");
  ASSERT_DERIVATIVE_EQ(value_a * dr, values, "r");
  ASSERT_DERIVATIVE_EQ(value_a * ds, values, "s");
}

TEST(DerivativeTest, TestMixedGraph) {
  // ((x * y) + (z * (x0 + w))) * (v + u * t)
  const node n = make_mixed_graph();
  const evaluation values = evaluate(n);
  const double x = 1.5, y = -2.0, z = 3.0, x0 = 0.25, w = 4.0, v = -1.0, u = 2.5, t = 0.5;
  const double left = x * y + z * (x0 + w);
  const double right = v + u * t;
  ASSERT_DOUBLE_EQ(left * right, values.value());
  ASSERT_DERIVATIVE_EQ(y * right, values, "x");
  ASSERT_DERIVATIVE_EQ(x * right, values, "y");
  ASSERT_DERIVATIVE_EQ((x0 + w) * right, values, "z");
  ASSERT_DERIVATIVE_EQ(z * right, values, "x0");
  ASSERT_DERIVATIVE_EQ(z * right, values, "w");
  ASSERT_DERIVATIVE_EQ(left, values, "v");
  ASSERT_DERIVATIVE_EQ(t * left, values, "u");
  ASSERT_DERIVATIVE_EQ(u * left, values, "t");
}

TEST(DerivativeTest, TestCompareToNumerical) {
  const node n = make_mixed_graph();
  const evaluation values = evaluate(n);
  for (const std::string& name : collect_leaf_names(n)) {
    ASSERT_NEAR(numerical_derivative_over(n, name), values.derivative_over(name), 1.0e-9)
        << name;
  }
}

TEST(DerivativeTest, TestDeepChain) {
  // x0 * x1 * ... * x{N-1}: the derivative wrt x_i is the product of all the other leaves.
  constexpr int num_leaves = 40;
  std::vector<double> leaf_values{};
  node n = make_leaf(1.0, "x0");
  leaf_values.push_back(1.0);
  for (int i = 1; i < num_leaves; ++i) {
    const double v = 1.0 + (i % 3) * 0.5;
    leaf_values.push_back(v);
    n = std::move(n) * make_leaf(v, fmt::format("x{}", i));
  }
  const evaluation values = evaluate(n);
  for (int i = 0; i < num_leaves; ++i) {
    double expected = 1.0;
    for (int j = 0; j < num_leaves; ++j) {
      if (j != i) {
        expected *= leaf_values[static_cast<std::size_t>(j)];
      }
    }
    ASSERT_DOUBLE_EQ(expected, values.derivative_over(fmt::format("x{}", i))) << i;
  }
}

TEST(DerivativeTest, TestGradient) {
  const node f_end = make_abcd_graph();
  const std::vector<std::pair<std::string, double>> expected = {
      {"A", 500.0}, {"B", 500.0}, {"C", 375.0}, {"D", 300.0}};
  ASSERT_EQ(expected, evaluate(f_end).gradient());
}

TEST(DerivativeTest, TestZeroSibling) {
  // A zero sibling value yields a zero derivative, not an error.
  const node p = make_leaf(3.0, "x") * (make_leaf(2.0, "y") + make_leaf(-2.0, "z"));
  const evaluation values = evaluate(p);
  ASSERT_EQ(0.0, values.value());
  ASSERT_DERIVATIVE_EQ(0.0, values, "x");
  ASSERT_DERIVATIVE_EQ(3.0, values, "y");
  ASSERT_DERIVATIVE_EQ(3.0, values, "z");
}

TEST(DerivativeTest, TestVisitorDirectly) {
  const node f_end = make_abcd_graph();
  const evaluation values = evaluate(f_end);
  const derivative_visitor visitor{values, "C", duplicate_name_behavior::first_occurrence};
  ASSERT_EQ(375.0, visitor(f_end));

  // Differentiating a subtree uses the values recorded for that subtree.
  const product& root = cast_checked<product>(f_end);
  ASSERT_EQ(15.0, visitor(root.left()));
}

TEST(DerivativeTest, TestForeignNode) {
  // The visitor refuses to read values that were never computed.
  const node f_end = make_abcd_graph();
  const node other = make_leaf(1.0, "C") * make_leaf(2.0, "E");
  const evaluation values = evaluate(f_end);
  const derivative_visitor visitor{values, "C", duplicate_name_behavior::first_occurrence};
  ASSERT_THROW(visitor(other), invalid_argument_error);
}

}  // namespace cr
