// chainrule expression graph library.
// Copyright (c) 2024 Gareth Cross
// For license information refer to accompanying LICENSE file.
#include "cr/derivative.h"

#include "cr/utility/error_types.h"
#include "cr/utility/scoped_trace.h"
#include "cr/utility_visitors.h"

namespace cr {

derivative_visitor::derivative_visitor(const evaluation& values, const std::string_view name,
                                       const duplicate_name_behavior behavior)
    : values_(values), name_(name), behavior_(behavior) {
  if (behavior_ == duplicate_name_behavior::reject) {
    if (const std::size_t count = count_leaves_named(values_.root(), name_); count > 1) {
      throw invalid_argument_error(
          "Variable `{}` labels {} leaves of the expression graph, and duplicate names are "
          "rejected.",
          name_, count);
    }
  }
}

double derivative_visitor::operator()(const node& n) const { return visit(n, *this); }

double derivative_visitor::operator()(const leaf& l) const {
  if (l.name() == name_) {
    return 1.0;
  }
  throw unknown_variable_error(name_);
}

// d(a + b)/da = 1, d(a + b)/db = 1
double derivative_visitor::operator()(const sum& s) const { return chain(s, 1.0, 1.0); }

// d(a * b)/da = b, d(a * b)/db = a
double derivative_visitor::operator()(const product& p) const {
  return chain(p, values_.value_of(p.right()), values_.value_of(p.left()));
}

double derivative_visitor::chain(const binary_node& b, const double d_left,
                                 const double d_right) const {
  const bool in_left = b.left().contains(name_);
  if (behavior_ != duplicate_name_behavior::accumulate) {
    if (in_left) {
      return d_left * operator()(b.left());
    } else if (b.right().contains(name_)) {
      return d_right * operator()(b.right());
    }
    throw unknown_variable_error(name_);
  }

  const bool in_right = b.right().contains(name_);
  if (!in_left && !in_right) {
    throw unknown_variable_error(name_);
  }
  double result = 0.0;
  if (in_left) {
    result += d_left * operator()(b.left());
  }
  if (in_right) {
    result += d_right * operator()(b.right());
  }
  return result;
}

double derivative_over(const node& root, const std::string_view name,
                       const duplicate_name_behavior behavior) {
  CR_FUNCTION_TRACE();
  return evaluate(root).derivative_over(name, behavior);
}

}  // namespace cr
