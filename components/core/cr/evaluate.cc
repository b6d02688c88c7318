// chainrule expression graph library.
// Copyright (c) 2024 Gareth Cross
// For license information refer to accompanying LICENSE file.
#include "cr/evaluate.h"

#include "cr/derivative.h"
#include "cr/utility/error_types.h"
#include "cr/utility/scoped_trace.h"

CR_BEGIN_THIRD_PARTY_INCLUDES
#include <absl/container/flat_hash_set.h>
CR_END_THIRD_PARTY_INCLUDES

namespace cr {

double evaluation::value_of(const node& n) const {
  if (const auto it = values_.find(n.get_address()); it != values_.end()) {
    return it->second;
  }
  throw invalid_argument_error(
      "Node `{}` does not belong to the evaluated graph `{}`. Evaluate the graph that contains "
      "it before requesting its value.",
      n.to_string(), root_->to_string());
}

double evaluation::derivative_over(const std::string_view name,
                                   const duplicate_name_behavior behavior) const {
  CR_FUNCTION_TRACE();
  const derivative_visitor visitor{*this, name, behavior};
  return visitor(root());
}

std::vector<std::pair<std::string, double>> evaluation::gradient(
    const duplicate_name_behavior behavior) const {
  CR_FUNCTION_TRACE();
  std::vector<std::pair<std::string, double>> result{};
  absl::flat_hash_set<std::string_view> visited{};
  for (const std::string& name : leaf_names_) {
    if (const auto [_, inserted] = visited.insert(name); inserted) {
      result.emplace_back(name, derivative_over(name, behavior));
    }
  }
  return result;
}

double evaluate_visitor::operator()(const node& n) {
  const double value = visit(n, *this);
  output_.values_.emplace(n.get_address(), value);
  return value;
}

double evaluate_visitor::operator()(const leaf& l) {
  output_.leaf_names_.push_back(l.name());
  return l.value();
}

// Operands are evaluated left first, so leaf names come out in left-to-right order.
double evaluate_visitor::operator()(const sum& s) {
  const double a = operator()(s.left());
  const double b = operator()(s.right());
  return a + b;
}

double evaluate_visitor::operator()(const product& p) {
  const double a = operator()(p.left());
  const double b = operator()(p.right());
  return a * b;
}

evaluation evaluate(const node& root) {
  CR_FUNCTION_TRACE();
  evaluation result{root};
  evaluate_visitor visitor{result};
  result.value_ = visitor(root);
  return result;
}

}  // namespace cr
