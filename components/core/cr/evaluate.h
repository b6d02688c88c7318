// chainrule expression graph library.
// Copyright (c) 2024 Gareth Cross
// For license information refer to accompanying LICENSE file.
#pragma once
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "cr/enumerations.h"
#include "cr/expressions/all_nodes.h"
#include "cr/utility/third_party_imports.h"

CR_BEGIN_THIRD_PARTY_INCLUDES
#include <absl/container/flat_hash_map.h>
CR_END_THIRD_PARTY_INCLUDES

namespace cr {

// The result of evaluating an expression graph: the value of the root, the names of the leaves
// that were visited, and the value computed at every node of the graph.
//
// Derivatives are computed from an `evaluation`, so they can never observe a value that was not
// computed. The evaluation refers to the graph it was computed from: the root passed to
// `evaluate` must outlive it.
class evaluation {
 public:
  // The root of the evaluated graph.
  const node& root() const noexcept { return *root_; }

  // Names of the leaves visited, left to right.
  const std::vector<std::string>& leaf_names() const noexcept { return leaf_names_; }

  // Value of the root.
  double value() const noexcept { return value_; }

  // Number of nodes that were evaluated.
  std::size_t size() const noexcept { return values_.size(); }

  // True if `n` is a node of the evaluated graph.
  bool contains_node(const node& n) const { return values_.contains(n.get_address()); }

  // Value computed for node `n`. Throws `invalid_argument_error` if `n` does not belong to the
  // evaluated graph.
  double value_of(const node& n) const;

  // Partial derivative of the root with respect to the leaf named `name`.
  double derivative_over(
      std::string_view name,
      duplicate_name_behavior behavior = duplicate_name_behavior::first_occurrence) const;

  // Partial derivative of the root with respect to every distinct leaf name, in the order the
  // names are first visited.
  std::vector<std::pair<std::string, double>> gradient(
      duplicate_name_behavior behavior = duplicate_name_behavior::first_occurrence) const;

 private:
  explicit evaluation(const node& root) noexcept : root_(&root) {}

  friend class evaluate_visitor;
  friend evaluation evaluate(const node& root);

  const node* root_;
  std::vector<std::string> leaf_names_{};
  double value_{0.0};
  absl::flat_hash_map<const void*, double> values_{};
};

// Visitor that computes the value of every node and records it in an `evaluation`.
class evaluate_visitor {
 public:
  // Results are written into `output`, which must remain in scope while the visitor is used.
  explicit evaluate_visitor(evaluation& output) noexcept : output_(output) {}

  // Evaluate `n` and record its value.
  double operator()(const node& n);

  double operator()(const leaf& l);
  double operator()(const sum& s);
  double operator()(const product& p);

 private:
  evaluation& output_;
};

// Evaluate every node of the graph rooted at `root`.
evaluation evaluate(const node& root);

// The evaluation refers to `root`, so a temporary graph cannot be evaluated.
evaluation evaluate(node&& root) = delete;

}  // namespace cr
