// chainrule expression graph library.
// Copyright (c) 2024 Gareth Cross
// For license information refer to accompanying LICENSE file.
#pragma once
#include <limits>
#include <string_view>

namespace cr {

// The concrete kinds of node. Order matches the alternatives of `detail::node_storage`.
enum class node_kind {
  leaf = 0,
  sum,
  product,
};

// Mathematical precedence of operators.
enum class precedence : int {
  addition = 0,
  multiplication,
  none = std::numeric_limits<int>::max(),
};

// How derivatives treat a name that labels more than one leaf.
enum class duplicate_name_behavior {
  // Descend into the first operand (left to right) that contains the name, and ignore the other.
  first_occurrence,
  // Sum the contributions of every operand that contains the name (full chain rule).
  accumulate,
  // Throw `invalid_argument_error` if the name labels more than one leaf.
  reject,
};

// Convert `node_kind` to a string.
constexpr std::string_view string_from_node_kind(const node_kind kind) noexcept {
  switch (kind) {
    case node_kind::leaf:
      return "leaf";
    case node_kind::sum:
      return "sum";
    case node_kind::product:
      return "product";
  }
  return "<NOT A VALID ENUM VALUE>";
}

// Convert `duplicate_name_behavior` to a string.
constexpr std::string_view string_from_duplicate_name_behavior(
    const duplicate_name_behavior behavior) noexcept {
  switch (behavior) {
    case duplicate_name_behavior::first_occurrence:
      return "first_occurrence";
    case duplicate_name_behavior::accumulate:
      return "accumulate";
    case duplicate_name_behavior::reject:
      return "reject";
  }
  return "<NOT A VALID ENUM VALUE>";
}

}  // namespace cr
