// chainrule expression graph library.
// Copyright (c) 2024 Gareth Cross
// For license information refer to accompanying LICENSE file.
#pragma once
#include <string>
#include <string_view>

namespace cr {

// A named scalar constant. The base case of every recursion over the graph.
class leaf {
 public:
  static constexpr std::string_view name_str = "Leaf";
  static constexpr bool is_leaf_node = true;

  leaf(const double value, std::string name) noexcept : value_(value), name_(std::move(name)) {}

  // The stored value.
  double value() const noexcept { return value_; }

  // Name used to address this leaf when differentiating.
  const std::string& name() const noexcept { return name_; }

 private:
  double value_;
  std::string name_;
};

}  // namespace cr
