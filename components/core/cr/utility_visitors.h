// chainrule expression graph library.
// Copyright (c) 2024 Gareth Cross
// For license information refer to accompanying LICENSE file.
#pragma once
#include <string>
#include <string_view>
#include <vector>

#include "cr/expressions/all_nodes.h"
#include "cr/utility/overloaded_visit.h"

namespace cr {

// Visitor that checks whether any leaf in a subtree is named `target`.
class contains_visitor {
 public:
  explicit constexpr contains_visitor(const std::string_view target) noexcept : target_(target) {}

  bool operator()(const leaf& l) const noexcept { return l.name() == target_; }
  bool operator()(const sum& s) const { return contains_either(s); }
  bool operator()(const product& p) const { return contains_either(p); }

 private:
  bool contains_either(const binary_node& b) const {
    return visit(b.left(), *this) || visit(b.right(), *this);
  }

  std::string_view target_;
};

// Invoke `func` on every leaf of `root`, left to right.
template <typename Func>
void for_each_leaf(const node& root, Func&& func) {
  overloaded_visit(
      root.storage().contents, [&func](const leaf& l) { func(l); },
      [&func](const binary_node& b) {
        for_each_leaf(b.left(), func);
        for_each_leaf(b.right(), func);
      });
}

// Names of every leaf in `root`, left to right. Repeated names appear once per leaf.
std::vector<std::string> collect_leaf_names(const node& root);

// Number of leaves in `root`.
std::size_t count_leaves(const node& root);

// Number of leaves in `root` named `name`.
std::size_t count_leaves_named(const node& root, std::string_view name);

// Names that label more than one leaf of `root`, in the order their first repeat is found.
std::vector<std::string> find_duplicate_leaf_names(const node& root);

// Throw `invalid_argument_error` if any name labels more than one leaf of `root`.
void require_unique_leaf_names(const node& root);

}  // namespace cr
