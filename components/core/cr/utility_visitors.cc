// chainrule expression graph library.
// Copyright (c) 2024 Gareth Cross
// For license information refer to accompanying LICENSE file.
#include "cr/utility_visitors.h"

#include "cr/utility/third_party_imports.h"

CR_BEGIN_THIRD_PARTY_INCLUDES
#include <absl/container/flat_hash_map.h>
#include <fmt/format.h>
#include <fmt/ranges.h>
CR_END_THIRD_PARTY_INCLUDES

namespace cr {

std::vector<std::string> collect_leaf_names(const node& root) {
  std::vector<std::string> names{};
  for_each_leaf(root, [&names](const leaf& l) { names.push_back(l.name()); });
  return names;
}

std::size_t count_leaves(const node& root) {
  std::size_t count = 0;
  for_each_leaf(root, [&count](const leaf&) { ++count; });
  return count;
}

std::size_t count_leaves_named(const node& root, const std::string_view name) {
  std::size_t count = 0;
  for_each_leaf(root, [&count, name](const leaf& l) {
    if (l.name() == name) {
      ++count;
    }
  });
  return count;
}

std::vector<std::string> find_duplicate_leaf_names(const node& root) {
  // Views point into leaves owned by `root`.
  absl::flat_hash_map<std::string_view, std::size_t> counts{};
  std::vector<std::string> duplicates{};
  for_each_leaf(root, [&](const leaf& l) {
    if (++counts[std::string_view{l.name()}] == 2) {
      duplicates.push_back(l.name());
    }
  });
  return duplicates;
}

void require_unique_leaf_names(const node& root) {
  if (const std::vector<std::string> duplicates = find_duplicate_leaf_names(root);
      !duplicates.empty()) {
    throw invalid_argument_error(
        fmt::format("Leaf names must be unique. The following names label more than one leaf: [{}]",
                    fmt::join(duplicates, ", ")));
  }
}

}  // namespace cr
