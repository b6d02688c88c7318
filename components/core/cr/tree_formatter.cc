// chainrule expression graph library.
// Copyright (c) 2024 Gareth Cross
// For license information refer to accompanying LICENSE file.
#include "cr/tree_formatter.h"

#include <iterator>

#include "cr/utility/strings.h"

CR_BEGIN_THIRD_PARTY_INCLUDES
#include <fmt/format.h>
CR_END_THIRD_PARTY_INCLUDES

namespace cr {

void tree_formatter_visitor::operator()(const node& n) { visit(n, *this); }

void tree_formatter_visitor::operator()(const leaf& l) {
  format_append("{} ({}, {})", leaf::name_str, l.name(), l.value());
}

void tree_formatter_visitor::operator()(const sum& s) { format_binary(sum::name_str, s); }

void tree_formatter_visitor::operator()(const product& p) {
  format_binary(product::name_str, p);
}

void tree_formatter_visitor::format_binary(const std::string_view type_name,
                                           const binary_node& b) {
  if (b.label().empty()) {
    format_append("{}:", type_name);
  } else {
    format_append("{} ({}):", type_name, b.label());
  }
  visit_left(b.left());
  visit_right(b.right());
}

std::string tree_formatter_visitor::take_output() {
  // The last line carries a superfluous newline, trim it.
  right_trim_in_place(output_);
  return std::move(output_);
}

void tree_formatter_visitor::apply_indentation() {
  if (indentations_.empty()) {
    return;
  }
  // For each left branch depth, we need to add a line.
  // Right branches only need space.
  for (std::size_t i = 0; i + 1 < indentations_.size(); ++i) {
    if (indentations_[i]) {
      output_ += "│  ";
    } else {
      output_ += "   ";
    }
  }
  if (indentations_.back()) {
    output_ += "├─ ";
  } else {
    output_ += "└─ ";
  }
}

template <typename... Args>
void tree_formatter_visitor::format_append(const std::string_view fmt_str, Args&&... args) {
  apply_indentation();
  fmt::vformat_to(std::back_inserter(output_), fmt_str, fmt::make_format_args(args...));
  output_ += "\n";
}

void tree_formatter_visitor::visit_left(const node& n) {
  indentations_.push_back(true);
  visit(n, *this);
  indentations_.pop_back();
}

void tree_formatter_visitor::visit_right(const node& n) {
  indentations_.push_back(false);
  visit(n, *this);
  indentations_.pop_back();
}

}  // namespace cr
