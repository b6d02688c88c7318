// chainrule expression graph library.
// Copyright (c) 2024 Gareth Cross
// For license information refer to accompanying LICENSE file.
#include "cr/plain_formatter.h"

#include <iterator>

#include "cr/utility/overloaded_visit.h"

CR_BEGIN_THIRD_PARTY_INCLUDES
#include <fmt/format.h>
CR_END_THIRD_PARTY_INCLUDES

namespace cr {

std::string plain_formatter::convert(const node& n) { return visit(n, plain_formatter{}); }

std::string plain_formatter::operator()(const leaf& l) const { return l.name(); }

std::string plain_formatter::operator()(const sum& s) const {
  return format_binary(s, precedence::addition, " + ");
}

std::string plain_formatter::operator()(const product& p) const {
  return format_binary(p, precedence::multiplication, " * ");
}

std::string plain_formatter::format_binary(const binary_node& b, const precedence parent,
                                           const std::string_view op) const {
  std::string output{};
  if (get_precedence(b.left()) < parent) {
    fmt::format_to(std::back_inserter(output), "({})", visit(b.left(), *this));
  } else {
    output += visit(b.left(), *this);
  }
  output += op;
  if (get_precedence(b.right()) <= parent) {
    fmt::format_to(std::back_inserter(output), "({})", visit(b.right(), *this));
  } else {
    output += visit(b.right(), *this);
  }
  return output;
}

precedence get_precedence(const node& n) {
  return overloaded_visit(
      n.storage().contents, [](const leaf&) constexpr { return precedence::none; },
      [](const sum&) constexpr { return precedence::addition; },
      [](const product&) constexpr { return precedence::multiplication; });
}

}  // namespace cr
