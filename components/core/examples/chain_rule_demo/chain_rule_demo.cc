// chainrule expression graph library.
// Copyright (c) 2024 Gareth Cross
// For license information refer to accompanying LICENSE file.
#include <cstdlib>
#include <string_view>
#include <vector>

#include "cr/derivative.h"
#include "cr/evaluate.h"
#include "cr/utility/error_types.h"
#include "cr/utility/scoped_trace.h"

CR_BEGIN_THIRD_PARTY_INCLUDES
#include <fmt/format.h>
#include <fmt/ranges.h>
CR_END_THIRD_PARTY_INCLUDES

// Builds (A + B) * C * D with A = 10, B = 5, C = 20, D = 25 and prints the value of the graph
// along with its derivative wrt each name on the command line (`A` and `D` by default).
int main(int argc, char** argv) {
  if (const char* trace_path = std::getenv("CHAINRULE_TRACE_FILE"); trace_path != nullptr) {
    cr::trace_collector::get_instance()->set_output_path(trace_path);
  }

  std::vector<std::string_view> names{};
  for (int i = 1; i < argc; ++i) {
    names.emplace_back(argv[i]);
  }
  if (names.empty()) {
    names = {"A", "D"};
  }

  cr::node a{10.0, "A"};
  cr::node b{5.0, "B"};
  cr::node c{20.0, "C"};
  cr::node d{25.0, "D"};
  cr::node f1 = cr::make_sum(std::move(a), std::move(b), "A+B");
  cr::node f2 = cr::make_product(std::move(f1), std::move(c), "(A+B)C");
  const cr::node f_end = cr::make_product(std::move(f2), std::move(d), "(A+B)CD");

  fmt::print("{}\n", f_end.to_expression_tree_string());

  const cr::evaluation values = cr::evaluate(f_end);
  fmt::print("Leaves: [{}]\n", fmt::join(values.leaf_names(), ", "));
  fmt::print("Val: {}\n", values.value());

  for (const std::string_view name : names) {
    try {
      fmt::print("Derive {}: {}\n", name, values.derivative_over(name));
    } catch (const cr::unknown_variable_error& err) {
      fmt::print(stderr, "Error: {}\n", err.what());
      return EXIT_FAILURE;
    }
  }
  return EXIT_SUCCESS;
}
