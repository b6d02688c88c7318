// chainrule expression graph library.
// Copyright (c) 2024 Gareth Cross
// For license information refer to accompanying LICENSE file.
#include <cstdlib>

#include <gtest/gtest.h>

#include "cr/utility/scoped_trace.h"

// Shared main for all unit tests. Traces are written to `CHAINRULE_TRACE_FILE` when set.
int main(int argc, char** argv) {
  if (const char* trace_path = std::getenv("CHAINRULE_TRACE_FILE"); trace_path != nullptr) {
    cr::trace_collector::get_instance()->set_output_path(trace_path);
  }
  testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
