// chainrule expression graph library.
// Copyright (c) 2024 Gareth Cross
// For license information refer to accompanying LICENSE file.
// Benchmark evaluation and differentiation of long chains of sums and products.
#include <benchmark/benchmark.h>

#include "cr/derivative.h"
#include "cr/evaluate.h"

CR_BEGIN_THIRD_PARTY_INCLUDES
#include <fmt/format.h>
CR_END_THIRD_PARTY_INCLUDES

namespace cr {

// ((x00 + x01) * x02 + x03) * x04 ...
static node make_chain(const int num_leaves) {
  node output = make_leaf(1.0, "x00");
  for (int i = 1; i < num_leaves; ++i) {
    node next = make_leaf(1.0 + 0.01 * i, fmt::format("x{:02}", i));
    if (i % 2 == 1) {
      output = std::move(output) + std::move(next);
    } else {
      output = std::move(output) * std::move(next);
    }
  }
  return output;
}

// Benchmark the evaluation pass.
static void BM_Evaluate(benchmark::State& state) {
  const node graph = make_chain(static_cast<int>(state.range(0)));
  for (auto _ : state) {
    evaluation values = evaluate(graph);
    benchmark::DoNotOptimize(values);
  }
}
BENCHMARK(BM_Evaluate)->Arg(16)->Arg(128)->Arg(512)->Unit(benchmark::kMicrosecond);

// Benchmark differentiating wrt the deepest leaf, which is the worst case for `contains`.
static void BM_DerivativeDeepestLeaf(benchmark::State& state) {
  const node graph = make_chain(static_cast<int>(state.range(0)));
  const evaluation values = evaluate(graph);
  for (auto _ : state) {
    double output = values.derivative_over("x00");
    benchmark::DoNotOptimize(output);
  }
}
BENCHMARK(BM_DerivativeDeepestLeaf)->Arg(16)->Arg(128)->Arg(512)->Unit(benchmark::kMicrosecond);

// Benchmark the full gradient.
static void BM_Gradient(benchmark::State& state) {
  const node graph = make_chain(static_cast<int>(state.range(0)));
  const evaluation values = evaluate(graph);
  for (auto _ : state) {
    auto output = values.gradient();
    benchmark::DoNotOptimize(output);
  }
}
BENCHMARK(BM_Gradient)->Arg(16)->Arg(128)->Unit(benchmark::kMillisecond);

}  // namespace cr

BENCHMARK_MAIN();
