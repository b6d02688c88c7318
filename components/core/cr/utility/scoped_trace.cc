// chainrule expression graph library.
// Copyright (c) 2024 Gareth Cross
// For license information refer to accompanying LICENSE file.
#include "cr/utility/scoped_trace.h"

#include <deque>
#include <exception>
#include <filesystem>
#include <fstream>
#include <mutex>

#ifdef _WIN32
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#include <windows.h>
#else
#include <unistd.h>  // getpid
#ifdef __APPLE__
#include <pthread.h>  // pthread_mach_thread_np
#else
#include <sys/syscall.h>  // syscall
#include <sys/types.h>
#endif  // __APPLE__
#endif  // _WIN32

#include "cr/utility/assertions.h"

CR_BEGIN_THIRD_PARTY_INCLUDES
#include <fmt/format.h>
#include <fmt/ranges.h>
CR_END_THIRD_PARTY_INCLUDES

// Format cr::trace_event to JSON.
template <>
struct fmt::formatter<cr::trace_event> {
  constexpr auto parse(format_parse_context& ctx) -> decltype(ctx.begin()) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(const cr::trace_event& event, FormatContext& ctx) const -> decltype(ctx.out()) {
    return fmt::format_to(
        ctx.out(),
        R"json({{ "name": "{}", "cat": "", "ph": "X", "ts": {}, "pid": {}, "tid": {}, "dur": {}, "dur_ns": {} }})json",
        event.name, event.ts, event.pid, event.tid, event.dur_ns / 1000, event.dur_ns);
  }
};

namespace cr {

// Process and thread ids of the calling thread, read once per thread.
struct thread_ids {
  thread_ids() noexcept {
#ifdef _WIN32
    pid = static_cast<std::uint32_t>(GetCurrentProcessId());
    tid = static_cast<std::uint32_t>(GetCurrentThreadId());
#elif defined(__APPLE__)
    pid = static_cast<std::uint32_t>(getpid());
    tid = static_cast<std::uint32_t>(pthread_mach_thread_np(pthread_self()));
#else
    pid = static_cast<std::uint32_t>(getpid());
    tid = static_cast<std::uint32_t>(syscall(SYS_gettid));
#endif
  }

  std::uint32_t pid;
  std::uint32_t tid;
};

struct trace_collector_impl {
  std::deque<trace_event> events;
  mutable std::mutex mutex;
  std::string output_path{};
};

trace_collector* trace_collector::get_instance() {
  static trace_collector global_collector{};
  return &global_collector;
}

trace_collector::trace_collector() : impl_(std::make_unique<trace_collector_impl>()) {
  CR_ASSERT(impl_);
}

trace_collector::~trace_collector() {
  if (std::uncaught_exceptions() > 0) {
    return;
  }
  write_traces();
}

void trace_collector::submit_event(trace_event event) {
  std::lock_guard guard{impl().mutex};
  impl().events.push_back(event);
}

void trace_collector::set_output_path(const std::string& path) {
  std::lock_guard guard{impl().mutex};
  impl().output_path = path;
}

std::size_t trace_collector::num_events() const {
  std::lock_guard guard{impl().mutex};
  return impl().events.size();
}

trace_collector_impl& trace_collector::impl() const noexcept { return *impl_; }

void trace_collector::write_traces() const {
  std::lock_guard guard{impl().mutex};
  if (impl().output_path.empty()) {
    return;
  }
  const auto abs_path = std::filesystem::weakly_canonical(impl().output_path);
  if (std::ofstream output(abs_path); output.good()) {
    fmt::print("Writing {} trace events to: {}\n", impl().events.size(), abs_path.string());
    output << fmt::format(R"json({{
  "traceEvents": [
    {}
  ],
  "displayTimeUnit": "ns"
}}
)json",
                          fmt::join(impl().events, ",\n    "));
  }
}

scoped_trace::~scoped_trace() {
  const auto end = std::chrono::high_resolution_clock::now();
  if (std::uncaught_exceptions() > 0) {
    return;
  }
  using std::chrono::duration_cast;
  const std::int64_t duration_nanos =
      duration_cast<std::chrono::nanoseconds>(end - start_).count();
  const std::int64_t start_micros =
      duration_cast<std::chrono::microseconds>(start_.time_since_epoch()).count();
  const thread_local thread_ids ids{};
  trace_collector::get_instance()->submit_event(
      trace_event{name_, start_micros, ids.pid, ids.tid, duration_nanos});
}

}  // namespace cr
