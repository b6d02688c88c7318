// chainrule expression graph library.
// Copyright (c) 2024 Gareth Cross
// For license information refer to accompanying LICENSE file.
#pragma once
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#ifdef CR_ENABLE_TRACING
#define CR_CONCAT_(a, b) a##b
#define CR_CONCAT(a, b) CR_CONCAT_(a, b)

// Create a scoped trace with the provided string literal as its name.
#define CR_SCOPED_TRACE_STR(str) \
  cr::scoped_trace CR_CONCAT(__timer, __LINE__) { str }
#else
// Do nothing when tracing is disabled.
#define CR_SCOPED_TRACE_STR(str)
#endif  // CR_ENABLE_TRACING

#define CR_SCOPED_TRACE(name) CR_SCOPED_TRACE_STR(#name)
#define CR_FUNCTION_TRACE() CR_SCOPED_TRACE_STR(__FUNCTION__)

namespace cr {

// A single "complete" event in chrome://tracing format.
struct trace_event {
  // Name of the event.
  std::string_view name;
  // Timestamp in microseconds.
  std::int64_t ts;
  // Process ID.
  std::uint32_t pid;
  // Thread ID.
  std::uint32_t tid;
  // Duration in nanoseconds.
  std::int64_t dur_ns;
};

// Aggregates tracing events and writes them out as JSON when destroyed.
class trace_collector {
 public:
  trace_collector();

  // Write all traces out on destruction, assuming no exceptions are in flight.
  ~trace_collector();

  // Access the global instance of the trace collector.
  static trace_collector* get_instance();

  // Record an event. Thread safe.
  void submit_event(trace_event event);

  // Set the output path for traces. Nothing is written while the path is empty.
  void set_output_path(const std::string& path);

  // Number of events recorded so far.
  std::size_t num_events() const;

 private:
  struct trace_collector_impl& impl() const noexcept;

  void write_traces() const;

  std::unique_ptr<trace_collector_impl> impl_;
};

// Measure time elapsed in a particular scope, and submit it to the global collector.
class scoped_trace {
 public:
  explicit scoped_trace(const std::string_view name) noexcept
      : name_(name), start_(std::chrono::high_resolution_clock::now()) {}
  ~scoped_trace();

  scoped_trace(const scoped_trace&) = delete;
  scoped_trace(scoped_trace&&) = delete;
  scoped_trace& operator=(const scoped_trace&) = delete;
  scoped_trace& operator=(scoped_trace&&) = delete;

 private:
  std::string_view name_;
  std::chrono::high_resolution_clock::time_point start_;
};

}  // namespace cr
