// chainrule expression graph library.
// Copyright (c) 2024 Gareth Cross
// For license information refer to accompanying LICENSE file.
#pragma once
#include <iterator>
#include <string>

#include "cr/utility/error_types.h"

CR_BEGIN_THIRD_PARTY_INCLUDES
#include <fmt/format.h>
CR_END_THIRD_PARTY_INCLUDES

namespace cr {
namespace detail {

// Generates an exception w/ a formatted string.
template <typename... Ts>
std::string format_assert(const char* const condition, const char* const file, const int line,
                          const char* const reason_fmt = nullptr, Ts&&... args) {
  std::string err = fmt::format("Assertion failed: {}\nFile: {}\nLine: {}", condition, file, line);
  if (reason_fmt != nullptr) {
    err.append("\nDetails: ");
    fmt::vformat_to(std::back_inserter(err), reason_fmt, fmt::make_format_args(args...));
  }
  return err;
}

// Version that prints args A & B as well. For binary comparisons.
template <typename A, typename B, typename... Ts>
std::string format_assert_binary(const char* const condition, const char* const file,
                                 const int line, const char* const a_name, const A& a,
                                 const char* const b_name, const B& b,
                                 const char* const reason_fmt = nullptr, Ts&&... args) {
  std::string err = fmt::format(
      "Assertion failed: {}\n"
      "Operands are: `{}` = {}, `{}` = {}\n"
      "File: {}\nLine: {}",
      condition, a_name, a, b_name, b, file, line);
  if (reason_fmt != nullptr) {
    err.append("\nDetails: ");
    fmt::vformat_to(std::back_inserter(err), reason_fmt, fmt::make_format_args(args...));
  }
  return err;
}

}  // namespace detail
}  // namespace cr

#ifdef __clang__
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wgnu-zero-variadic-macro-arguments"
#endif  // __clang__

// Assertion macros. These throw `cr::assertion_error` rather than aborting.
#define CR_ASSERT_IMPL(cond, file, line, handler, ...)                      \
  do {                                                                      \
    if (!static_cast<bool>(cond)) {                                         \
      throw cr::assertion_error(handler(#cond, file, line, ##__VA_ARGS__)); \
    }                                                                       \
  } while (false)

#define CR_ASSERT(cond, ...) \
  CR_ASSERT_IMPL(cond, __FILE__, __LINE__, cr::detail::format_assert, ##__VA_ARGS__)

#define CR_ASSERT_ALWAYS(...)                                                        \
  throw cr::assertion_error(                                                         \
      cr::detail::format_assert("Assert always", __FILE__, __LINE__, ##__VA_ARGS__))

#define CR_ASSERT_EQ(a, b, ...)                                                                  \
  CR_ASSERT_IMPL((a) == (b), __FILE__, __LINE__, cr::detail::format_assert_binary, #a, a, #b, b, \
                 ##__VA_ARGS__)

#define CR_ASSERT_NE(a, b, ...)                                                                  \
  CR_ASSERT_IMPL((a) != (b), __FILE__, __LINE__, cr::detail::format_assert_binary, #a, a, #b, b, \
                 ##__VA_ARGS__)

#define CR_ASSERT_LT(a, b, ...)                                                                 \
  CR_ASSERT_IMPL((a) < (b), __FILE__, __LINE__, cr::detail::format_assert_binary, #a, a, #b, b, \
                 ##__VA_ARGS__)

#define CR_ASSERT_GE(a, b, ...)                                                                  \
  CR_ASSERT_IMPL((a) >= (b), __FILE__, __LINE__, cr::detail::format_assert_binary, #a, a, #b, b, \
                 ##__VA_ARGS__)

#ifdef __clang__
#pragma clang diagnostic pop
#endif  // __clang__
