// chainrule expression graph library.
// Copyright (c) 2024 Gareth Cross
// For license information refer to accompanying LICENSE file.
#pragma once
#include <string>
#include <string_view>

#include "cr/utility/third_party_imports.h"

CR_BEGIN_THIRD_PARTY_INCLUDES
#include <fmt/core.h>
CR_END_THIRD_PARTY_INCLUDES

// All the exception types the library throws.
namespace cr {

// Base type for errors.
struct exception_base : std::exception {
  // Construct with moved message.
  explicit exception_base(std::string&& message) noexcept : message_(std::move(message)) {}

  // Construct with format specifier and arguments.
  template <typename... Ts>
  explicit exception_base(std::string_view fmt, Ts&&... args)
      : exception_base(fmt::vformat(fmt, fmt::make_format_args(args...))) {}

  // Retrieve error message as a string view.
  [[nodiscard]] std::string_view message() const noexcept { return message_; }

  // Implement std::exception
  const char* what() const noexcept override { return message_.c_str(); }

 private:
  std::string message_;
};

// Thrown when assertions fire.
struct assertion_error final : exception_base {
  using exception_base::exception_base;
};

// Thrown when a node is accessed as the wrong concrete type.
struct type_error final : exception_base {
  using exception_base::exception_base;
};

// Thrown when an invalid argument is specified.
struct invalid_argument_error final : exception_base {
  using exception_base::exception_base;
};

// Thrown when a derivative is requested for a name that no reachable leaf carries.
struct unknown_variable_error final : exception_base {
  explicit unknown_variable_error(const std::string_view name)
      : exception_base("Unknown variable `{}`: no leaf in the expression graph has this name.",
                       name),
        name_(name) {}

  // The name that could not be found.
  const std::string& name() const noexcept { return name_; }

 private:
  std::string name_;
};

}  // namespace cr
