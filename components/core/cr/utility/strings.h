// chainrule expression graph library.
// Copyright (c) 2024 Gareth Cross
// For license information refer to accompanying LICENSE file.
#pragma once
#include <algorithm>
#include <cctype>
#include <string>

namespace cr {

// Remove trailing whitespace from `str`.
inline void right_trim_in_place(std::string& str) {
  const auto last = std::find_if(str.rbegin(), str.rend(), [](const unsigned char c) {
                      return std::isspace(c) == 0;
                    }).base();
  str.erase(last, str.end());
}

}  // namespace cr
