#pragma once

#include <format>
#include <string>
#include <string_view>

// Labels used in logs and in the JSON record; from_str is the inverse and
// falls back to the neutral/default value for an unknown label.
template <typename T>
std::string to_str(const T& t);

template <typename T>
T from_str(const std::string& str);

inline std::string join(auto begin, auto end, std::string_view sep = ", ") {
  std::string out;
  for (auto it = begin; it != end; it++) {
    if (it != begin)
      out += sep;
    out += to_str(*it);
  }
  return out;
}
