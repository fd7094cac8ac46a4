#pragma once
#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

namespace nestbench::util {

// ASCII lower-casing, used for case-insensitive name lookups.
inline std::string to_lower(std::string_view text) {
  std::string s(text);
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

} // namespace nestbench::util
