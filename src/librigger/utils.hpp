#pragma once

#include <cxxabi.h>
#include <fmt/format.h>

#include <cstdlib>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "rigger/errors.hpp"

namespace rigger::utils {
template <typename Exception = configuration_error, typename... Args>
[[noreturn]] void throwf(
    fmt::format_string<Args...> format_str, Args&&... args) {
  throw Exception(fmt::format(format_str, std::forward<Args>(args)...));
}

// Used to name exception types in error reports
inline std::string demangle_symbol(std::string_view mangled) {
  int status = 0;
  std::string result{mangled};
  char* demangled =
      abi::__cxa_demangle(result.c_str(), nullptr, nullptr, &status);
  if (status == 0 && demangled) {
    result = demangled;
    std::free(demangled);  // NOLINT
  }
  return result;
}

inline std::string join(
    const std::vector<std::string>& parts, std::string_view sep = " ") {
  std::string res;
  bool first = true;
  for (const auto& p : parts) {
    if (!first) res += sep;
    first = false;
    res += p;
  }
  return res;
}

}  // namespace rigger::utils
