#pragma once

#include <fmt/chrono.h>
#include <fmt/format.h>
#include <fmt/std.h>

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <utility>

namespace rigger::logger {

enum class level : uint8_t { fatal, error, warning, info, debug, trace };

inline std::string_view level_to_string(level level) {
  // clang-format off
  switch (level) {
  case level::trace:   return "TRACE";
  case level::debug:   return "DEBUG";
  case level::info:    return "INFO";
  case level::warning: return "WARNING";
  case level::error:   return "ERROR";
  case level::fatal:   return "FATAL";
  default: return "UNKNOWN";
  }
  // clang-format on
}

// Accepts the numeric form used by "-d" (0 == fatal .. 5 == trace).
inline std::optional<level> level_from_int(int n) {
  if (n < static_cast<int>(level::fatal) || n > static_cast<int>(level::trace))
    return std::nullopt;
  return static_cast<level>(n);
}

inline level global_level = level::info;  // NOLINT
inline void set_level(level level) { global_level = level; }
inline bool enabled(level level) { return level <= global_level; }

inline std::FILE* global_sink = stderr;  // NOLINT

inline std::string get_current_timestamp() {
  using namespace std::chrono;
  auto now = floor<milliseconds>(system_clock::now());
  return fmt::format("{:%Y-%m-%d %H:%M:%S}", now);
}

// Diagnostics go to stderr, stdout is reserved for command output.
template <typename... Args>
inline void log(
    level level, const std::source_location& location,
    fmt::format_string<Args...> fmt, Args&&... args) {
  if (!enabled(level)) return;

  fmt::print(
      global_sink, "{} {}:{} {}: {}\n", get_current_timestamp(),
      std::filesystem::path{location.file_name()}.filename().string(),
      location.line(), level_to_string(level),
      fmt::format(fmt, std::forward<Args>(args)...));
}

}  // namespace rigger::logger

// NOLINTBEGIN
#define LOG_TRACE(...)                                               \
  rigger::logger::log(                                               \
      rigger::logger::level::trace, std::source_location::current(), \
      __VA_ARGS__)

#define LOG_DEBUG(...)                                               \
  rigger::logger::log(                                               \
      rigger::logger::level::debug, std::source_location::current(), \
      __VA_ARGS__)

#define LOG_INFO(...)                                               \
  rigger::logger::log(                                              \
      rigger::logger::level::info, std::source_location::current(), \
      __VA_ARGS__)

#define LOG_WARN(...)                                                  \
  rigger::logger::log(                                                 \
      rigger::logger::level::warning, std::source_location::current(), \
      __VA_ARGS__)

#define LOG_ERROR(...)                                               \
  rigger::logger::log(                                               \
      rigger::logger::level::error, std::source_location::current(), \
      __VA_ARGS__)

#define LOG_FATAL(...)                                               \
  rigger::logger::log(                                               \
      rigger::logger::level::fatal, std::source_location::current(), \
      __VA_ARGS__)
// NOLINTEND
