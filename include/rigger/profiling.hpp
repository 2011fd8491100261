#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "rigger/context.hpp"

namespace rigger {

namespace fs = std::filesystem;

inline constexpr std::string_view profiling_tool = "gprof";
inline constexpr std::string_view profile_all_action = "profile-all";
inline constexpr std::string_view profiler_prefix_variable = "GMON_OUT_PREFIX";
inline constexpr std::string_view profiler_prefix = "gmon";
inline constexpr std::string_view profiler_report_file = "gmon.txt";

// One profiling registration.  Unset members take their defaults when the
// action is defined:
//
//   name               target
//   working_directory  binary dir of the registering project
//   report_directory   <root binary dir>/profiling/gprof-reports
struct profiling_options {
  std::string target;
  std::optional<std::string> name{};
  std::optional<fs::path> working_directory{};
  std::optional<fs::path> report_directory{};
  std::vector<std::string> program_args{};
  bool generate_report{};
};

// Adds the instrumentation flags to TARGET when code profiling is enabled
// for a GCC build.  Throws configuration_error for an unknown target.
void instrument_target(configure_context& ctx, const std::string& target);

// The flags instrument_target() adds.
std::vector<std::string> instrumentation_flags();

// Defines "profile-<name>" for an executable target and hooks it into
// "profile-all".  Returns the action name, or nothing when profiling is not
// available in this configuration.  Throws configuration_error when the
// target is missing or not an executable.
std::optional<std::string> register_profiling(
    configure_context& ctx, const project& current,
    const profiling_options& options);

fs::path default_report_directory(const build_model& model);

}  // namespace rigger
