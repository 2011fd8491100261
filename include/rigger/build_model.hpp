#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "rigger/formatting.hpp"
#include "rigger/profiling.hpp"

namespace rigger {

namespace fs = std::filesystem;

enum class target_type {
  executable,
  static_library,
  shared_library,
  module_library,
  object_library,
  interface_library,
  utility,
};

// "EXECUTABLE", "STATIC_LIBRARY", ... as CMake spells them.
std::string_view to_string(target_type type);
std::optional<target_type> target_type_from_string(std::string_view name);

struct target {
  std::string name;
  target_type type{target_type::executable};
  fs::path artifact;
  std::vector<std::string> compile_options{};
  std::vector<std::string> link_options{};
  // Built with profiling instrumentation even when nothing profiles it,
  // so library code shows up in the reports of executables using it.
  bool code_profiling{};
};

struct project {
  std::string name;
  fs::path source_dir;
  fs::path binary_dir;
  std::vector<target> targets{};
  std::vector<profiling_options> profiling{};
  std::optional<formatting_options> formatting{};
};

struct toolchain {
  std::string compiler_id;
  std::string host_arch;
  std::string target_arch;
  bool cross_compiling{};

  [[nodiscard]] bool is_cross_compiling() const {
    return cross_compiling || host_arch != target_arch;
  }
};

struct build_model {
  fs::path root_binary_dir;
  struct toolchain toolchain{};
  std::vector<project> projects{};

  // The first project is the one the build was configured from.
  [[nodiscard]] const project* top_level() const {
    return projects.empty() ? nullptr : &projects.front();
  }
  [[nodiscard]] bool is_top_level(const project& p) const {
    return top_level() == &p;
  }

  // Targets are global to the build, like in CMake.
  target* find_target(std::string_view name);
  const target* find_target(std::string_view name) const;
  project* find_project(std::string_view name);
};

class configuration;

// Reads the model from a JSON file.  Relative paths resolve against the
// directory of the file.  Cache entries of the model are stored in CONFIG
// unless CONFIG already has a value for them (command line wins).
build_model load_build_model(const fs::path& path, configuration& config);

// Same, from JSON text; BASE resolves relative paths.
build_model parse_build_model(
    std::string_view text, const fs::path& base, configuration& config);

std::optional<fs::path> find_build_model();

}  // namespace rigger
