#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace rigger {

namespace fs = std::filesystem;

/// Steps

struct remove_directory_step {
  fs::path path;
};

struct make_directory_step {
  fs::path path;
};

// Runs PROGRAM in the action's working directory.  ENVIRONMENT is added to
// the inherited environment for this run only.
struct exec_step {
  fs::path program;
  std::vector<std::string> args{};
  std::vector<std::pair<std::string, std::string>> environment{};
};

// Moves every file directly inside FROM whose name matches the glob
// PATTERN into TO.
struct move_files_step {
  fs::path from;
  std::string pattern;
  fs::path to;
};

// Runs PROFILER ARTIFACT FILE for every per-process data file in
// REPORT_DIRECTORY, concatenating the outputs into OUTPUT.
struct profile_report_step {
  fs::path report_directory;
  fs::path profiler;
  fs::path artifact;
  fs::path output;
};

enum class file_set { tracked, changed };

// Runs FORMATTER -i over the git-tracked files (or the files changed since
// the last tag) matching PATTERNS.
struct format_files_step {
  fs::path formatter;
  std::vector<std::string> patterns;
  file_set files{file_set::tracked};
};

using step = std::variant<
    remove_directory_step, make_directory_step, exec_step, move_files_step,
    profile_report_step, format_files_step>;

// Shell-like rendering, for listings and logs.
std::string describe(const step& s);

/// Actions

struct action {
  std::string name;
  std::string comment{};
  fs::path working_directory{};
  std::vector<step> steps{};
  // Build targets that must exist before this runs.
  std::vector<std::string> targets{};
  // Actions run before this one.
  std::vector<std::string> depends{};

  [[nodiscard]] bool is_aggregate() const { return steps.empty(); }
};

class action_registry {
 public:
  // Throws configuration_error when an action with the same name exists.
  void add(action a);
  [[nodiscard]] bool contains(std::string_view name) const;
  [[nodiscard]] const action* find(std::string_view name) const;
  // Throws configuration_error for unknown names.
  [[nodiscard]] const action& at(std::string_view name) const;

  // Makes UMBRELLA depend on CONSTITUENT, once.  Both must exist.
  void add_dependency(std::string_view umbrella, std::string_view constituent);

  // In registration order.
  [[nodiscard]] const std::vector<action>& actions() const { return list; }
  [[nodiscard]] std::size_t size() const { return list.size(); }
  [[nodiscard]] bool empty() const { return list.empty(); }

 private:
  action& at_mutable(std::string_view name);

  std::vector<action> list;
  std::unordered_map<std::string, std::size_t> index;
};

}  // namespace rigger
