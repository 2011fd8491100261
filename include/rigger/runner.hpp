#pragma once

#include <cstddef>
#include <set>
#include <string>
#include <string_view>

#include "rigger/action.hpp"
#include "rigger/command.hpp"

namespace rigger {

struct build_model;

// Exit code used when a program can't be started, as a shell would.
inline constexpr int exit_launch_failure = 127;
// Exit code of a built-in step (directories, moves, reports) that failed.
inline constexpr int exit_step_failure = 1;

// Runs actions of a configured registry.  Dependencies run first, each at
// most once per runner; a failing step stops everything and its exit code
// is returned.
class action_runner {
 public:
  action_runner(
      const action_registry& registry, command_runner& commands,
      const build_model* model = nullptr)
      : registry{&registry}, commands{&commands}, model{model} {}

  // Files handed to a single formatter run.
  std::size_t max_batch{128};

  int run(std::string_view name);

 private:
  int run_action(const action& a);
  int run_step(const action& a, const step& s);
  int check_targets(const action& a) const;

  int remove_directory(const remove_directory_step& s);
  int make_directory(const make_directory_step& s);
  int exec(const action& a, const exec_step& s);
  int move_files(const move_files_step& s);
  int profile_report(const action& a, const profile_report_step& s);
  int format_files(const action& a, const format_files_step& s);

  // Runs INV, logs and converts failures to exit codes.  Output of
  // captured runs is left in RESULT.
  int spawn(const invocation& inv, command_result& result);

  const action_registry* registry;
  command_runner* commands;
  const build_model* model;
  std::set<std::string, std::less<>> done;
  std::set<std::string, std::less<>> running;
};

}  // namespace rigger
