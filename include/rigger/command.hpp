#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace rigger {

namespace fs = std::filesystem;

struct invocation {
  fs::path program;
  std::vector<std::string> args{};
  fs::path directory{};
  std::vector<std::pair<std::string, std::string>> environment{};
  // Collect stdout and stderr instead of passing them through.
  bool capture{};
};

struct command_result {
  int exit_code{};
  std::string output{};
  std::string error{};
};

// The program could not be started at all.
struct launch_error : std::runtime_error {
  launch_error(const std::string& desc, invocation i)
      : std::runtime_error{desc}, inv{std::move(i)} {}
  invocation inv;
};

std::string to_string(const invocation& inv);

// Seam between orchestration and the outside world.  Tests substitute a
// fake that records invocations and answers with canned results.
class command_runner {
 public:
  command_runner() = default;
  command_runner(const command_runner&) = delete;
  command_runner(command_runner&&) = delete;
  command_runner& operator=(const command_runner&) = delete;
  command_runner& operator=(command_runner&&) = delete;
  virtual ~command_runner() = default;

  // Waits for the child to exit.  Throws launch_error when it can't start.
  virtual command_result run(const invocation& inv) = 0;
};

// Runs children with Boost.Process.
class process_runner final : public command_runner {
 public:
  command_result run(const invocation& inv) override;
};

}  // namespace rigger
