#pragma once

#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace rigger {

enum class subcommand { list, run, flags, memcheck };

struct model_options {
  std::optional<fs::path> model_path{};
  std::vector<std::string> definitions{};
};

struct memcheck_options {
  fs::path input_directory{};
  fs::path output_directory{};
  bool skip_tests{};
};

struct cli_options {
  subcommand command{subcommand::list};
  model_options model{};
  bool json_output{};
  bool verbose{};
  std::vector<std::string> actions{};
  std::string target{};
  memcheck_options memcheck{};
};

std::optional<int> parse_options(
    std::span<char*> args, int& loglevel, cli_options& opts);
}  // namespace rigger
