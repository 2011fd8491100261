#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "rigger/context.hpp"

namespace rigger {

namespace fs = std::filesystem;

struct formatting_options {
  std::optional<fs::path> script{};
  std::vector<std::string> patterns{};
  std::vector<std::string> formatter_names{};
  bool required{};
};

struct formatting_actions {
  std::string all;
  std::string diff;
};

// '*.[ch]' '*.cpp' '*.cc' '*.hpp'
const std::vector<std::string>& default_format_patterns();

// Newest clang-format first, the unversioned name last.
const std::vector<std::string>& default_formatter_names();

// Conventional locations of a project formatting script, in search order.
std::vector<fs::path> conventional_format_scripts(const fs::path& source_dir);

// Defines "format-all-<project>" and "format-diff-<project>", and for the
// top-level project also "format-all", "format-diff", "format-all-check"
// and "format-diff-check".
//
// Returns nothing when formatting is disabled or no formatter can be found;
// with options.required set those cases throw configuration_error instead.
// An explicit script that does not exist always throws.
std::optional<formatting_actions> register_formatting(
    configure_context& ctx, const project& current,
    const formatting_options& options);

}  // namespace rigger
