#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace rigger {

namespace fs = std::filesystem;

// Translates a shell glob into an RE2 pattern.  With MATCH_SLASH, '*' and
// '?' also match '/', which is how git treats pathspec wildcards.
std::string glob_to_regex(std::string_view glob, bool match_slash = false);

// Names from LISTING whose filename fully matches GLOB, sorted.
std::vector<fs::path> select_by_glob(
    const std::vector<fs::path>& listing, std::string_view glob);

// Per-process profiler data files: "gmon.<digit>...", sorted by name.
std::vector<fs::path> select_process_data_files(
    const std::vector<fs::path>& listing);

// True when PATH (relative to the project source dir) matches the git
// pathspec PATTERN.  A pattern without wildcards matches the path itself
// and everything below it.
bool matches_pathspec(std::string_view path, std::string_view pattern);

// Paths matching any of PATTERNS, in input order.
std::vector<std::string> filter_by_pathspecs(
    const std::vector<std::string>& paths,
    const std::vector<std::string>& patterns);

// Non-empty lines of OUTPUT, trailing '\r' stripped.
std::vector<std::string> split_lines(std::string_view output);

// Non-empty names of a NUL-separated listing, as "git ls-files -z" prints
// them.  Names come through verbatim, unlike git's quoted line output.
std::vector<std::string> split_nul(std::string_view output);

// Splits FILES into groups of at most MAX_GROUP, as xargs would.
std::vector<std::vector<std::string>> batch(
    const std::vector<std::string>& files, std::size_t max_group);

}  // namespace rigger
