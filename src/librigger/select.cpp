#include "rigger/select.hpp"

#include <re2/re2.h>

#include <algorithm>
#include <cstddef>
#include <memory>
#include <string>

#include "logger.hpp"

namespace rigger {

namespace {

// clang-format off
const RE2 r_process_data_file {R"(gmon\.[0-9].*)"};
// clang-format on

bool has_wildcards(std::string_view pattern) {
  return pattern.find_first_of("*?[") != std::string_view::npos;
}

// Copies the bracket expression starting at GLOB[I] == '[' into RES.
// Returns the index of the closing ']', or npos when there isn't one.
size_t bracket_expression(std::string_view glob, size_t i, std::string& res) {
  size_t j = i + 1;
  bool negate = false;
  if (j < glob.size() && (glob[j] == '!' || glob[j] == '^')) {
    negate = true;
    ++j;
  }
  // A ']' right after the opening bracket is a member, not the end.
  size_t first = j;
  if (j < glob.size() && glob[j] == ']') ++j;
  while (j < glob.size() && glob[j] != ']') ++j;
  if (j >= glob.size()) return std::string_view::npos;

  res += negate ? "[^" : "[";
  for (size_t k = first; k < j; ++k) {
    char c = glob[k];
    if (c == '\\' || c == '[' || c == ']' || (c == '^' && k == first))
      res += '\\';
    res += c;
  }
  res += ']';
  return j;
}

struct pathspec {
  std::string literal;
  std::unique_ptr<RE2> re;

  explicit pathspec(std::string_view pattern) {
    if (has_wildcards(pattern)) {
      re = std::make_unique<RE2>(glob_to_regex(pattern, true));
      if (!re->ok())
        LOG_WARN("Bad pattern '{}': {}", pattern, re->error());
    } else {
      literal = pattern;
      while (literal.size() > 1 && literal.back() == '/') literal.pop_back();
    }
  }

  [[nodiscard]] bool matches(std::string_view path) const {
    if (re) return re->ok() && RE2::FullMatch(path, *re);
    if (literal.empty() || literal == ".") return true;
    return path == literal ||
           (path.starts_with(literal) && path.size() > literal.size() &&
            path[literal.size()] == '/');
  }
};

}  // namespace

std::string glob_to_regex(std::string_view glob, bool match_slash) {
  std::string res;
  for (size_t i = 0; i < glob.size(); ++i) {
    char c = glob[i];
    switch (c) {
      case '*':
        res += match_slash ? ".*" : "[^/]*";
        break;
      case '?':
        res += match_slash ? "." : "[^/]";
        break;
      case '[': {
        auto end = bracket_expression(glob, i, res);
        if (end == std::string_view::npos)
          res += "\\[";
        else
          i = end;
        break;
      }
      case '\\':
        if (i + 1 < glob.size()) c = glob[++i];
        res += RE2::QuoteMeta(std::string_view{&c, 1});
        break;
      default:
        res += RE2::QuoteMeta(std::string_view{&c, 1});
    }
  }
  return res;
}

std::vector<fs::path> select_by_glob(
    const std::vector<fs::path>& listing, std::string_view glob) {
  RE2 re{glob_to_regex(glob)};
  std::vector<fs::path> res;
  for (const auto& p : listing)
    if (RE2::FullMatch(p.filename().string(), re)) res.push_back(p);
  std::ranges::sort(res);
  return res;
}

std::vector<fs::path> select_process_data_files(
    const std::vector<fs::path>& listing) {
  std::vector<fs::path> res;
  for (const auto& p : listing)
    if (RE2::FullMatch(p.filename().string(), r_process_data_file))
      res.push_back(p);
  std::ranges::sort(res);
  return res;
}

bool matches_pathspec(std::string_view path, std::string_view pattern) {
  return pathspec{pattern}.matches(path);
}

std::vector<std::string> filter_by_pathspecs(
    const std::vector<std::string>& paths,
    const std::vector<std::string>& patterns) {
  std::vector<pathspec> specs;
  specs.reserve(patterns.size());
  for (const auto& p : patterns) specs.emplace_back(p);

  std::vector<std::string> res;
  for (const auto& path : paths) {
    if (std::ranges::any_of(
            specs, [&](const pathspec& s) { return s.matches(path); }))
      res.push_back(path);
  }
  return res;
}

std::vector<std::string> split_lines(std::string_view output) {
  std::vector<std::string> res;
  while (!output.empty()) {
    auto nl = output.find('\n');
    auto line = output.substr(0, nl);
    if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
    if (!line.empty()) res.emplace_back(line);
    if (nl == std::string_view::npos) break;
    output.remove_prefix(nl + 1);
  }
  return res;
}

std::vector<std::string> split_nul(std::string_view output) {
  std::vector<std::string> res;
  while (!output.empty()) {
    auto end = output.find('\0');
    auto name = output.substr(0, end);
    if (!name.empty()) res.emplace_back(name);
    if (end == std::string_view::npos) break;
    output.remove_prefix(end + 1);
  }
  return res;
}

std::vector<std::vector<std::string>> batch(
    const std::vector<std::string>& files, std::size_t max_group) {
  std::vector<std::vector<std::string>> res;
  if (max_group == 0) max_group = 1;
  for (size_t i = 0; i < files.size(); i += max_group) {
    auto end = std::min(files.size(), i + max_group);
    res.emplace_back(
        files.begin() + static_cast<std::ptrdiff_t>(i),
        files.begin() + static_cast<std::ptrdiff_t>(end));
  }
  return res;
}

}  // namespace rigger
