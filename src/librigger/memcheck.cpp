#include "rigger/memcheck.hpp"

#include <fmt/format.h>
#include <fmt/std.h>

#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/xml_parser.hpp>
#include <fstream>
#include <system_error>
#include <string>
#include <string_view>

#include "logger.hpp"

namespace rigger::memcheck {

namespace pt = boost::property_tree;

namespace {

std::string escape(std::string_view text) {
  std::string res;
  res.reserve(text.size());
  for (char c : text) {
    // clang-format off
    switch (c) {
    case '&':  res += "&amp;";  break;
    case '<':  res += "&lt;";   break;
    case '>':  res += "&gt;";   break;
    case '"':  res += "&quot;"; break;
    default:   res += c;
    }
    // clang-format on
  }
  return res;
}

std::optional<std::string> child_text(
    const pt::ptree& node, const std::string& path) {
  if (auto v = node.get_optional<std::string>(path)) return *v;
  return std::nullopt;
}

error parse_error(const pt::ptree& node) {
  error res{};
  res.kind = node.get<std::string>("kind", "");
  res.what = child_text(node, "what")
                 .value_or(node.get<std::string>("xwhat.text", ""));
  if (auto stack = node.get_child_optional("stack")) {
    for (auto&& [name, f] : *stack) {
      if (name != "frame") continue;
      res.stack.push_back(frame{
        .ip = f.get<std::string>("ip", ""),
        .fn = child_text(f, "fn"),
        .file = child_text(f, "file"),
        .line = child_text(f, "line"),
      });
    }
  }
  return res;
}

void collect_errors(const pt::ptree& node, std::vector<error>& out) {
  for (auto&& [name, child] : node) {
    if (name == "error")
      out.push_back(parse_error(child));
    else if (name != "<xmlattr>" && name != "<xmlcomment>")
      collect_errors(child, out);
  }
}

const frame* first_located_frame(const error& e) {
  for (const auto& f : e.stack)
    if (f.file && f.line) return &f;
  return nullptr;
}

}  // namespace

std::vector<error> read_errors(const fs::path& path) {
  pt::ptree doc;
  pt::read_xml(path.string(), doc);
  std::vector<error> res;
  collect_errors(doc, res);
  return res;
}

std::string to_junit(
    const std::string& name, const std::vector<error>& errors, bool skip) {
  std::string_view type = skip ? "skipped" : "error";
  std::string_view counter = skip ? "skipped" : "errors";
  auto ename = escape(name);

  std::string out = "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
  if (errors.empty()) {
    out += fmt::format(
        "<testsuite name=\"valgrind\" tests=\"1\" {}=\"0\">\n", counter);
    out += fmt::format(
        "    <testcase classname=\"valgrind-memcheck\" name=\"{}\"/>\n", ename);
    out += "</testsuite>\n";
    return out;
  }

  out += fmt::format(
      "<testsuite name=\"valgrind\" tests=\"{}\" {}=\"{}\">\n", errors.size(),
      counter, errors.size());
  size_t n = 0;
  for (const auto& e : errors) {
    ++n;
    auto kind = escape(e.kind);
    if (const auto* loc = first_located_frame(e))
      out += fmt::format(
          "    <testcase classname=\"valgrind-memcheck\" name=\"{} {} ({}, "
          "{}:{})\">\n",
          ename, n, kind, escape(*loc->file), escape(*loc->line));
    else
      out += fmt::format(
          "    <testcase classname=\"valgrind-memcheck\" name=\"{} {} "
          "({})\">\n",
          ename, n, kind);

    out += fmt::format("        <{} type=\"{}\">\n", type, kind);
    out += fmt::format("  {}\n\n", escape(e.what));
    for (const auto& f : e.stack) {
      auto fn = escape(f.fn.value_or("unknown function name"));
      if (f.file && f.line)
        out += fmt::format(
            "  {}: {} ({}:{})\n", escape(f.ip), fn, escape(*f.file),
            escape(*f.line));
      else
        out += fmt::format("  {}: {}\n", escape(f.ip), fn);
    }
    out += fmt::format("        </{}>\n", type);
    out += "    </testcase>\n";
  }
  out += "</testsuite>\n";
  return out;
}

conversion_summary convert_directory(
    const fs::path& input, const fs::path& output, bool skip) {
  fs::create_directories(output);
  auto output_name = fs::absolute(output).lexically_normal();
  if (!output_name.has_filename()) output_name = output_name.parent_path();
  output_name = output_name.filename();

  conversion_summary summary{};
  for (auto it = fs::recursive_directory_iterator{input};
       it != fs::recursive_directory_iterator{}; ++it) {
    if (it->is_directory()) {
      if (it->path().filename() == output_name) it.disable_recursion_pending();
      continue;
    }
    auto filename = it->path().filename().string();
    if (!it->is_regular_file() || filename.find("xml") == std::string::npos)
      continue;

    std::vector<error> errors;
    try {
      errors = read_errors(it->path());
    } catch (const pt::xml_parser_error& e) {
      LOG_WARN("Skipping {}: {}", it->path(), e.what());
      ++summary.unreadable;
      continue;
    }

    auto target = output / filename;
    if (!filename.ends_with(".xml")) target += ".xml";
    std::ofstream out{target, std::ios::trunc};
    if (!out)
      throw fs::filesystem_error{
        "cannot write", target, std::make_error_code(std::errc::io_error)};
    out << to_junit(filename, errors, skip);
    LOG_DEBUG("{}: {} error(s) -> {}", it->path(), errors.size(), target);
    ++summary.converted;
  }
  return summary;
}

}  // namespace rigger::memcheck
