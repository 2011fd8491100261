#include "rigger/build_model.hpp"

#include <fmt/format.h>
#include <fmt/std.h>

#include <array>
#include <boost/json.hpp>
#include <boost/system/system_error.hpp>
#include <fstream>
#include <initializer_list>
#include <iterator>
#include <set>
#include <string>
#include <utility>

#include "logger.hpp"
#include "rigger/configuration.hpp"
#include "utils.hpp"

namespace rigger {

namespace json = boost::json;

namespace {

// clang-format off
constexpr std::array<std::pair<target_type, std::string_view>, 7> type_names{{
  {target_type::executable,        "EXECUTABLE"},
  {target_type::static_library,    "STATIC_LIBRARY"},
  {target_type::shared_library,    "SHARED_LIBRARY"},
  {target_type::module_library,    "MODULE_LIBRARY"},
  {target_type::object_library,    "OBJECT_LIBRARY"},
  {target_type::interface_library, "INTERFACE_LIBRARY"},
  {target_type::utility,           "UTILITY"},
}};
// clang-format on

// Every key of OBJ must be one of KNOWN.
void expect_keys(
    const json::object& obj, std::initializer_list<std::string_view> known,
    std::string_view what) {
  for (auto&& [k, v] : obj) {
    bool ok = false;
    for (auto kk : known) ok |= (kk == std::string_view{k});
    if (!ok)
      utils::throwf("Unknown argument \"{}\" in {}", std::string_view{k}, what);
  }
}

const json::object& as_object(const json::value& v, std::string_view what) {
  if (!v.is_object()) utils::throwf("{} must be an object", what);
  return v.as_object();
}

const json::array& as_array(const json::value& v, std::string_view what) {
  if (!v.is_array()) utils::throwf("{} must be an array", what);
  return v.as_array();
}

std::string as_string(const json::value& v, std::string_view what) {
  if (!v.is_string()) utils::throwf("{} must be a string", what);
  return std::string{v.as_string()};
}

std::optional<std::string> get_string(
    const json::object& obj, std::string_view key, std::string_view what) {
  const auto* v = obj.if_contains(key);
  if (!v) return std::nullopt;
  return as_string(*v, fmt::format("{}.{}", what, key));
}

std::vector<std::string> get_strings(
    const json::object& obj, std::string_view key, std::string_view what) {
  std::vector<std::string> res;
  const auto* v = obj.if_contains(key);
  if (!v) return res;
  auto path = fmt::format("{}.{}", what, key);
  for (auto&& e : as_array(*v, path)) res.push_back(as_string(e, path));
  return res;
}

bool get_bool(
    const json::object& obj, std::string_view key, std::string_view what) {
  const auto* v = obj.if_contains(key);
  if (!v) return false;
  if (const auto* b = v->if_bool()) return *b;
  if (v->is_string()) {
    auto b = parse_bool(v->as_string());
    if (b) return *b;
  }
  utils::throwf("{}.{} must be a boolean", what, key);
}

// Cache values are kept as CMake would: strings, booleans as ON/OFF.
std::string cache_value(const json::value& v, std::string_view key) {
  if (const auto* b = v.if_bool()) return *b ? "ON" : "OFF";
  if (v.is_string()) return std::string{v.as_string()};
  if (v.is_number()) return json::serialize(v);
  utils::throwf("cache.{} must be a string, boolean or number", key);
}

fs::path resolve(const fs::path& base, const fs::path& p) {
  if (p.empty() || p.is_absolute()) return p;
  auto res = (base / p).lexically_normal();
  // "dir/." normalizes to "dir/"
  if (!res.has_filename() && res.has_relative_path()) res = res.parent_path();
  return res;
}

profiling_options parse_profiling(
    const json::object& obj, const fs::path& base, std::string_view what) {
  expect_keys(
      obj,
      {"target", "name", "working_directory", "report_directory",
       "program_args", "generate_report"},
      what);

  profiling_options res{};
  auto target = get_string(obj, "target", what);
  if (!target) utils::throwf("{} needs a \"target\"", what);
  res.target = *target;
  res.name = get_string(obj, "name", what);
  if (auto wd = get_string(obj, "working_directory", what))
    res.working_directory = resolve(base, *wd);
  if (auto rd = get_string(obj, "report_directory", what))
    res.report_directory = resolve(base, *rd);
  res.program_args = get_strings(obj, "program_args", what);
  res.generate_report = get_bool(obj, "generate_report", what);
  return res;
}

formatting_options parse_formatting(
    const json::object& obj, const fs::path& base, std::string_view what) {
  expect_keys(obj, {"script", "patterns", "formatter_names", "required"}, what);

  formatting_options res{};
  if (auto script = get_string(obj, "script", what))
    res.script = resolve(base, *script);
  res.patterns = get_strings(obj, "patterns", what);
  res.formatter_names = get_strings(obj, "formatter_names", what);
  res.required = get_bool(obj, "required", what);
  return res;
}

target parse_target(
    const json::object& obj, const fs::path& binary_dir,
    std::string_view what) {
  expect_keys(
      obj,
      {"name", "type", "artifact", "compile_options", "link_options",
       "code_profiling"},
      what);

  target res{};
  auto name = get_string(obj, "name", what);
  if (!name || name->empty()) utils::throwf("{} needs a \"name\"", what);
  res.name = *name;

  auto type = get_string(obj, "type", what).value_or("EXECUTABLE");
  auto t = target_type_from_string(type);
  if (!t) utils::throwf("{} has unknown type \"{}\"", what, type);
  res.type = *t;

  auto artifact = get_string(obj, "artifact", what);
  if (artifact)
    res.artifact = resolve(binary_dir, *artifact);
  else if (res.type == target_type::executable)
    res.artifact = binary_dir / res.name;

  res.compile_options = get_strings(obj, "compile_options", what);
  res.link_options = get_strings(obj, "link_options", what);
  res.code_profiling = get_bool(obj, "code_profiling", what);
  return res;
}

project parse_project(
    const json::object& obj, const fs::path& base, std::string_view what) {
  expect_keys(
      obj,
      {"name", "source_dir", "binary_dir", "targets", "profiling",
       "formatting"},
      what);

  project res{};
  auto name = get_string(obj, "name", what);
  if (!name || name->empty()) utils::throwf("{} needs a \"name\"", what);
  res.name = *name;
  auto where = fmt::format("project \"{}\"", res.name);

  res.source_dir =
      resolve(base, get_string(obj, "source_dir", where).value_or("."));
  res.binary_dir =
      resolve(base, get_string(obj, "binary_dir", where).value_or("."));

  if (const auto* targets = obj.if_contains("targets")) {
    auto path = fmt::format("{} targets", where);
    for (auto&& t : as_array(*targets, path))
      res.targets.push_back(
          parse_target(as_object(t, path), res.binary_dir, path));
  }
  if (const auto* profiling = obj.if_contains("profiling")) {
    auto path = fmt::format("{} profiling", where);
    for (auto&& p : as_array(*profiling, path))
      res.profiling.push_back(
          parse_profiling(as_object(p, path), res.binary_dir, path));
  }
  if (const auto* formatting = obj.if_contains("formatting")) {
    auto path = fmt::format("{} formatting", where);
    res.formatting =
        parse_formatting(as_object(*formatting, path), res.source_dir, path);
  }
  return res;
}

}  // namespace

std::string_view to_string(target_type type) {
  for (auto&& [t, name] : type_names)
    if (t == type) return name;
  return "UNKNOWN";
}

std::optional<target_type> target_type_from_string(std::string_view name) {
  for (auto&& [t, n] : type_names)
    if (n == name) return t;
  return std::nullopt;
}

target* build_model::find_target(std::string_view name) {
  for (auto& p : projects)
    for (auto& t : p.targets)
      if (t.name == name) return &t;
  return nullptr;
}

const target* build_model::find_target(std::string_view name) const {
  for (const auto& p : projects)
    for (const auto& t : p.targets)
      if (t.name == name) return &t;
  return nullptr;
}

project* build_model::find_project(std::string_view name) {
  for (auto& p : projects)
    if (p.name == name) return &p;
  return nullptr;
}

build_model parse_build_model(
    std::string_view text, const fs::path& base, configuration& config) {
  json::value root = [&]() {
    boost::system::error_code ec;
    auto v = json::parse(text, ec);
    if (ec) utils::throwf("Malformed build model: {}", ec.message());
    return v;
  }();

  const auto& obj = as_object(root, "build model");
  expect_keys(
      obj, {"root_binary_dir", "toolchain", "cache", "projects"},
      "build model");

  build_model model{};
  model.root_binary_dir = resolve(
      base, get_string(obj, "root_binary_dir", "build model").value_or("."));

  if (const auto* tc = obj.if_contains("toolchain")) {
    const auto& t = as_object(*tc, "toolchain");
    expect_keys(
        t, {"compiler_id", "host_arch", "target_arch", "cross_compiling"},
        "toolchain");
    model.toolchain.compiler_id =
        get_string(t, "compiler_id", "toolchain").value_or("");
    model.toolchain.host_arch =
        get_string(t, "host_arch", "toolchain").value_or("");
    model.toolchain.target_arch =
        get_string(t, "target_arch", "toolchain")
            .value_or(model.toolchain.host_arch);
    model.toolchain.cross_compiling =
        get_bool(t, "cross_compiling", "toolchain");
  }

  if (const auto* cache = obj.if_contains("cache")) {
    for (auto&& [k, v] : as_object(*cache, "cache"))
      config.set_default(std::string{k}, cache_value(v, k));
  }

  std::set<std::string, std::less<>> project_names;
  std::set<std::string, std::less<>> target_names;
  if (const auto* projects = obj.if_contains("projects")) {
    for (auto&& p : as_array(*projects, "projects")) {
      auto proj = parse_project(as_object(p, "projects"), base, "projects");
      if (!project_names.insert(proj.name).second)
        utils::throwf("Project \"{}\" is defined twice", proj.name);
      for (const auto& t : proj.targets)
        if (!target_names.insert(t.name).second)
          utils::throwf("Target \"{}\" is defined twice", t.name);
      model.projects.push_back(std::move(proj));
    }
  }
  if (model.projects.empty()) utils::throwf("Build model has no projects");

  LOG_DEBUG(
      "Loaded {} project(s), top level is {}", model.projects.size(),
      model.top_level()->name);
  return model;
}

build_model load_build_model(const fs::path& path, configuration& config) {
  std::ifstream file(path);
  if (!file) utils::throwf("Could not open build model at {}", path.string());

  std::string content(
      (std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
  auto base = fs::absolute(path).parent_path();
  return parse_build_model(content, base, config);
}

std::optional<fs::path> find_build_model() {
  auto probe = fs::current_path() / "rigger.json";
  if (fs::exists(probe)) return probe;
  return std::nullopt;
}

}  // namespace rigger
