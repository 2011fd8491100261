#include "rigger/formatting.hpp"

#include <fmt/format.h>
#include <fmt/std.h>

#include <string>
#include <utility>

#include "logger.hpp"
#include "rigger/action.hpp"
#include "rigger/build_model.hpp"
#include "rigger/configuration.hpp"
#include "utils.hpp"

namespace rigger {

namespace {

constexpr std::string_view global_enable_option = "ENABLE_CLANG_FORMAT";

struct command_pair {
  std::vector<step> all;
  std::vector<step> diff;
};

std::vector<step> script_steps(const fs::path& script, std::string mode) {
  return {exec_step{.program = script, .args = {std::move(mode)}}};
}

command_pair script_commands(const fs::path& script) {
  return {script_steps(script, "all"), script_steps(script, "diff")};
}

void create_format_actions(
    action_registry& registry, const project& current, bool top_level,
    const command_pair& commands) {
  auto make = [&](std::string name, const std::vector<step>& steps) {
    return action{
      .name = std::move(name),
      .working_directory = current.source_dir,
      .steps = steps,
    };
  };

  std::vector<action> defs;
  defs.push_back(
      make(fmt::format("format-all-{}", current.name), commands.all));
  defs.push_back(
      make(fmt::format("format-diff-{}", current.name), commands.diff));

  // Unqualified names get their own copy of the commands, an action that
  // merely depended on the namespaced one would not be the same thing when
  // run on its own.
  if (top_level) {
    defs.push_back(make("format-all", commands.all));
    defs.push_back(make("format-diff", commands.diff));
    for (std::string_view base : {"format-all", "format-diff"}) {
      auto check = make(
          fmt::format("{}-check", base),
          {exec_step{.program = "git", .args = {"diff", "--exit-code"}}});
      check.comment = fmt::format(
          "Fails when {} leaves the working tree modified", base);
      check.depends.emplace_back(base);
      defs.push_back(std::move(check));
    }
  }

  for (const auto& d : defs)
    if (registry.contains(d.name))
      utils::throwf("An action named \"{}\" is already defined", d.name);
  for (auto& d : defs) registry.add(std::move(d));
}

// Logs why formatting is skipped and escalates when it was required.
std::nullopt_t skip(
    const project& current, const formatting_options& options, bool warn,
    const std::string& why) {
  if (warn)
    LOG_WARN("{}", why);
  else
    LOG_INFO("{}", why);
  if (options.required)
    utils::throwf(
        "clang-format support is REQUIRED for {}: {}", current.name, why);
  return std::nullopt;
}

}  // namespace

const std::vector<std::string>& default_format_patterns() {
  static const std::vector<std::string> patterns{
    "*.[ch]", "*.cpp", "*.cc", "*.hpp"};
  return patterns;
}

const std::vector<std::string>& default_formatter_names() {
  // clang-format off
  static const std::vector<std::string> names{
    "clang-format11", "clang-format-11",
    "clang-format60", "clang-format-6.0",
    "clang-format40", "clang-format-4.0",
    "clang-format39", "clang-format-3.9",
    "clang-format38", "clang-format-3.8",
    "clang-format37", "clang-format-3.7",
    "clang-format36", "clang-format-3.6",
    "clang-format35", "clang-format-3.5",
    "clang-format34", "clang-format-3.4",
    "clang-format",
  };
  // clang-format on
  return names;
}

std::vector<fs::path> conventional_format_scripts(const fs::path& source_dir) {
  return {
    source_dir / "scripts" / "clang-format.sh",
    source_dir / "scripts" / "clang-format.bash"};
}

std::optional<formatting_actions> register_formatting(
    configure_context& ctx, const project& current,
    const formatting_options& options) {
  formatting_actions names{
    .all = fmt::format("format-all-{}", current.name),
    .diff = fmt::format("format-diff-{}", current.name)};

  if (!ctx.config.option(
          std::string{global_enable_option},
          "Enable auto-formatting of code using clang-format globally", true))
    return skip(
        current, options, false,
        "auto-formatting is disabled globally");

  bool top_level = ctx.model.is_top_level(current);
  if (!ctx.config.option(
          fmt::format("{}_ENABLE_CLANG_FORMAT", current.name),
          fmt::format(
              "Enable auto-formatting of code using clang-format for project "
              "{}",
              current.name),
          top_level))
    return skip(
        current, options, false,
        fmt::format("{} clang-format support is DISABLED", current.name));

  // An explicit script is a promise, never fall back from it.
  if (options.script) {
    if (!fs::exists(*options.script))
      utils::throwf(
          "Specified clang-format script {} doesn't exist",
          options.script->string());
    LOG_INFO(
        "Initialising clang format targets for {} using existing script in {}",
        current.name, *options.script);
    create_format_actions(
        ctx.registry, current, top_level, script_commands(*options.script));
    return names;
  }

  for (const auto& script : conventional_format_scripts(current.source_dir)) {
    if (fs::exists(script)) {
      LOG_INFO(
          "Initialising clang format target for {} using existing script in "
          "{}",
          current.name, script);
      create_format_actions(
          ctx.registry, current, top_level, script_commands(script));
      return names;
    }
  }

  const auto& candidates = options.formatter_names.empty()
                               ? default_formatter_names()
                               : options.formatter_names;
  auto formatter = ctx.config.find_program(
      fmt::format("{}_CLANG_FORMAT", current.name), candidates);
  if (!formatter)
    return skip(
        current, options, true,
        "Could not find appropriate clang-format, targets disabled");

  LOG_INFO("Using {}", *formatter);
  const auto& patterns =
      options.patterns.empty() ? default_format_patterns() : options.patterns;

  command_pair commands{
    .all = {format_files_step{*formatter, patterns, file_set::tracked}},
    .diff = {format_files_step{*formatter, patterns, file_set::changed}},
  };
  create_format_actions(ctx.registry, current, top_level, commands);
  return names;
}

}  // namespace rigger
