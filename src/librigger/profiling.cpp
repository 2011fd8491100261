#include "rigger/profiling.hpp"

#include <fmt/format.h>
#include <fmt/std.h>

#include <algorithm>
#include <string>
#include <utility>

#include "logger.hpp"
#include "rigger/action.hpp"
#include "rigger/build_model.hpp"
#include "rigger/configuration.hpp"
#include "utils.hpp"

namespace rigger {

namespace {

constexpr std::string_view code_profiling_option = "CODE_PROFILING";
constexpr std::string_view profiler_cache_key = "GPROF_EXECUTABLE";

// Instrumentation relies on GCC's -pg.
bool compiler_supported(const build_model& model) {
  return model.toolchain.compiler_id == "GNU";
}

bool profiling_enabled(configure_context& ctx) {
  return ctx.config.option(
      std::string{code_profiling_option},
      "Builds targets with profiling instrumentation. Currently only works "
      "with GCC Compilers",
      false);
}

void append_once(std::vector<std::string>& opts, const std::string& flag) {
  if (std::ranges::find(opts, flag) == opts.end()) opts.push_back(flag);
}

}  // namespace

std::vector<std::string> instrumentation_flags() { return {"-pg"}; }

fs::path default_report_directory(const build_model& model) {
  return model.root_binary_dir / "profiling" /
         fmt::format("{}-reports", profiling_tool);
}

void instrument_target(configure_context& ctx, const std::string& name) {
  auto* t = ctx.model.find_target(name);
  if (!t) utils::throwf("Specified target \"{}\" does not exist", name);

  if (!(profiling_enabled(ctx) && compiler_supported(ctx.model))) return;

  for (const auto& flag : instrumentation_flags()) {
    append_once(t->compile_options, flag);
    append_once(t->link_options, flag);
  }
  LOG_DEBUG("Instrumented {} for profiling", name);
}

std::optional<std::string> register_profiling(
    configure_context& ctx, const project& current,
    const profiling_options& options) {
  instrument_target(ctx, options.target);

  const auto* t = ctx.model.find_target(options.target);
  if (t->type != target_type::executable)
    utils::throwf(
        "Specified target \"{}\" must be an executable type to register for "
        "profiling with {}",
        options.target, profiling_tool);

  if (!profiling_enabled(ctx)) {
    LOG_DEBUG("Profiling disabled, skipping {}", options.target);
    return std::nullopt;
  }
  if (!compiler_supported(ctx.model)) {
    LOG_WARN(
        "{} needs a GCC compiler, skipping {}", profiling_tool, options.target);
    return std::nullopt;
  }
  auto profiler = ctx.config.find_program(
      std::string{profiler_cache_key}, {std::string{profiling_tool}});
  if (!profiler) {
    LOG_WARN("{} not found, skipping {}", profiling_tool, options.target);
    return std::nullopt;
  }
  if (ctx.model.toolchain.is_cross_compiling()) {
    LOG_DEBUG("Cross compiling, skipping {}", options.target);
    return std::nullopt;
  }

  auto report_folder = options.name.value_or(options.target);
  auto action_name = fmt::format("profile-{}", report_folder);
  auto working_directory =
      options.working_directory.value_or(current.binary_dir);
  auto report_directory =
      options.report_directory.value_or(default_report_directory(ctx.model));
  auto output_dir = report_directory / report_folder;

  action a{
    .name = action_name,
    .comment = fmt::format(
        "{} is running for \"{}\" (output: \"{}\")", profiling_tool,
        options.target, output_dir.string()),
    .working_directory = working_directory,
    .targets = {options.target},
  };
  a.steps.emplace_back(remove_directory_step{output_dir});
  a.steps.emplace_back(make_directory_step{output_dir});
  a.steps.emplace_back(exec_step{
    .program = t->artifact,
    .args = options.program_args,
    .environment = {{std::string{profiler_prefix_variable},
                     std::string{profiler_prefix}}},
  });
  a.steps.emplace_back(move_files_step{
    .from = working_directory,
    .pattern = fmt::format("{}.*", profiler_prefix),
    .to = output_dir,
  });
  if (options.generate_report) {
    a.steps.emplace_back(profile_report_step{
      .report_directory = output_dir,
      .profiler = *profiler,
      .artifact = t->artifact,
      .output = output_dir / profiler_report_file,
    });
  }

  // Checked before anything is defined so a collision leaves no trace.
  if (ctx.registry.contains(action_name))
    utils::throwf("An action named \"{}\" is already defined", action_name);
  if (!ctx.registry.contains(profile_all_action))
    ctx.registry.add(action{
      .name = std::string{profile_all_action},
      .comment = "Runs every profiling action",
    });
  ctx.registry.add(std::move(a));
  ctx.registry.add_dependency(profile_all_action, action_name);

  LOG_INFO("Defined {} for {}", action_name, options.target);
  return action_name;
}

}  // namespace rigger
