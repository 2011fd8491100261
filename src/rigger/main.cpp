#include <fmt/format.h>
#include <fmt/std.h>

#include <boost/json.hpp>
#include <exception>
#include <iostream>
#include <optional>
#include <span>

#include "../librigger/json_helpers.hpp"
#include "../librigger/logger.hpp"
#include "../librigger/utils.hpp"
#include "options.hpp"
#include "rigger/build_model.hpp"
#include "rigger/command.hpp"
#include "rigger/configuration.hpp"
#include "rigger/configure.hpp"
#include "rigger/errors.hpp"
#include "rigger/memcheck.hpp"
#include "rigger/runner.hpp"

namespace fs = std::filesystem;
namespace json = boost::json;

using rigger::utils::throwf;

// Exit status for configuration errors and unknown action names.
constexpr int exit_configuration_error = 2;

rigger::build_model load_model(
    const rigger::model_options& mopts, rigger::configuration& config) {
  for (const auto& d : mopts.definitions) config.set_from_definition(d);

  fs::path path;
  if (mopts.model_path) {
    path = *mopts.model_path;
  } else {
    auto found = rigger::find_build_model();
    if (!found) throwf("Can't find rigger.json, use --model");
    path = *found;
    LOG_INFO("Detected {}", path);
  }
  return rigger::load_build_model(path, config);
}

void print_list(
    const rigger::action_registry& registry, const rigger::cli_options& opts) {
  if (opts.json_output) {
    json::object res;
    res["actions"] = rigger::registry_to_json(registry, opts.verbose);
    std::cout << json::serialize(res) << "\n";
    return;
  }
  for (const auto& a : registry.actions()) {
    std::cout << a.name;
    if (!a.comment.empty()) std::cout << "  # " << a.comment;
    std::cout << "\n";
    if (!a.depends.empty())
      std::cout << "    depends: " << rigger::utils::join(a.depends) << "\n";
    if (opts.verbose)
      for (const auto& s : a.steps)
        std::cout << "    " << rigger::describe(s) << "\n";
  }
}

int print_flags(
    const rigger::build_model& model, const rigger::cli_options& opts) {
  const auto* t = model.find_target(opts.target);
  if (!t) throwf("Specified target \"{}\" does not exist", opts.target);
  if (opts.json_output) {
    std::cout << json::serialize(rigger::target_to_json(*t)) << "\n";
  } else {
    std::cout << "compile: " << rigger::utils::join(t->compile_options) << "\n";
    std::cout << "link: " << rigger::utils::join(t->link_options) << "\n";
  }
  return 0;
}

int run_actions(
    const rigger::build_model& model, const rigger::action_registry& registry,
    const rigger::cli_options& opts) {
  for (const auto& name : opts.actions) {
    if (!registry.contains(name)) {
      LOG_ERROR("No action named \"{}\"", name);
      return exit_configuration_error;
    }
  }

  rigger::process_runner commands;
  rigger::action_runner runner{registry, commands, &model};
  for (const auto& name : opts.actions)
    if (auto rc = runner.run(name)) return rc;
  return 0;
}

int run_memcheck(const rigger::cli_options& opts) {
  auto summary = rigger::memcheck::convert_directory(
      opts.memcheck.input_directory, opts.memcheck.output_directory,
      opts.memcheck.skip_tests);
  LOG_INFO(
      "Converted {} file(s) into {}, {} unreadable", summary.converted,
      opts.memcheck.output_directory, summary.unreadable);
  return 0;
}

int main(int argc, char* argv[]) {
  rigger::cli_options opts{};
  int loglevel{3};

  auto done = rigger::parse_options(std::span(argv, argc), loglevel, opts);
  if (done) return done.value();

  auto level = rigger::logger::level_from_int(loglevel);
  if (!level) {
    fmt::print(stderr, "Invalid log level {}, expected 0..5\n", loglevel);
    return exit_configuration_error;
  }
  rigger::logger::set_level(*level);
  LOG_DEBUG("loglevel={}", loglevel);

  auto report = [&](const std::exception& e) {
    if (opts.json_output)
      std::cout << json::serialize(rigger::error_to_json(e)) << "\n";
    else
      LOG_FATAL("{}", e.what());
  };

  try {
    if (opts.command == rigger::subcommand::memcheck) return run_memcheck(opts);

    rigger::configuration config{rigger::path_from_environment()};
    auto model = load_model(opts.model, config);
    auto registry = rigger::configure(model, config);

    switch (opts.command) {
      case rigger::subcommand::list:
        print_list(registry, opts);
        return 0;
      case rigger::subcommand::flags:
        return print_flags(model, opts);
      case rigger::subcommand::run:
        return run_actions(model, registry, opts);
      default:
        return 0;
    }
  } catch (const rigger::configuration_error& e) {
    report(e);
    return exit_configuration_error;
  } catch (const std::exception& e) {
    report(e);
    return 1;
  }
}
