#include "options.hpp"

#include <CLI/CLI.hpp>
#include <optional>

namespace rigger {

std::optional<int> parse_options(
    std::span<char*> args, int& loglevel, cli_options& opts) {
  CLI::App app{"Profiling and formatting actions for a configured build"};

  app.add_option("-d,--debug", loglevel, "Debug log level (3=INFO)")
      ->capture_default_str();
  app.add_option(
         "-m,--model", opts.model.model_path,
         "Build model to configure (default: ./rigger.json)")
      ->check(CLI::ExistingFile);
  app.add_option(
      "-D,--define", opts.model.definitions,
      "Set a cache entry, KEY=VALUE (repeatable)");
  app.add_flag("--json", opts.json_output, "Output results in JSON format")
      ->capture_default_str();
  app.require_subcommand(1);
  // Global options are also accepted after the subcommand.
  app.fallthrough();

  auto* list = app.add_subcommand("list", "List the defined actions");
  list->add_flag("-v,--verbose", opts.verbose, "Also list every step");

  auto* run = app.add_subcommand("run", "Run actions by name");
  run->add_option("actions", opts.actions, "Actions to run, in order")
      ->required();

  auto* flags = app.add_subcommand(
      "flags", "Print the compile and link options of a target");
  flags->add_option("target", opts.target, "Target name")->required();

  auto* memcheck = app.add_subcommand(
      "memcheck", "Convert Valgrind Memcheck XML files to JUnit XML");
  memcheck
      ->add_option(
          "-i,--input_directory", opts.memcheck.input_directory,
          "Directory where Valgrind Memcheck xml files are located")
      ->required()
      ->check(CLI::ExistingDirectory);
  memcheck
      ->add_option(
          "-o,--output_directory", opts.memcheck.output_directory,
          "Directory where the converted JUnit xml files are collected")
      ->required();
  memcheck->add_flag(
      "-s,--skip_tests", opts.memcheck.skip_tests,
      "Report Memcheck errors as skipped tests instead of errors");

  try {
    (app).parse(static_cast<int>(args.size()), args.data());
  } catch (const CLI::ParseError& e) {
    return (app).exit(e);
  };

  if (list->parsed())
    opts.command = subcommand::list;
  else if (run->parsed())
    opts.command = subcommand::run;
  else if (flags->parsed())
    opts.command = subcommand::flags;
  else
    opts.command = subcommand::memcheck;

  return std::nullopt;
}

}  // namespace rigger
