#include <doctest/doctest.h>
#include <fmt/format.h>

#include <string>

#include "rigger/action.hpp"
#include "rigger/build_model.hpp"
#include "rigger/configuration.hpp"
#include "rigger/profiling.hpp"
#include "rigger/runner.hpp"
#include "test_support.hpp"

using strings = std::vector<std::string>;
using namespace std::string_literals;

namespace {

bool has_env(
    const rigger::invocation& inv, const std::string& key,
    const std::string& value) {
  for (auto&& [k, v] : inv.environment)
    if (k == key && v == value) return true;
  return false;
}

rigger::action exec_action(
    std::string name, std::string program, std::vector<std::string> deps = {}) {
  rigger::action a{.name = std::move(name), .depends = std::move(deps)};
  a.steps.emplace_back(rigger::exec_step{.program = std::move(program)});
  return a;
}

}  // namespace

TEST_CASE("profile_end_to_end") {
  scratch_dir scratch;
  auto model = sample_model(scratch.path);
  const auto& app = *model.find_target("app");
  write_file(app.artifact, "");

  rigger::configuration config;
  config.set("CODE_PROFILING", "ON");
  config.set("GPROF_EXECUTABLE", "/usr/bin/gprof");
  rigger::action_registry registry;
  rigger::configure_context ctx{model, config, registry};
  REQUIRE(
      rigger::register_profiling(
          ctx, model.projects.front(),
          {.target = "app", .generate_report = true}) == "profile-app");

  auto out = rigger::default_report_directory(model) / "app";
  write_file(out / "stale.txt", "left over");

  fake_runner commands;
  commands.respond = [&](const rigger::invocation& inv) {
    if (inv.program == app.artifact) {
      CHECK(has_env(inv, "GMON_OUT_PREFIX", "gmon"));
      write_file(inv.directory / "gmon.202", "b");
      write_file(inv.directory / "gmon.101", "a");
      return rigger::command_result{};
    }
    rigger::command_result res{
      .output = fmt::format("flat profile of {}\n", inv.args.at(1))};
    if (inv.args.at(1) == "gmon.202")
      res.error = "gprof: gmon.202: some samples fall outside the text";
    return res;
  };

  captured_log log;
  rigger::action_runner runner{registry, commands, &model};
  REQUIRE(runner.run("profile-all") == 0);
  // Profiler warnings reach the log, not the report.
  CHECK(log.contains("some samples fall outside the text"));

  CHECK_FALSE(fs::exists(out / "stale.txt"));
  CHECK(fs::exists(out / "gmon.101"));
  CHECK(fs::exists(out / "gmon.202"));
  CHECK_FALSE(fs::exists(scratch.path / "build" / "gmon.101"));
  CHECK(
      read_file(out / "gmon.txt") ==
      "flat profile of gmon.101\nflat profile of gmon.202\n");

  REQUIRE(commands.calls.size() == 3);
  CHECK(commands.calls[0].directory == scratch.path / "build");
  CHECK_FALSE(commands.calls[0].capture);
  const auto& report = commands.calls[1];
  CHECK(report.program == "/usr/bin/gprof");
  CHECK(report.args == strings{app.artifact.string(), "gmon.101"});
  CHECK(report.directory == out);
  CHECK(report.capture);

  // Already done for this runner.
  CHECK(runner.run("profile-app") == 0);
  CHECK(commands.calls.size() == 3);
}

TEST_CASE("profile_without_process_data") {
  scratch_dir scratch;
  auto model = sample_model(scratch.path);
  write_file(model.find_target("app")->artifact, "");

  rigger::configuration config;
  config.set("CODE_PROFILING", "ON");
  config.set("GPROF_EXECUTABLE", "/usr/bin/gprof");
  rigger::action_registry registry;
  rigger::configure_context ctx{model, config, registry};
  REQUIRE(rigger::register_profiling(
              ctx, model.projects.front(),
              {.target = "app", .generate_report = true})
              .has_value());

  fake_runner commands;
  rigger::action_runner runner{registry, commands, &model};
  CHECK(runner.run("profile-app") == 0);
  CHECK(commands.calls.size() == 1);
  CHECK(
      read_file(
          rigger::default_report_directory(model) / "app" / "gmon.txt") == "");
}

TEST_CASE("profile_needs_built_artifact") {
  scratch_dir scratch;
  auto model = sample_model(scratch.path);
  rigger::configuration config;
  config.set("CODE_PROFILING", "ON");
  config.set("GPROF_EXECUTABLE", "/usr/bin/gprof");
  rigger::action_registry registry;
  rigger::configure_context ctx{model, config, registry};
  REQUIRE(rigger::register_profiling(
              ctx, model.projects.front(), {.target = "app"})
              .has_value());

  fake_runner commands;
  rigger::action_runner runner{registry, commands, &model};
  CHECK(runner.run("profile-all") == rigger::exit_step_failure);
  CHECK(commands.calls.empty());
}

TEST_CASE("exit_codes_propagate") {
  rigger::action_registry registry;
  auto two = exec_action("two-steps", "/bin/first");
  two.steps.emplace_back(rigger::exec_step{.program = "/bin/second"});
  registry.add(std::move(two));

  fake_runner commands;
  commands.respond = [](const rigger::invocation& inv) {
    return rigger::command_result{
      .exit_code = inv.program == "/bin/first" ? 3 : 0};
  };
  rigger::action_runner runner{registry, commands};
  CHECK(runner.run("two-steps") == 3);
  REQUIRE(commands.calls.size() == 1);

  // A failed action is not marked done.
  CHECK(runner.run("two-steps") == 3);
}

TEST_CASE("launch_failure") {
  rigger::action_registry registry;
  registry.add(exec_action("broken", "/nonexistent/program"));

  fake_runner commands;
  commands.respond =
      [](const rigger::invocation& inv) -> rigger::command_result {
    throw rigger::launch_error{"cannot start", inv};
  };
  rigger::action_runner runner{registry, commands};
  CHECK(runner.run("broken") == rigger::exit_launch_failure);
}

TEST_CASE("dependencies_run_first_and_once") {
  rigger::action_registry registry;
  registry.add(exec_action("a", "/bin/a"));
  registry.add(exec_action("b", "/bin/b", {"a"}));
  registry.add(exec_action("c", "/bin/c", {"a", "b"}));

  fake_runner commands;
  rigger::action_runner runner{registry, commands};
  REQUIRE(runner.run("c") == 0);
  REQUIRE(commands.calls.size() == 3);
  CHECK(commands.calls[0].program == "/bin/a");
  CHECK(commands.calls[1].program == "/bin/b");
  CHECK(commands.calls[2].program == "/bin/c");

  CHECK(runner.run("no-such-action") == rigger::exit_step_failure);
}

TEST_CASE("dependency_cycles") {
  rigger::action_registry registry;
  registry.add(exec_action("ping", "/bin/ping"));
  registry.add(exec_action("pong", "/bin/pong"));
  registry.add_dependency("ping", "pong");
  registry.add_dependency("pong", "ping");

  fake_runner commands;
  rigger::action_runner runner{registry, commands};
  CHECK(runner.run("ping") == rigger::exit_step_failure);
  CHECK(commands.calls.empty());
}

TEST_CASE("move_files_without_matches") {
  scratch_dir scratch;
  rigger::action_registry registry;
  rigger::action a{.name = "collect"};
  a.steps.emplace_back(rigger::move_files_step{
    .from = scratch.path, .pattern = "gmon.*", .to = scratch.path / "out"});
  registry.add(std::move(a));

  fake_runner commands;
  rigger::action_runner runner{registry, commands};
  CHECK(runner.run("collect") == 0);
}

TEST_CASE("directory_step_failure") {
  scratch_dir scratch;
  write_file(scratch.path / "file", "");
  rigger::action_registry registry;
  rigger::action a{.name = "mkdir"};
  a.steps.emplace_back(
      rigger::make_directory_step{scratch.path / "file" / "sub"});
  registry.add(std::move(a));

  fake_runner commands;
  rigger::action_runner runner{registry, commands};
  CHECK(runner.run("mkdir") == rigger::exit_step_failure);
}

namespace {

struct format_fixture {
  scratch_dir scratch;
  fs::path src{scratch.path / "src"};
  fake_runner commands;
  rigger::action_registry registry;
  std::string listing{"a.cpp\0lib/b.hpp\0README.md\0gone.cpp\0"s};
  int diff_exit{};

  format_fixture() {
    write_file(src / "a.cpp", "");
    write_file(src / "lib" / "b.hpp", "");
    write_file(src / "README.md", "");

    for (auto files : {rigger::file_set::tracked, rigger::file_set::changed}) {
      rigger::action a{
        .name = files == rigger::file_set::tracked ? "format-all"
                                                   : "format-diff",
        .working_directory = src,
      };
      a.steps.emplace_back(rigger::format_files_step{
        .formatter = "/usr/bin/clang-format",
        .patterns = rigger::default_format_patterns(),
        .files = files,
      });
      registry.add(std::move(a));
    }
    rigger::action check{
      .name = "format-all-check",
      .working_directory = src,
      .depends = {"format-all"},
    };
    check.steps.emplace_back(
        rigger::exec_step{.program = "git", .args = {"diff", "--exit-code"}});
    registry.add(std::move(check));

    commands.respond = [this](const rigger::invocation& inv) {
      rigger::command_result res{};
      if (inv.program != "git") return res;
      const auto& verb = inv.args.at(0);
      if (verb == "ls-files") res.output = listing;
      if (verb == "describe") res.output = "v1.2\n";
      if (verb == "diff" && inv.args.at(1) == "--exit-code")
        res.exit_code = diff_exit;
      else if (verb == "diff")
        res.output = "a.cpp\0README.md\0"s;
      return res;
    };
  }

  strings formatter_args(std::size_t i) {
    REQUIRE(commands.calls.size() > i);
    CHECK(commands.calls[i].program == "/usr/bin/clang-format");
    CHECK(commands.calls[i].directory == src);
    return commands.calls[i].args;
  }
};

}  // namespace

TEST_CASE_FIXTURE(format_fixture, "format_tracked_files") {
  rigger::action_runner runner{registry, commands};
  REQUIRE(runner.run("format-all") == 0);

  REQUIRE(commands.calls.size() == 2);
  CHECK(commands.calls[0].args == strings{"ls-files", "-z"});
  CHECK(commands.calls[0].directory == src);
  CHECK(commands.calls[0].capture);
  CHECK(formatter_args(1) == strings{"-i", "a.cpp", "lib/b.hpp"});
}

TEST_CASE_FIXTURE(format_fixture, "format_names_git_would_quote") {
  write_file(src / "caf\xc3\xa9.cpp", "");
  write_file(src / "tab\tx.cpp", "");
  write_file(src / "with \"quotes\".hpp", "");
  listing = "caf\xc3\xa9.cpp\0tab\tx.cpp\0with \"quotes\".hpp\0a.cpp\0"s;

  rigger::action_runner runner{registry, commands};
  REQUIRE(runner.run("format-all") == 0);
  REQUIRE(commands.calls.size() == 2);
  CHECK(
      formatter_args(1) ==
      strings{
        "-i", "caf\xc3\xa9.cpp", "tab\tx.cpp", "with \"quotes\".hpp",
        "a.cpp"});
}

TEST_CASE_FIXTURE(format_fixture, "format_in_batches") {
  rigger::action_runner runner{registry, commands};
  runner.max_batch = 1;
  REQUIRE(runner.run("format-all") == 0);

  REQUIRE(commands.calls.size() == 3);
  CHECK(formatter_args(1) == strings{"-i", "a.cpp"});
  CHECK(formatter_args(2) == strings{"-i", "lib/b.hpp"});
}

TEST_CASE_FIXTURE(format_fixture, "format_changed_files") {
  rigger::action_runner runner{registry, commands};
  REQUIRE(runner.run("format-diff") == 0);

  REQUIRE(commands.calls.size() == 3);
  CHECK(
      commands.calls[0].args ==
      strings{"describe", "--tags", "--abbrev=0", "--always"});
  CHECK(
      commands.calls[1].args ==
      strings{
        "diff", "-z", "--diff-filter=ACMRTUXB", "--name-only",
        "--relative", "v1.2"});
  CHECK(formatter_args(2) == strings{"-i", "a.cpp"});
}

TEST_CASE_FIXTURE(format_fixture, "nothing_to_format") {
  listing = "README.md\0notes.txt\0"s;
  rigger::action_runner runner{registry, commands};
  CHECK(runner.run("format-all") == 0);
  CHECK(commands.calls.size() == 1);
}

TEST_CASE_FIXTURE(format_fixture, "git_failure_stops_formatting") {
  commands.respond = [](const rigger::invocation&) {
    return rigger::command_result{
      .exit_code = 128, .error = "fatal: not a git repository"};
  };
  rigger::action_runner runner{registry, commands};
  CHECK(runner.run("format-all") == 128);
  CHECK(commands.calls.size() == 1);
}

TEST_CASE_FIXTURE(format_fixture, "format_check") {
  SUBCASE("clean tree") {
    rigger::action_runner runner{registry, commands};
    CHECK(runner.run("format-all-check") == 0);
  }
  SUBCASE("formatting changed something") {
    diff_exit = 1;
    rigger::action_runner runner{registry, commands};
    CHECK(runner.run("format-all-check") == 1);
  }
  // ls-files, the formatter, then the check itself.
  REQUIRE(commands.calls.size() == 3);
  CHECK(commands.calls[2].args == strings{"diff", "--exit-code"});
  CHECK_FALSE(commands.calls[2].capture);
}
