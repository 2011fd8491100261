#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <boost/json.hpp>
#include <string>

#include "json_helpers.hpp"
#include "rigger/build_model.hpp"
#include "rigger/configuration.hpp"
#include "rigger/configure.hpp"
#include "rigger/errors.hpp"
#include "test_support.hpp"

namespace json = boost::json;

// Whole configuration passes, from model text to the action list.

namespace {

std::string two_projects_model(const fs::path& root) {
  json::object model{
    {"root_binary_dir", (root / "build").string()},
    {"toolchain", {{"compiler_id", "GNU"}, {"host_arch", "x86_64"}}},
    {"cache",
     {{"CODE_PROFILING", true}, {"GPROF_EXECUTABLE", "/usr/bin/gprof"}}},
  };
  json::array projects;
  projects.push_back(json::object{
    {"name", "app"},
    {"source_dir", (root / "app").string()},
    {"binary_dir", (root / "build").string()},
    {"targets",
     json::array{
       json::object{{"name", "unit-tests"}},
       json::object{
         {"name", "core"},
         {"type", "STATIC_LIBRARY"},
         {"code_profiling", true}},
       json::object{{"name", "util"}, {"type", "STATIC_LIBRARY"}}}},
    {"profiling",
     json::array{json::object{
       {"target", "unit-tests"}, {"generate_report", true}}}},
    {"formatting", json::object{}},
  });
  projects.push_back(json::object{
    {"name", "vendor"},
    {"source_dir", (root / "vendor").string()},
    {"binary_dir", (root / "build" / "vendor").string()},
    {"formatting", json::object{}},
  });
  model["projects"] = std::move(projects);
  return json::serialize(model);
}

}  // namespace

TEST_CASE("configure_two_projects") {
  scratch_dir scratch;
  write_file(scratch.path / "app" / "scripts" / "clang-format.sh", "");
  write_file(scratch.path / "vendor" / "scripts" / "clang-format.sh", "");

  rigger::configuration config;
  auto model = rigger::parse_build_model(
      two_projects_model(scratch.path), scratch.path, config);
  auto registry = rigger::configure(model, config);

  CHECK(registry.contains("profile-unit-tests"));
  CHECK(registry.contains("profile-all"));
  CHECK(registry.contains("format-all-app"));
  CHECK(registry.contains("format-all"));
  CHECK(registry.contains("format-diff-check"));
  // Nested projects must opt in.
  CHECK_FALSE(registry.contains("format-all-vendor"));

  const auto* t = model.find_target("unit-tests");
  REQUIRE(t != nullptr);
  CHECK(t->compile_options == std::vector<std::string>{"-pg"});
}

TEST_CASE("configure_instruments_marked_libraries") {
  scratch_dir scratch;
  rigger::configuration config;
  auto model = rigger::parse_build_model(
      two_projects_model(scratch.path), scratch.path, config);
  (void)rigger::configure(model, config);

  const auto* core = model.find_target("core");
  REQUIRE(core != nullptr);
  CHECK(core->code_profiling);
  CHECK(core->compile_options == std::vector<std::string>{"-pg"});
  CHECK(core->link_options == std::vector<std::string>{"-pg"});
  // Only marked targets.
  CHECK(model.find_target("util")->compile_options.empty());

  SUBCASE("not without the option") {
    rigger::configuration off;
    off.set("CODE_PROFILING", "OFF");
    auto plain = rigger::parse_build_model(
        two_projects_model(scratch.path), scratch.path, off);
    (void)rigger::configure(plain, off);
    CHECK(plain.find_target("core")->compile_options.empty());
  }
}

TEST_CASE("configure_nested_project_opt_in") {
  scratch_dir scratch;
  write_file(scratch.path / "app" / "scripts" / "clang-format.sh", "");
  write_file(scratch.path / "vendor" / "scripts" / "clang-format.sh", "");

  rigger::configuration config;
  config.set("vendor_ENABLE_CLANG_FORMAT", "ON");
  auto model = rigger::parse_build_model(
      two_projects_model(scratch.path), scratch.path, config);
  auto registry = rigger::configure(model, config);

  CHECK(registry.contains("format-all-vendor"));
  CHECK(registry.contains("format-diff-vendor"));
  // Unqualified names still belong to the top level.
  const auto& all = registry.at("format-all");
  CHECK(all.working_directory == scratch.path / "app");
}

TEST_CASE("configure_fatal_error_aborts") {
  scratch_dir scratch;
  rigger::configuration config;
  auto text = two_projects_model(scratch.path);
  auto model = rigger::parse_build_model(text, scratch.path, config);
  model.projects.front().formatting->script = scratch.path / "nope.sh";
  CHECK_THROWS_AS(
      (void)rigger::configure(model, config), rigger::configuration_error);
}

TEST_CASE("json_listing") {
  scratch_dir scratch;
  write_file(scratch.path / "app" / "scripts" / "clang-format.sh", "");

  rigger::configuration config;
  auto model = rigger::parse_build_model(
      two_projects_model(scratch.path), scratch.path, config);
  auto registry = rigger::configure(model, config);

  auto listing = rigger::registry_to_json(registry, true);
  REQUIRE(listing.size() == registry.size());
  const auto& first = listing.at(0).as_object();
  CHECK(first.at("name").as_string() == "profile-all");
  CHECK(first.at("depends").as_array().size() == 1);
  CHECK(first.at("steps").as_array().empty());

  const auto& profile = listing.at(1).as_object();
  CHECK(profile.at("name").as_string() == "profile-unit-tests");
  CHECK(profile.at("steps").as_array().size() == 5);
}

TEST_CASE("json_error_report") {
  rigger::configuration_error e{"Specified target \"x\" does not exist"};
  auto obj = rigger::error_to_json(e);
  CHECK(obj.at("error").as_string() == "rigger::configuration_error");
  CHECK(obj.at("details").as_string() == e.what());
}
