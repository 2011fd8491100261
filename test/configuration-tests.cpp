#include <doctest/doctest.h>

#include "rigger/configuration.hpp"
#include "rigger/errors.hpp"
#include "test_support.hpp"

TEST_CASE("truthiness") {
  for (auto v : {"ON", "on", "YES", "True", "y", "1", "42", "-1", "0.5"})
    CHECK(rigger::parse_bool(v) == true);
  for (auto v :
       {"OFF", "no", "FALSE", "n", "0", "0.0", "", "IGNORE", "NOTFOUND",
        "GPROF_EXECUTABLE-NOTFOUND"})
    CHECK(rigger::parse_bool(v) == false);
  CHECK_FALSE(rigger::parse_bool("maybe").has_value());
  CHECK_FALSE(rigger::parse_bool("1abc").has_value());
}

TEST_CASE("option_defaults_and_overrides") {
  rigger::configuration config;
  CHECK_FALSE(config.option("CODE_PROFILING", "doc", false));
  CHECK(config.get("CODE_PROFILING") == "OFF");

  rigger::configuration overridden;
  overridden.set("CODE_PROFILING", "yes");
  CHECK(overridden.option("CODE_PROFILING", "doc", false));
  CHECK(overridden.get("CODE_PROFILING") == "yes");

  CHECK(config.is_on("UNSET", true));
  config.set("WEIRD", "sometimes");
  CHECK_THROWS_AS((void)config.is_on("WEIRD"), rigger::configuration_error);
}

TEST_CASE("set_default_keeps_existing") {
  rigger::configuration config;
  config.set("KEY", "first");
  config.set_default("KEY", "second");
  config.set_default("OTHER", "third");
  CHECK(config.get("KEY") == "first");
  CHECK(config.get("OTHER") == "third");
  CHECK(config.contains("OTHER"));
  CHECK_FALSE(config.contains("MISSING"));
}

TEST_CASE("definitions") {
  rigger::configuration config;
  config.set_from_definition("CODE_PROFILING=ON");
  config.set_from_definition("app_CLANG_FORMAT:FILEPATH=/opt/cf");
  config.set_from_definition("EMPTY=");
  CHECK(config.get("CODE_PROFILING") == "ON");
  CHECK(config.get("app_CLANG_FORMAT") == "/opt/cf");
  CHECK(config.get("EMPTY") == "");

  CHECK_THROWS_AS(
      config.set_from_definition("NOVALUE"), rigger::configuration_error);
  CHECK_THROWS_AS(
      config.set_from_definition("=VALUE"), rigger::configuration_error);
  CHECK_THROWS_AS(
      config.set_from_definition(":BOOL=ON"), rigger::configuration_error);
}

TEST_CASE("find_program_name_priority") {
  scratch_dir scratch;
  auto first = scratch.path / "first";
  auto second = scratch.path / "second";
  make_executable(first / "clang-format");
  make_executable(second / "clang-format-11");

  rigger::configuration config{{first, second}};
  auto found =
      config.find_program("FMT", {"clang-format-11", "clang-format"});
  REQUIRE(found.has_value());
  CHECK(*found == second / "clang-format-11");
  CHECK(config.get("FMT") == (second / "clang-format-11").string());
}

TEST_CASE("find_program_ignores_non_executables") {
  scratch_dir scratch;
  write_file(scratch.path / "gprof", "not a program");
  fs::permissions(scratch.path / "gprof", fs::perms::owner_read);
  fs::create_directories(scratch.path / "dir" / "gprof");

  rigger::configuration config{{scratch.path, scratch.path / "dir"}};
  auto found = config.find_program("GPROF_EXECUTABLE", {"gprof"});
  CHECK_FALSE(found.has_value());
  CHECK(config.get("GPROF_EXECUTABLE") == "GPROF_EXECUTABLE-NOTFOUND");
}

TEST_CASE("find_program_cache") {
  scratch_dir scratch;
  rigger::configuration config{{scratch.path}};

  SUBCASE("a cached value wins") {
    config.set("GPROF_EXECUTABLE", "/somewhere/gprof");
    auto found = config.find_program("GPROF_EXECUTABLE", {"gprof"});
    REQUIRE(found.has_value());
    CHECK(*found == "/somewhere/gprof");
  }

  SUBCASE("NOTFOUND is searched again") {
    auto missing = config.find_program("GPROF_EXECUTABLE", {"gprof"});
    CHECK_FALSE(missing.has_value());
    make_executable(scratch.path / "gprof");
    auto found = config.find_program("GPROF_EXECUTABLE", {"gprof"});
    REQUIRE(found.has_value());
    CHECK(*found == scratch.path / "gprof");
  }

  SUBCASE("absolute names") {
    make_executable(scratch.path / "elsewhere" / "gprof");
    rigger::configuration empty_path;
    auto found = empty_path.find_program(
        "GPROF_EXECUTABLE", {(scratch.path / "elsewhere" / "gprof").string()});
    REQUIRE(found.has_value());
    CHECK(*found == scratch.path / "elsewhere" / "gprof");
  }
}
