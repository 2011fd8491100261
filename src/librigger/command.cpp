#include "rigger/command.hpp"

#include <fmt/format.h>
#include <fmt/std.h>

#define BOOST_PROCESS_USE_STD_FS 1

#include <boost/asio/buffer.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/readable_pipe.hpp>
#include <boost/process/v2/environment.hpp>
#include <boost/process/v2/process.hpp>
#include <boost/process/v2/start_dir.hpp>
#include <boost/process/v2/stdio.hpp>
#include <boost/system/system_error.hpp>
#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "logger.hpp"

extern char** environ;  // NOLINT

namespace rigger {

namespace p2 = boost::process::v2;
namespace asio = boost::asio;

namespace {

// The inherited environment with INV's variables put on top.
std::vector<std::string> child_environment(const invocation& inv) {
  std::vector<std::string> env;
  for (char** e = environ; e && *e; ++e) {  // NOLINT
    std::string_view entry{*e};
    auto key = entry.substr(0, entry.find('='));
    bool overridden = false;
    for (auto&& [k, v] : inv.environment) overridden |= (k == key);
    if (!overridden) env.emplace_back(entry);
  }
  for (auto&& [k, v] : inv.environment) env.push_back(k + "=" + v);
  return env;
}

fs::path resolve_program(const invocation& inv) {
  if (inv.program.has_parent_path()) {
    if (inv.program.is_absolute() && !fs::exists(inv.program))
      throw launch_error{fmt::format("No such program {}", inv.program), inv};
    return inv.program;
  }
  auto found = p2::environment::find_executable(inv.program.string());
  if (found.empty())
    throw launch_error{
      fmt::format("Cannot find program {} on PATH", inv.program), inv};
  return found;
}

}  // namespace

std::string to_string(const invocation& inv) {
  std::string res;
  for (auto&& [k, v] : inv.environment) res += fmt::format("{}={} ", k, v);
  res += inv.program.string();
  for (const auto& a : inv.args) {
    res += " ";
    res += a;
  }
  return res;
}

command_result process_runner::run(const invocation& inv) {
  auto program = resolve_program(inv);
  auto env = child_environment(inv);
  auto directory =
      inv.directory.empty() ? fs::current_path() : inv.directory;

  LOG_DEBUG("Running {} (in {})", to_string(inv), directory);

  asio::io_context ctx;
  command_result res{};
  try {
    if (inv.capture) {
      asio::readable_pipe rp_out{ctx};
      asio::readable_pipe rp_err{ctx};

      p2::process proc{
        ctx,
        program,
        inv.args,
        p2::process_stdio{.in = nullptr, .out = rp_out, .err = rp_err},
        p2::process_environment{env},
        p2::process_start_dir{directory}};

      // Drain both pipes together so a chatty stderr can't block stdout.
      asio::async_read(
          rp_out, asio::dynamic_buffer(res.output),
          [](const boost::system::error_code&, std::size_t) {});
      asio::async_read(
          rp_err, asio::dynamic_buffer(res.error),
          [](const boost::system::error_code&, std::size_t) {});
      ctx.run();
      res.exit_code = proc.wait();
    } else {
      p2::process proc{
        ctx, program, inv.args, p2::process_environment{env},
        p2::process_start_dir{directory}};
      res.exit_code = proc.wait();
    }
  } catch (const boost::system::system_error& e) {
    throw launch_error{
      fmt::format("Failed to start {}: {}", program, e.what()), inv};
  }

  LOG_DEBUG("{} exited with {}", program, res.exit_code);
  return res;
}

}  // namespace rigger
