#include "rigger/runner.hpp"

#include <fmt/format.h>
#include <fmt/std.h>

#include <chrono>
#include <fstream>
#include <iterator>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

#include "auto.hpp"
#include "logger.hpp"
#include "rigger/build_model.hpp"
#include "rigger/select.hpp"

namespace rigger {

namespace {

std::vector<fs::path> list_directory(const fs::path& dir) {
  std::vector<fs::path> res;
  for (const auto& entry : fs::directory_iterator{dir})
    if (entry.is_regular_file()) res.push_back(entry.path());
  return res;
}

std::vector<fs::path> list_tree(const fs::path& dir) {
  std::vector<fs::path> res;
  for (const auto& entry : fs::recursive_directory_iterator{dir})
    if (entry.is_regular_file()) res.push_back(entry.path());
  return res;
}

// rename() can't cross filesystems, copy then.
void move_file(const fs::path& from, const fs::path& to) {
  std::error_code ec;
  fs::rename(from, to, ec);
  if (!ec) return;
  if (ec != std::errc::cross_device_link)
    throw fs::filesystem_error{"rename", from, to, ec};
  fs::copy_file(from, to, fs::copy_options::overwrite_existing);
  fs::remove(from);
}

}  // namespace

int action_runner::run(std::string_view name) {
  const auto* a = registry->find(name);
  if (!a) {
    LOG_ERROR("No action named \"{}\"", name);
    return exit_step_failure;
  }
  return run_action(*a);
}

int action_runner::run_action(const action& a) {
  if (done.contains(a.name)) return 0;
  if (running.contains(a.name)) {
    LOG_ERROR("Dependency cycle through \"{}\"", a.name);
    return exit_step_failure;
  }
  running.insert(a.name);
  AUTO(running.erase(a.name));

  for (const auto& dep : a.depends) {
    const auto* d = registry->find(dep);
    if (!d) {
      LOG_ERROR("\"{}\" depends on unknown action \"{}\"", a.name, dep);
      return exit_step_failure;
    }
    if (auto rc = run_action(*d)) return rc;
  }
  if (auto rc = check_targets(a)) return rc;

  if (!a.comment.empty()) LOG_INFO("{}", a.comment);
  auto t0 = std::chrono::steady_clock::now();
  AUTO(LOG_DEBUG(
      "{} took {}ms", a.name,
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - t0)
          .count()));

  for (const auto& s : a.steps) {
    if (auto rc = run_step(a, s)) {
      LOG_ERROR("{} failed with exit code {}", a.name, rc);
      return rc;
    }
  }
  done.insert(a.name);
  return 0;
}

int action_runner::check_targets(const action& a) const {
  if (!model) return 0;
  for (const auto& name : a.targets) {
    const auto* t = model->find_target(name);
    if (!t) {
      LOG_ERROR("{} needs unknown target \"{}\"", a.name, name);
      return exit_step_failure;
    }
    if (t->type == target_type::executable && !fs::exists(t->artifact)) {
      LOG_ERROR(
          "{} needs target \"{}\", build it first (missing {})", a.name,
          name, t->artifact);
      return exit_step_failure;
    }
  }
  return 0;
}

int action_runner::run_step(const action& a, const step& s) {
  LOG_DEBUG("{}: {}", a.name, describe(s));
  try {
    return std::visit(
        [&](auto&& w) -> int {
          using T = std::decay_t<decltype(w)>;
          if constexpr (std::is_same_v<T, remove_directory_step>) {
            return remove_directory(w);
          } else if constexpr (std::is_same_v<T, make_directory_step>) {
            return make_directory(w);
          } else if constexpr (std::is_same_v<T, exec_step>) {
            return exec(a, w);
          } else if constexpr (std::is_same_v<T, move_files_step>) {
            return move_files(w);
          } else if constexpr (std::is_same_v<T, profile_report_step>) {
            return profile_report(a, w);
          } else {
            return format_files(a, w);
          }
        },
        s);
  } catch (const fs::filesystem_error& e) {
    LOG_ERROR("{}: {}", a.name, e.what());
    return exit_step_failure;
  }
}

int action_runner::spawn(const invocation& inv, command_result& result) {
  try {
    result = commands->run(inv);
  } catch (const launch_error& e) {
    LOG_ERROR("{}", e.what());
    return exit_launch_failure;
  }
  if (result.exit_code != 0 && !result.error.empty())
    LOG_ERROR("{} said: {}", inv.program, result.error);
  return result.exit_code;
}

int action_runner::remove_directory(const remove_directory_step& s) {
  fs::remove_all(s.path);
  return 0;
}

int action_runner::make_directory(const make_directory_step& s) {
  fs::create_directories(s.path);
  return 0;
}

int action_runner::exec(const action& a, const exec_step& s) {
  invocation inv{
    .program = s.program,
    .args = s.args,
    .directory = a.working_directory,
    .environment = s.environment,
  };
  command_result res;
  return spawn(inv, res);
}

int action_runner::move_files(const move_files_step& s) {
  auto files = select_by_glob(list_directory(s.from), s.pattern);
  if (files.empty()) {
    LOG_WARN("No files matching {} in {}", s.pattern, s.from);
    return 0;
  }
  fs::create_directories(s.to);
  for (const auto& f : files) {
    LOG_DEBUG("Moving {} to {}", f, s.to);
    move_file(f, s.to / f.filename());
  }
  return 0;
}

// Every per-process data file is attributed to the same artifact, the
// report generator can't tell which process wrote which file.
int action_runner::profile_report(
    const action& a, const profile_report_step& s) {
  auto files = select_process_data_files(list_tree(s.report_directory));

  std::ofstream out{s.output, std::ios::trunc};
  if (!out) {
    LOG_ERROR("{}: cannot write {}", a.name, s.output);
    return exit_step_failure;
  }
  if (files.empty())
    LOG_WARN("No per-process data files in {}", s.report_directory);

  for (const auto& f : files) {
    invocation inv{
      .program = s.profiler,
      .args = {s.artifact.string(), f.filename().string()},
      .directory = f.parent_path(),
      .capture = true,
    };
    command_result res;
    if (auto rc = spawn(inv, res)) return rc;
    if (!res.error.empty())
      LOG_WARN("{} on {}: {}", s.profiler, f.filename(), res.error);
    out << res.output;
  }
  LOG_INFO("Report for {} written to {}", a.name, s.output);
  return 0;
}

int action_runner::format_files(const action& a, const format_files_step& s) {
  auto git = [&](std::vector<std::string> args, command_result& res) {
    return spawn(
        invocation{
          .program = "git",
          .args = std::move(args),
          .directory = a.working_directory,
          .capture = true,
        },
        res);
  };

  command_result listing;
  if (s.files == file_set::tracked) {
    if (auto rc = git({"ls-files", "-z"}, listing)) return rc;
  } else {
    command_result describe_res;
    if (auto rc = git(
            {"describe", "--tags", "--abbrev=0", "--always"}, describe_res))
      return rc;
    auto refs = split_lines(describe_res.output);
    if (refs.empty()) {
      LOG_ERROR("{}: git describe named no reference", a.name);
      return exit_step_failure;
    }
    LOG_DEBUG("Formatting files changed since {}", refs.front());
    if (auto rc = git(
            {"diff", "-z", "--diff-filter=ACMRTUXB", "--name-only",
             "--relative", refs.front()},
            listing))
      return rc;
  }

  std::vector<std::string> files;
  for (auto& f : filter_by_pathspecs(split_nul(listing.output), s.patterns)) {
    if (fs::exists(a.working_directory / f))
      files.push_back(std::move(f));
    else
      LOG_DEBUG("Skipping {}, not in the working tree", f);
  }
  if (files.empty()) {
    LOG_INFO("{}: nothing to format", a.name);
    return 0;
  }

  LOG_INFO("{}: formatting {} file(s)", a.name, files.size());
  for (auto& group : batch(files, max_batch)) {
    std::vector<std::string> args{"-i"};
    args.insert(
        args.end(), std::make_move_iterator(group.begin()),
        std::make_move_iterator(group.end()));
    command_result res;
    if (auto rc = spawn(
            invocation{
              .program = s.formatter,
              .args = std::move(args),
              .directory = a.working_directory,
            },
            res))
      return rc;
  }
  return 0;
}

}  // namespace rigger
