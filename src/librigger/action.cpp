#include "rigger/action.hpp"

#include <fmt/format.h>
#include <fmt/std.h>

#include <algorithm>
#include <string>
#include <type_traits>

#include "logger.hpp"
#include "utils.hpp"

namespace rigger {

std::string describe(const step& s) {
  return std::visit(
      [](auto&& w) -> std::string {
        using T = std::decay_t<decltype(w)>;
        if constexpr (std::is_same_v<T, remove_directory_step>) {
          return fmt::format("rm -rf {}", w.path.string());
        } else if constexpr (std::is_same_v<T, make_directory_step>) {
          return fmt::format("mkdir -p {}", w.path.string());
        } else if constexpr (std::is_same_v<T, exec_step>) {
          std::string res;
          for (auto&& [k, v] : w.environment)
            res += fmt::format("{}={} ", k, v);
          res += w.program.string();
          if (!w.args.empty()) res += " " + utils::join(w.args);
          return res;
        } else if constexpr (std::is_same_v<T, move_files_step>) {
          return fmt::format(
              "mv {}/{} {}", w.from.string(), w.pattern, w.to.string());
        } else if constexpr (std::is_same_v<T, profile_report_step>) {
          return fmt::format(
              "{} {} <each per-process file in {}> > {}", w.profiler.string(),
              w.artifact.string(), w.report_directory.string(),
              w.output.string());
        } else {
          auto listing = w.files == file_set::tracked
                             ? std::string{"git ls-files -z"}
                             : std::string{
                                   "git diff -z --diff-filter=ACMRTUXB "
                                   "--name-only --relative "
                                   "$(git describe --tags --abbrev=0 "
                                   "--always)"};
          return fmt::format(
              "{} -- {} | xargs -0 {} -i", listing, utils::join(w.patterns),
              w.formatter.string());
        }
      },
      s);
}

void action_registry::add(action a) {
  if (contains(a.name))
    utils::throwf("An action named \"{}\" is already defined", a.name);
  LOG_DEBUG("Defining action {}", a.name);
  index.emplace(a.name, list.size());
  list.push_back(std::move(a));
}

bool action_registry::contains(std::string_view name) const {
  return index.contains(std::string{name});
}

const action* action_registry::find(std::string_view name) const {
  auto probe = index.find(std::string{name});
  if (probe == index.end()) return nullptr;
  return &list[probe->second];
}

const action& action_registry::at(std::string_view name) const {
  const auto* a = find(name);
  if (!a) utils::throwf("No action named \"{}\"", name);
  return *a;
}

action& action_registry::at_mutable(std::string_view name) {
  auto probe = index.find(std::string{name});
  if (probe == index.end()) utils::throwf("No action named \"{}\"", name);
  return list[probe->second];
}

void action_registry::add_dependency(
    std::string_view umbrella, std::string_view constituent) {
  if (!contains(constituent))
    utils::throwf("No action named \"{}\"", constituent);
  if (umbrella == constituent)
    utils::throwf("Action \"{}\" cannot depend on itself", umbrella);
  auto& u = at_mutable(umbrella);
  if (std::ranges::find(u.depends, constituent) == u.depends.end())
    u.depends.emplace_back(constituent);
}

}  // namespace rigger
