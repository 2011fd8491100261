#include "rigger/configuration.hpp"

#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <string>

#include "logger.hpp"
#include "utils.hpp"

namespace rigger {

namespace {

std::string to_upper(std::string_view sv) {
  std::string res{sv};
  std::ranges::transform(res, res.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });
  return res;
}

bool is_executable(const fs::path& p) {
  std::error_code ec;
  return fs::is_regular_file(p, ec) && ::access(p.c_str(), X_OK) == 0;
}

}  // namespace

bool is_notfound(std::string_view value) {
  auto up = to_upper(value);
  return up == "NOTFOUND" || up.ends_with("-NOTFOUND");
}

std::optional<bool> parse_bool(std::string_view value) {
  auto up = to_upper(value);
  if (up == "ON" || up == "YES" || up == "TRUE" || up == "Y") return true;
  if (up.empty() || up == "OFF" || up == "NO" || up == "FALSE" || up == "N" ||
      up == "IGNORE" || is_notfound(up))
    return false;

  double number{};
  auto [ptr, ec] = std::from_chars(up.data(), up.data() + up.size(), number);
  if (ec == std::errc{} && ptr == up.data() + up.size()) return number != 0;
  return std::nullopt;
}

void configuration::set(const std::string& key, std::string value) {
  cache.insert_or_assign(key, std::move(value));
}

void configuration::set_default(const std::string& key, std::string value) {
  cache.try_emplace(key, std::move(value));
}

std::optional<std::string> configuration::get(std::string_view key) const {
  auto probe = cache.find(key);
  if (probe == cache.end()) return std::nullopt;
  return probe->second;
}

bool configuration::contains(std::string_view key) const {
  return cache.contains(key);
}

bool configuration::is_on(std::string_view key, bool default_value) const {
  auto value = get(key);
  if (!value) return default_value;
  auto b = parse_bool(*value);
  if (!b) utils::throwf("Option {} has non-boolean value '{}'", key, *value);
  return *b;
}

bool configuration::option(
    const std::string& key, std::string_view doc, bool default_value) {
  set_default(key, default_value ? "ON" : "OFF");
  auto res = is_on(key);
  LOG_DEBUG("option {}={} ({})", key, res ? "ON" : "OFF", doc);
  return res;
}

std::optional<fs::path> configuration::find_program(
    const std::string& cache_key, const std::vector<std::string>& names) {
  if (auto cached = get(cache_key); cached && !is_notfound(*cached)) {
    LOG_DEBUG("{} cached as {}", cache_key, *cached);
    return fs::path{*cached};
  }

  for (const auto& name : names) {
    fs::path candidate{name};
    if (candidate.is_absolute()) {
      if (is_executable(candidate)) {
        set(cache_key, candidate.string());
        return candidate;
      }
      continue;
    }
    for (const auto& dir : search_path) {
      auto probe = dir / candidate;
      if (is_executable(probe)) {
        LOG_DEBUG("Found {} as {}", name, probe);
        set(cache_key, probe.string());
        return probe;
      }
    }
  }
  set(cache_key, cache_key + "-NOTFOUND");
  return std::nullopt;
}

void configuration::set_from_definition(std::string_view definition) {
  auto eq = definition.find('=');
  if (eq == std::string_view::npos || eq == 0)
    utils::throwf("Malformed definition '{}', expected KEY=VALUE", definition);

  auto key = definition.substr(0, eq);
  if (auto colon = key.find(':'); colon != std::string_view::npos)
    key = key.substr(0, colon);
  if (key.empty())
    utils::throwf("Malformed definition '{}', expected KEY=VALUE", definition);
  set(std::string{key}, std::string{definition.substr(eq + 1)});
}

std::vector<fs::path> path_from_environment() {
  std::vector<fs::path> res;
  const char* path = std::getenv("PATH");  // NOLINT(concurrency-mt-unsafe)
  if (!path) return res;

  std::string_view rest{path};
  while (!rest.empty()) {
    auto colon = rest.find(':');
    auto dir = rest.substr(0, colon);
    if (!dir.empty()) res.emplace_back(dir);
    if (colon == std::string_view::npos) break;
    rest.remove_prefix(colon + 1);
  }
  return res;
}

}  // namespace rigger
