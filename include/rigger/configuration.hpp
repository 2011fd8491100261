#pragma once

#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rigger {

namespace fs = std::filesystem;

// CMake truth values: ON/YES/TRUE/Y/non-zero numbers are true,
// OFF/NO/FALSE/N/0/IGNORE/NOTFOUND/empty/*-NOTFOUND are false.  Anything
// else is not a boolean.
std::optional<bool> parse_bool(std::string_view value);

bool is_notfound(std::string_view value);

// Cached configuration values for one configuration pass.  Registrars
// receive it explicitly, nothing here is global.
class configuration {
 public:
  configuration() = default;
  explicit configuration(std::vector<fs::path> search_path)
      : search_path{std::move(search_path)} {}

  void set(const std::string& key, std::string value);
  // Only sets KEY if it has no value yet, like a cache entry.
  void set_default(const std::string& key, std::string value);
  [[nodiscard]] std::optional<std::string> get(std::string_view key) const;
  [[nodiscard]] bool contains(std::string_view key) const;

  // Value of KEY interpreted as a boolean, DEFAULT_VALUE when unset.
  // Throws configuration_error when the value is not a boolean.
  [[nodiscard]] bool is_on(std::string_view key, bool default_value = false)
      const;

  // Declares a boolean option with DEFAULT_VALUE unless it already has a
  // value, then returns its value.
  bool option(
      const std::string& key, std::string_view doc, bool default_value);

  // Finds the first of NAMES that is an executable, trying each name in
  // every directory of the search path before moving on to the next name.
  // The result is cached under CACHE_KEY (KEY-NOTFOUND on failure) and a
  // cached value is returned without searching again.
  std::optional<fs::path> find_program(
      const std::string& cache_key, const std::vector<std::string>& names);

  [[nodiscard]] const std::map<std::string, std::string, std::less<>>&
  entries() const {
    return cache;
  }

  [[nodiscard]] const std::vector<fs::path>& program_search_path() const {
    return search_path;
  }

  // Parses "KEY=VALUE" (also "KEY:TYPE=VALUE", TYPE is ignored).
  void set_from_definition(std::string_view definition);

 private:
  std::map<std::string, std::string, std::less<>> cache;
  std::vector<fs::path> search_path;
};

// Directories of the PATH environment variable, in order.
std::vector<fs::path> path_from_environment();

}  // namespace rigger
