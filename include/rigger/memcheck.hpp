#pragma once

/**
 * @file memcheck.hpp
 * @brief Valgrind Memcheck XML to JUnit XML conversion.
 *
 * CI servers display JUnit results but not Memcheck's own XML.  Each
 * Memcheck file becomes one @c testsuite named @c "valgrind": a single
 * passing test case when Memcheck reported nothing, otherwise one failing
 * (or skipped) test case per reported @c error element.
 */

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace rigger::memcheck {

namespace fs = std::filesystem;

struct frame {
  std::string ip;
  std::optional<std::string> fn{};
  std::optional<std::string> file{};
  std::optional<std::string> line{};
};

struct error {
  std::string kind;
  std::string what;
  std::vector<frame> stack{};
};

/** @brief Every @c error element of a Memcheck XML document, in order.
 *
 * Errors are searched at any depth.  Throws std::runtime_error when
 * @p path is not well-formed XML.
 */
std::vector<error> read_errors(const fs::path& path);

/** @brief Renders the JUnit document for the errors of @p name.
 *
 * With @p skip set, errors become @c skipped elements instead of @c error
 * elements.
 */
std::string to_junit(
    const std::string& name, const std::vector<error>& errors, bool skip);

struct conversion_summary {
  std::size_t converted{};
  std::size_t unreadable{};
};

/** @brief Converts every Memcheck file below @p input into @p output.
 *
 * Files qualify when their name contains "xml".  Directories named like
 * @p output are not descended into.  Unreadable files are skipped.
 */
conversion_summary convert_directory(
    const fs::path& input, const fs::path& output, bool skip);

}  // namespace rigger::memcheck
