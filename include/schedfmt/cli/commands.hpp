#pragma once

#include <cstddef>
#include <filesystem>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include <CLI/CLI.hpp>

#include "schedfmt/core/config.hpp"
#include "schedfmt/core/error.hpp"

namespace schedfmt::cli {

/// Register the `parse` subcommand.
/// Parses one schedule and prints its structure as JSON.
void register_parse_command(CLI::App& app, Config& config);

/// Register the `check` subcommand.
/// Validates schedules given as arguments or read from a file.
void register_check_command(CLI::App& app, Config& config);

/// Register the `bounds` subcommand.
/// Prints the permitted range of every schedule field.
void register_bounds_command(CLI::App& app, Config& config);

/// Register the `version` subcommand.
void register_version_command(CLI::App& app);

/// Parse `schedule` and write its JSON form to `out`, or the error to `err`.
/// @returns 0 on success, 1 on a parse error.
auto run_parse(std::string_view schedule, const Config& config,
               std::ostream& out, std::ostream& err) -> int;

/// Check every schedule, writing one `OK` or `ERROR` line each to `out`.
/// Empty lines and lines starting with '#' are skipped. Schedules are
/// parsed exactly as given, so surrounding whitespace is an error.
/// @returns Number of invalid schedules.
auto run_check(const std::vector<std::string>& schedules, const Config& config,
               std::ostream& out) -> std::size_t;

/// Read a schedule file for `check`, trimming each line so that
/// indentation and CRLF endings are accepted.
auto load_schedule_file(const std::filesystem::path& path) -> Result<std::vector<std::string>>;

/// JSON array describing the field bounds table.
auto bounds_json() -> json;

} // namespace schedfmt::cli
