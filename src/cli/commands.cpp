#include "schedfmt/cli/commands.hpp"
#include "schedfmt/core/logger.hpp"
#include "schedfmt/core/utils.hpp"
#include "schedfmt/schedule/bounds.hpp"
#include "schedfmt/schedule/parser.hpp"

#include <iostream>
#include <memory>

// Version string; typically injected by CMake via -DSCHEDFMT_VERSION_STRING=...
#ifndef SCHEDFMT_VERSION_STRING
#define SCHEDFMT_VERSION_STRING "0.1.0-dev"
#endif

namespace schedfmt::cli {

namespace {

void print_error(std::ostream& err, std::string_view schedule, const Error& error,
                 const Config& config) {
    err << "error [" << error_code_to_string(error.code()) << "]: " << error.what() << "\n";
    if (config.show_error_location) {
        auto location = schedule::format_error_location(schedule, error);
        if (!location.empty()) {
            err << location << "\n";
        }
    }
}

} // anonymous namespace

auto run_parse(std::string_view schedule, const Config& config,
               std::ostream& out, std::ostream& err) -> int {
    auto result = schedule::parse_schedule(schedule);
    if (!result) {
        LOG_DEBUG("Rejected schedule '{}': {}", schedule, result.error().what());
        print_error(err, schedule, result.error(), config);
        return 1;
    }

    json j = *result;
    out << j.dump(config.json_indent) << "\n";
    return 0;
}

auto run_check(const std::vector<std::string>& schedules, const Config& config,
               std::ostream& out) -> std::size_t {
    std::size_t failures = 0;

    for (const auto& line : schedules) {
        if (line.empty() || utils::starts_with(line, "#")) continue;

        auto result = schedule::parse_schedule(line);
        if (result) {
            out << "OK    " << line << "\n";
            continue;
        }

        ++failures;
        out << "ERROR " << line << ": " << result.error().what() << "\n";
        if (config.stop_on_first_error) {
            LOG_INFO("Stopping at first invalid schedule");
            break;
        }
    }

    LOG_DEBUG("Checked {} schedule line(s), {} invalid", schedules.size(), failures);
    return failures;
}

auto load_schedule_file(const std::filesystem::path& path) -> Result<std::vector<std::string>> {
    auto lines = utils::read_lines(path);
    if (!lines) return std::unexpected(lines.error());

    for (auto& line : *lines) {
        line = utils::trim(line);
    }
    return lines;
}

auto bounds_json() -> json {
    json j = json::array();
    for (const auto& bounds : schedule::kFieldBounds) {
        j.push_back(bounds);
    }
    return j;
}

// ---------------------------------------------------------------------------
// parse command
// ---------------------------------------------------------------------------

void register_parse_command(CLI::App& app, Config& config) {
    auto* sub = app.add_subcommand("parse", "Parse a schedule and print it as JSON");

    auto schedule = std::make_shared<std::string>();
    sub->add_option("schedule", *schedule, "Schedule, e.g. \"2023.05.15 3 10:20:30.500\"")
        ->required();

    sub->callback([&config, schedule]() {
        if (run_parse(*schedule, config, std::cout, std::cerr) != 0) {
            throw CLI::RuntimeError(1);
        }
    });
}

// ---------------------------------------------------------------------------
// check command
// ---------------------------------------------------------------------------

void register_check_command(CLI::App& app, Config& config) {
    auto* sub = app.add_subcommand("check", "Validate schedules");

    auto schedules = std::make_shared<std::vector<std::string>>();
    sub->add_option("schedules", *schedules, "Schedules to validate");

    auto file = std::make_shared<std::string>();
    sub->add_option("-f,--file", *file, "Read schedules from a file, one per line")
        ->check(CLI::ExistingFile);

    sub->callback([&config, schedules, file]() {
        std::vector<std::string> input = *schedules;

        if (!file->empty()) {
            auto lines = load_schedule_file(*file);
            if (!lines) {
                LOG_ERROR("{}", lines.error().what());
                throw CLI::RuntimeError(2);
            }
            LOG_INFO("Checking {} line(s) from {}", lines->size(), *file);
            input.insert(input.end(), lines->begin(), lines->end());
        }

        if (input.empty()) {
            std::cerr << "error: no schedules given\n";
            throw CLI::RuntimeError(2);
        }

        if (run_check(input, config, std::cout) > 0) {
            throw CLI::RuntimeError(1);
        }
    });
}

// ---------------------------------------------------------------------------
// bounds command
// ---------------------------------------------------------------------------

void register_bounds_command(CLI::App& app, Config& config) {
    auto* sub = app.add_subcommand("bounds", "Print the permitted range of every field");

    sub->callback([&config]() {
        std::cout << bounds_json().dump(config.json_indent) << "\n";
    });
}

// ---------------------------------------------------------------------------
// version command
// ---------------------------------------------------------------------------

void register_version_command(CLI::App& app) {
    auto* sub = app.add_subcommand("version", "Print version information");

    sub->callback([]() {
        std::cout << "schedfmt " << SCHEDFMT_VERSION_STRING << "\n";
        std::cout << "C++ standard: " << __cplusplus << "\n";
#if defined(__clang__)
        std::cout << "Compiler: clang " << __clang_major__ << "."
                  << __clang_minor__ << "\n";
#elif defined(__GNUC__)
        std::cout << "Compiler: gcc " << __GNUC__ << "."
                  << __GNUC_MINOR__ << "\n";
#else
        std::cout << "Compiler: unknown\n";
#endif
    });
}

} // namespace schedfmt::cli
