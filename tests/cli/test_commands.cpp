#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "schedfmt/cli/app.hpp"
#include "schedfmt/cli/commands.hpp"
#include "schedfmt/core/logger.hpp"

using json = nlohmann::json;
namespace fs = std::filesystem;

TEST_CASE("parse command prints JSON", "[cli][parse]") {
    schedfmt::Config config;
    config.json_indent = -1;
    std::ostringstream out, err;

    auto code = schedfmt::cli::run_parse("2023.05.15 3 10:20:30.500", config, out, err);
    REQUIRE(code == 0);
    CHECK(err.str().empty());

    auto j = json::parse(out.str());
    CHECK(j["date"]["years"][0]["begin"] == 2023);
    CHECK(j["date"]["months"][0]["begin"] == 5);
    CHECK(j["day_of_week"][0]["begin"] == 3);
    CHECK(j["time"]["milliseconds"][0]["begin"] == 500);
    CHECK(j["time"]["milliseconds"][0]["end"].is_null());
}

TEST_CASE("parse command reports errors with location", "[cli][parse]") {
    schedfmt::Config config;
    std::ostringstream out, err;

    SECTION("with caret") {
        auto code = schedfmt::cli::run_parse("10:20:30extra", config, out, err);
        CHECK(code == 1);
        CHECK(out.str().empty());
        CHECK(err.str() ==
              "error [TRAILING_INPUT]: Unexpected trailing input: extra\n"
              "10:20:30extra\n"
              "        ^\n");
    }

    SECTION("without caret") {
        config.show_error_location = false;
        auto code = schedfmt::cli::run_parse("2199.01.01 10:00:00", config, out, err);
        CHECK(code == 1);
        CHECK(err.str() ==
              "error [OUT_OF_BOUNDS]: Year component (2199, 2199) is out of bounds (2000, 2100)\n");
    }
}

TEST_CASE("check command validates each line", "[cli][check]") {
    schedfmt::Config config;
    std::ostringstream out;

    std::vector<std::string> schedules = {
        "# nightly jobs",
        "10:20:30",
        "",
        "2024.01.1,* 10:00:00",
        "1-5 08:00:00",
    };

    SECTION("reports every line") {
        auto failures = schedfmt::cli::run_check(schedules, config, out);
        CHECK(failures == 1);
        CHECK(out.str() ==
              "OK    10:20:30\n"
              "ERROR 2024.01.1,* 10:00:00: Wildcard cannot be combined with other entries: Day\n"
              "OK    1-5 08:00:00\n");
    }

    SECTION("stops at first error when configured") {
        config.stop_on_first_error = true;
        auto failures = schedfmt::cli::run_check(schedules, config, out);
        CHECK(failures == 1);
        CHECK(out.str().find("1-5 08:00:00") == std::string::npos);
    }
}

TEST_CASE("check command parses schedules as given", "[cli][check]") {
    schedfmt::Config config;
    std::ostringstream out;

    auto failures = schedfmt::cli::run_check({"10:20:30 "}, config, out);
    CHECK(failures == 1);
    CHECK(out.str() == "ERROR 10:20:30 : Unexpected trailing input:  \n");

    std::ostringstream parse_out, parse_err;
    CHECK(schedfmt::cli::run_parse("10:20:30 ", config, parse_out, parse_err) == 1);
}

TEST_CASE("schedule files are trimmed line by line", "[cli][check]") {
    auto tmp = fs::temp_directory_path() / "schedfmt_test_schedules.txt";
    {
        std::ofstream out(tmp, std::ios::binary);
        out << "# weekly\r\n"
            << "  10:20:30\r\n"
            << "\t1-5 08:00:00  \n"
            << "   \n";
    }

    auto lines = schedfmt::cli::load_schedule_file(tmp);
    fs::remove(tmp);
    REQUIRE(lines.has_value());
    CHECK(*lines == std::vector<std::string>{"# weekly", "10:20:30", "1-5 08:00:00", ""});

    schedfmt::Config config;
    std::ostringstream out;
    CHECK(schedfmt::cli::run_check(*lines, config, out) == 0);
    CHECK(out.str() == "OK    10:20:30\nOK    1-5 08:00:00\n");

    SECTION("missing file") {
        auto missing = schedfmt::cli::load_schedule_file(tmp);
        REQUIRE_FALSE(missing.has_value());
        CHECK(missing.error().code() == schedfmt::ErrorCode::IoError);
    }
}

TEST_CASE("bounds table as JSON", "[cli][bounds]") {
    auto j = schedfmt::cli::bounds_json();
    REQUIRE(j.is_array());
    REQUIRE(j.size() == 8);
    CHECK(j[0]["field"] == "Year");
    CHECK(j[0]["min"] == 2000);
    CHECK(j[0]["max"] == 2100);
    CHECK(j[3]["field"] == "Day of week");
    CHECK(j[7]["max"] == 999);
}

TEST_CASE("App wires subcommands", "[cli][app]") {
    schedfmt::cli::App app;

    for (auto name : {"parse", "check", "bounds", "version"}) {
        CAPTURE(name);
        CHECK_NOTHROW(app.cli().get_subcommand(name));
    }

    SECTION("defaults before parsing") {
        CHECK(app.config().log_level == "info");
    }

    SECTION("bounds runs successfully") {
        std::vector<std::string> args = {"schedfmt", "--log-level", "error", "bounds"};
        std::vector<char*> argv;
        for (auto& a : args) argv.push_back(a.data());

        CHECK(app.run(static_cast<int>(argv.size()), argv.data()) == 0);
        CHECK(app.config().log_level == "error");
        CHECK(schedfmt::Logger::get()->level() == spdlog::level::err);
    }

    SECTION("invalid schedule exits with 1") {
        std::vector<std::string> args = {"schedfmt", "--log-level", "off", "parse", "25:00:00"};
        std::vector<char*> argv;
        for (auto& a : args) argv.push_back(a.data());

        CHECK(app.run(static_cast<int>(argv.size()), argv.data()) == 1);
    }
}
