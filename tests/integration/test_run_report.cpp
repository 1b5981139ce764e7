/**
 * @file test_run_report.cpp
 * @brief Интеграционный тест отчёта о прогоне
 */

#include <doctest/doctest.h>
#include "app/report_runner.hpp"
#include "core/stream_sanitizer.hpp"
#include "io/file_utils.hpp"
#include "io/report_writer.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <sstream>

namespace fs = std::filesystem;
using namespace csvnorm;

TEST_CASE("Run report is written as JSON and Markdown") {
    auto out_dir = fs::temp_directory_path() / "csvnorm_run_report";
    fs::remove_all(out_dir);

    model::SanitizerSettings settings;
    settings.output_time_zone = "America/New_York";

    std::istringstream in(
        "4/1/11 11:00:00 AM,a,1,b,0:00:01,0:00:01,0:00:02,n\n"
        "\n"
        "4/1/11 11:00:00 AM,a,1,b,0:00:01,0:00:01,zzsasdfa,n\n"
        "x|y\n");
    std::ostringstream out;
    auto stats = core::StreamSanitizer{settings}.run(in, out);

    auto report = app::buildRunReport(settings, stats);
    CHECK(report.meta.input_time_zone == "America/Los_Angeles");
    CHECK(report.meta.output_time_zone == "America/New_York");
    CHECK_FALSE(report.meta.app_version.empty());

    auto result = io::writeRunReport(report, out_dir);
    REQUIRE(fs::exists(result.json_path));
    REQUIRE(fs::exists(result.markdown_path));
    CHECK_FALSE(fs::exists(out_dir / "report.json.tmp"));

    auto j = nlohmann::json::parse(io::readWholeFile(result.json_path));
    CHECK(j.at("schema_version") == "1.0.0");
    CHECK(j.at("meta").at("output_time_zone") == "America/New_York");
    CHECK(j.at("summary").at("rows_read") == 3);
    CHECK(j.at("summary").at("rows_written") == 1);
    CHECK(j.at("summary").at("rows_dropped") == 2);
    CHECK(j.at("summary").at("blank_lines") == 1);
    CHECK(j.at("summary").at("dropped_by_reason").at("bad_duration") == 1);
    CHECK(j.at("summary").at("dropped_by_reason").at("wrong_field_count") == 1);
    REQUIRE(j.at("drops").size() == 2);
    CHECK(j.at("drops")[0].at("line") == 3);
    CHECK(j.at("drops")[0].at("reason") == "bad_duration");

    auto md = io::readWholeFile(result.markdown_path);
    CHECK(md.find("# Отчёт о нормализации CSV") != std::string::npos);
    CHECK(md.find("| bad_duration | 1 |") != std::string::npos);
    CHECK(md.find("| 4 | wrong_field_count |") != std::string::npos);

    CHECK(app::writeReportCommand(settings, stats, out_dir) == 0);

    fs::remove_all(out_dir);
}

TEST_CASE("Markdown escapes table separators in details") {
    model::RunReport report;
    report.stats.recordDrop(1, model::DropReason::BadTimestamp, "a|b", 10);
    auto md = io::runReportToMarkdown(report);
    CHECK(md.find("a\\|b") != std::string::npos);
}
