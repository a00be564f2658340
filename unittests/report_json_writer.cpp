/*****************************************************************************
 * Tile Harvest
 * Copyright (C) 2024 alpinemaps.org
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 *****************************************************************************/

#include <fstream>
#include <sstream>

#include <catch2/catch.hpp>

#include "Exception.h"
#include "catch2_helpers.h"
#include "report_json_writer.h"

using namespace std::literals;

namespace {
reconcile::Result sample_result()
{
    reconcile::Result result;
    result.state = reconcile::State::Exhausted;
    result.fetch_calls = 12;
    result.report.expected_count = 5;
    result.report.valid_count = 3;
    result.report.completion_rate = 60.0;
    result.report.missing = { { 1, { 1, 0 } }, { 1, { 1, 1 } } };
    result.report.levels = { { 0, 1, 1, 0, 100.0 }, { 1, 4, 2, 2, 50.0 } };
    result.rounds = { { 0, 0, 5, 0, 0, 0, 5, 3ms, false }, { 1, 3, 5, 5, 3, 2, 2, 1500ms, true } };
    return result;
}
}

TEST_CASE("report json writer internals")
{
    CHECK(report_json_writer::internal::escape("plain") == "plain");
    CHECK(report_json_writer::internal::escape("a\"b\\c\nd") == "a\\\"b\\\\c\\nd");
    CHECK(report_json_writer::internal::escape("\x01") == "\\u0001");
    CHECK(report_json_writer::internal::string_attribute("name", "cyprus") == R"("name": "cyprus")");
    CHECK(report_json_writer::internal::tile({ 12, { 2287, 1577 } }) == "[12, 2287, 1577]");
    CHECK(report_json_writer::internal::level({ 1, 4, 2, 2, 50.0 }) == R"({ "zoom": 1, "expected": 4, "valid": 2, "missing": 2, "completion_rate": 50.00 })");
    CHECK(report_json_writer::internal::round({ 1, 3, 5, 5, 3, 2, 2, 1500ms, true })
        == R"({ "round": 1, "max_attempts": 3, "missing_before": 5, "attempted": 5, "succeeded": 3, "failed": 2, "missing_after": 2, "duration_ms": 1500, "timed_out": true })");
}

TEST_CASE("report json writer")
{
    const auto json = report_json_writer::process("cyprus", sample_result());
    CHECK(json.starts_with("{\n"));
    CHECK(json.ends_with("}\n"));
    CHECK(json.find(R"("name": "cyprus",)") != std::string::npos);
    CHECK(json.find(R"("state": "exhausted",)") != std::string::npos);
    CHECK(json.find(R"("expected": 5,)") != std::string::npos);
    CHECK(json.find(R"("valid": 3,)") != std::string::npos);
    CHECK(json.find(R"("missing_count": 2,)") != std::string::npos);
    CHECK(json.find(R"("completion_rate": 60.00,)") != std::string::npos);
    CHECK(json.find(R"("fetch_calls": 12,)") != std::string::npos);
    CHECK(json.find("    [1, 1, 0],\n    [1, 1, 1]\n  ]\n}") != std::string::npos);
    CHECK(json.find(",\n  ]") == std::string::npos);

    SECTION("empty lists")
    {
        reconcile::Result empty;
        empty.state = reconcile::State::Converged;
        const auto empty_json = report_json_writer::process("x", empty);
        CHECK(empty_json.find(R"("missing": [])") != std::string::npos);
        CHECK(empty_json.find(R"("levels": [],)") != std::string::npos);
    }
    SECTION("written to file")
    {
        test_helpers::TempDirectory dir;
        const auto path = dir.path() / "reports" / "cyprus.json";
        report_json_writer::write_to_file(path, "cyprus", sample_result());
        std::ifstream file(path);
        std::stringstream buffer;
        buffer << file.rdbuf();
        CHECK(buffer.str() == json);

        CHECK_THROWS_AS(report_json_writer::write_to_file(dir.path(), "cyprus", sample_result()), Exception);
        // /dev/full fails the flush on close
        if (std::filesystem::exists("/dev/full"))
            CHECK_THROWS_AS(report_json_writer::write_to_file("/dev/full", "cyprus", sample_result()), Exception);
    }
}
