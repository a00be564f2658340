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

#include <algorithm>
#include <span>

#include <catch2/catch.hpp>

#include "catch2_helpers.h"
#include "coverage_plan.h"
#include "tile_store.h"

using test_helpers::png_bytes;
using test_helpers::TempDirectory;
using test_helpers::write_file;

TEST_CASE("png signature validity")
{
    TempDirectory dir;
    const auto path = dir.path() / "tile.png";

    SECTION("signature followed by junk is valid")
    {
        write_file(path, png_bytes());
        CHECK(store::is_valid(path));
    }
    SECTION("exactly the signature is valid")
    {
        write_file(path, { store::png_signature.begin(), store::png_signature.end() });
        CHECK(store::is_valid(path));
    }
    SECTION("missing file")
    {
        CHECK(!store::is_valid(path));
    }
    SECTION("empty file")
    {
        write_file(path, {});
        CHECK(!store::is_valid(path));
    }
    SECTION("truncated signature")
    {
        write_file(path, { 0x89, 0x50, 0x4E, 0x47 });
        CHECK(!store::is_valid(path));
    }
    SECTION("html error page")
    {
        write_file(path, test_helpers::html_bytes());
        CHECK(!store::is_valid(path));
    }
    SECTION("jpeg")
    {
        write_file(path, { 0xFF, 0xD8, 0xFF, 0xE0, 0x00, 0x10, 0x4A, 0x46, 0x49, 0x46 });
        CHECK(!store::is_valid(path));
    }
    SECTION("directory")
    {
        std::filesystem::create_directories(path);
        CHECK(!store::is_valid(path));
    }
    SECTION("span check")
    {
        const auto bytes = png_bytes();
        CHECK(store::has_png_signature(bytes));
        CHECK(!store::has_png_signature(std::span(bytes).first(7)));
    }
}

TEST_CASE("tile store layout")
{
    const auto store = store::TileStore::for_project("tiles", "cyprus");
    CHECK(store.root() == std::filesystem::path("tiles") / "cyprus");
    CHECK(store.tile_path({ 12, { 2287, 1577 } }) == std::filesystem::path("tiles/cyprus/12/2287/1577.png"));
    // tms ids end up in the same xyz file
    CHECK(store.tile_path(tile::Id { 1, { 1, 0 } }.to(tile::Scheme::Tms)) == store.tile_path({ 1, { 1, 0 } }));
}

TEST_CASE("store inspection")
{
    TempDirectory dir;
    const auto store = store::TileStore(dir.path());
    const auto plan = coverage::plan_full(coverage::ZoomRange::make(0, 2));

    SECTION("empty store misses everything in plan order")
    {
        const auto missing = store::find_missing(plan, store);
        CHECK(missing.size() == 21);
        CHECK(missing == std::vector<tile::Id>(plan.begin(), plan.end()));

        const auto report = store::report(plan, store);
        CHECK(report.expected_count == 21);
        CHECK(report.valid_count == 0);
        CHECK(report.completion_rate == 0);
        REQUIRE(report.levels.size() == 3);
        CHECK(report.levels[2].expected_count == 16);
        CHECK(report.levels[2].missing_count == 16);
    }
    SECTION("valid, invalid and unplanned artifacts")
    {
        write_file(store.tile_path({ 0, { 0, 0 } }), png_bytes());
        write_file(store.tile_path({ 1, { 0, 1 } }), png_bytes());
        write_file(store.tile_path({ 1, { 1, 1 } }), test_helpers::html_bytes());
        write_file(store.tile_path({ 2, { 3, 3 } }), {});
        // outside of the plan, counted by the independent scan only
        write_file(store.tile_path({ 5, { 0, 0 } }), png_bytes());
        write_file(dir.path() / "notes.txt", png_bytes());

        const auto report = store::report(plan, store);
        CHECK(report.expected_count == 21);
        CHECK(report.missing.size() == 19);
        CHECK(report.valid_count == 3);
        CHECK(report.completion_rate == Approx(3.0 / 21.0 * 100.0));
        CHECK(std::find(report.missing.begin(), report.missing.end(), tile::Id { 1, { 1, 1 } }) != report.missing.end());
        CHECK(std::find(report.missing.begin(), report.missing.end(), tile::Id { 1, { 0, 1 } }) == report.missing.end());

        REQUIRE(report.levels.size() == 3);
        CHECK(report.levels[0].valid_count == 1);
        CHECK(report.levels[0].completion_rate == Approx(100.0));
        CHECK(report.levels[1].valid_count == 1);
        CHECK(report.levels[1].missing_count == 3);
        CHECK(report.levels[2].valid_count == 0);
    }
    SECTION("complete store")
    {
        for (const auto& id : plan)
            write_file(store.tile_path(id), png_bytes());
        const auto report = store::report(plan, store);
        CHECK(report.missing.empty());
        CHECK(report.valid_count == 21);
        CHECK(report.completion_rate == Approx(100.0));
    }
    SECTION("store root does not exist")
    {
        const auto absent = store::TileStore(dir.path() / "absent");
        CHECK(absent.count_valid_artifacts() == 0);
        CHECK(store::find_missing(plan, absent).size() == 21);
    }
}

TEST_CASE("completion rate")
{
    CHECK(store::completion_rate(0, 0) == 0);
    CHECK(store::completion_rate(5, 0) == 0);
    CHECK(store::completion_rate(1, 4) == Approx(25.0));
    CHECK(store::completion_rate(4, 4) == Approx(100.0));
}
