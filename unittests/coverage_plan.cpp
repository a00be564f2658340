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

#include <limits>
#include <vector>

#include <catch2/catch.hpp>

#include "Exception.h"
#include "catch2_helpers.h"
#include "coverage_plan.h"

namespace {
std::vector<tile::Id> enumerate(const coverage::Plan& plan)
{
    std::vector<tile::Id> ids;
    for (const auto& id : plan)
        ids.push_back(id);
    return ids;
}

coverage::BoundingBox cyprus()
{
    return coverage::BoundingBox::from_degrees(32.2, 34.5, 34.7, 35.8);
}
}

TEST_CASE("bounding box validation")
{
    CHECK_NOTHROW(coverage::BoundingBox::from_degrees(-180, -90, 180, 90));
    const auto box = cyprus();
    CHECK(box.min_lon() == 32.2);
    CHECK(box.min_lat() == 34.5);
    CHECK(box.max_lon() == 34.7);
    CHECK(box.max_lat() == 35.8);

    CHECK_THROWS_AS(coverage::BoundingBox::from_degrees(34.7, 34.5, 32.2, 35.8), ConfigurationError);
    CHECK_THROWS_AS(coverage::BoundingBox::from_degrees(32.2, 35.8, 34.7, 34.5), ConfigurationError);
    CHECK_THROWS_AS(coverage::BoundingBox::from_degrees(10, 10, 10, 20), ConfigurationError);
    CHECK_THROWS_AS(coverage::BoundingBox::from_degrees(-181, 0, 10, 10), ConfigurationError);
    CHECK_THROWS_AS(coverage::BoundingBox::from_degrees(0, 0, 10, 91), ConfigurationError);
    const auto nan = std::numeric_limits<double>::quiet_NaN();
    const auto inf = std::numeric_limits<double>::infinity();
    CHECK_THROWS_AS(coverage::BoundingBox::from_degrees(nan, 0, 10, 10), ConfigurationError);
    CHECK_THROWS_AS(coverage::BoundingBox::from_degrees(0, 0, inf, 10), ConfigurationError);
}

TEST_CASE("zoom range validation")
{
    const auto range = coverage::ZoomRange::make(3, 7);
    CHECK(range.min_zoom() == 3);
    CHECK(range.max_zoom() == 7);
    CHECK(range.size() == 5);
    CHECK_NOTHROW(coverage::ZoomRange::make(0, 20));
    CHECK_NOTHROW(coverage::ZoomRange::make(4, 4));
    CHECK_THROWS_AS(coverage::ZoomRange::make(-1, 3), ConfigurationError);
    CHECK_THROWS_AS(coverage::ZoomRange::make(0, 21), ConfigurationError);
    CHECK_THROWS_AS(coverage::ZoomRange::make(5, 3), ConfigurationError);
}

TEST_CASE("coverage plan")
{
    SECTION("zoom 0 is exactly one tile")
    {
        const auto plan = coverage::plan(cyprus(), coverage::ZoomRange::make(0, 0));
        CHECK(plan.count() == 1);
        const auto ids = enumerate(plan);
        REQUIRE(ids.size() == 1);
        CHECK(ids.front() == tile::Id { 0, { 0, 0 } });
    }
    SECTION("cyprus on zoom 0 to 1")
    {
        const auto plan = coverage::plan(cyprus(), coverage::ZoomRange::make(0, 1));
        CHECK(plan.count() <= 5);
        CHECK(plan.level_count(0) == 1);
        const auto ids = enumerate(plan);
        CHECK(ids == std::vector<tile::Id> { { 0, { 0, 0 } }, { 1, { 1, 0 } } });
    }
    SECTION("cyprus on zoom 12")
    {
        const auto plan = coverage::plan(cyprus(), coverage::ZoomRange::make(12, 12));
        REQUIRE(plan.levels().size() == 1);
        const auto level = plan.levels().front();
        CHECK(level.zoom_level == 12);
        // the northern edge has the smaller row
        CHECK(level.range.min.y < level.range.max.y);
        CHECK(level.range.min.x < level.range.max.x);
        CHECK(plan.contains({ 12, level.range.min }));
        CHECK(plan.contains({ 12, level.range.max }));
        CHECK(!plan.contains({ 12, level.range.max + glm::uvec2(1, 0) }));
        CHECK(!plan.contains({ 11, level.range.min }));
        CHECK(plan.contains(tile::Id { 12, level.range.min }.to(tile::Scheme::Tms)));
    }
    SECTION("deterministic and repeatable")
    {
        const auto zoom_range = coverage::ZoomRange::make(0, 8);
        const auto a = coverage::plan(cyprus(), zoom_range);
        const auto b = coverage::plan(cyprus(), zoom_range);
        CHECK(a == b);
        CHECK(enumerate(a) == enumerate(b));
        CHECK(enumerate(a) == enumerate(a));
    }
    SECTION("closed form count equals enumeration, every tile is on the grid and in order")
    {
        const auto bbox = coverage::BoundingBox::from_degrees(9.5, 46.3, 17.2, 49.1);
        const auto plan = coverage::plan(bbox, coverage::ZoomRange::make(0, 10));
        const auto ids = enumerate(plan);
        CHECK(ids.size() == plan.count());

        uint64_t per_level_sum = 0;
        for (unsigned z = 0; z <= 10; ++z)
            per_level_sum += plan.level_count(z);
        CHECK(per_level_sum == plan.count());

        for (size_t i = 0; i < ids.size(); ++i) {
            REQUIRE(ids[i].coords.x < tile::n_tiles(ids[i].zoom_level));
            REQUIRE(ids[i].coords.y < tile::n_tiles(ids[i].zoom_level));
            REQUIRE(ids[i].scheme == tile::Scheme::SlippyMap);
            if (i > 0)
                REQUIRE(ids[i - 1] < ids[i]);
        }
    }
    SECTION("the whole world is clipped to the grid")
    {
        const auto zoom_range = coverage::ZoomRange::make(0, 3);
        const auto plan = coverage::plan(coverage::BoundingBox::from_degrees(-180, -85, 180, 85), zoom_range);
        CHECK(plan == coverage::plan_full(zoom_range));

        const auto poles = coverage::plan(coverage::BoundingBox::from_degrees(-180, -90, 180, 90), zoom_range);
        CHECK(poles == coverage::plan_full(zoom_range));
    }
    SECTION("tiny box gives one tile per level")
    {
        const auto plan = coverage::plan(coverage::BoundingBox::from_degrees(16.37, 48.20, 16.3701, 48.2001), coverage::ZoomRange::make(0, 12));
        CHECK(plan.count() == 13);
    }
    SECTION("levels outside the range are empty")
    {
        const auto plan = coverage::plan(cyprus(), coverage::ZoomRange::make(2, 4));
        CHECK(plan.level_count(1) == 0);
        CHECK(plan.level_count(5) == 0);
        CHECK(!plan.level(1).has_value());
        CHECK(plan.level(3).has_value());
    }
    SECTION("empty plan")
    {
        const coverage::Plan plan;
        CHECK(plan.count() == 0);
        CHECK(plan.begin() == plan.end());
    }
}

TEST_CASE("full coverage plan")
{
    const auto plan = coverage::plan_full(coverage::ZoomRange::make(0, 2));
    CHECK(plan.count() == 1 + 4 + 16);
    CHECK(enumerate(plan).size() == 21);
    CHECK(plan.level(2)->range == tile::Range { { 0, 0 }, { 3, 3 } });

    const auto deep = coverage::plan_full(coverage::ZoomRange::make(20, 20));
    CHECK(deep.count() == (uint64_t(1) << 40));
}
