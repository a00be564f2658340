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

#include <cmath>
#include <limits>

#include <catch2/catch.hpp>

#include "catch2_helpers.h"
#include "mercator.h"

TEST_CASE("mercator projection")
{
    SECTION("zoom 0 maps everything inside the world to the single tile")
    {
        CHECK(mercator::project(0, 0, 0) == glm::dvec2(0, 0));
        CHECK(mercator::project(80, -170, 0) == glm::dvec2(0, 0));
        CHECK(mercator::project(-80, 170, 0) == glm::dvec2(0, 0));
    }
    SECTION("quadrants at zoom 1")
    {
        CHECK(mercator::project(45, -90, 1) == glm::dvec2(0, 0));
        CHECK(mercator::project(45, 90, 1) == glm::dvec2(1, 0));
        CHECK(mercator::project(-45, -90, 1) == glm::dvec2(0, 1));
        CHECK(mercator::project(-45, 90, 1) == glm::dvec2(1, 1));
        CHECK(mercator::project(0, 0, 1) == glm::dvec2(1, 1));
    }
    SECTION("known city tiles")
    {
        // vienna, stephansdom
        CHECK(mercator::project(48.2082, 16.3738, 12) == glm::dvec2(2234, 1420));
        // greenwich
        CHECK(mercator::project(51.4779, -0.0015, 10) == glm::dvec2(511, 340));
    }
    SECTION("results are not clipped")
    {
        CHECK(mercator::project(0, 180, 1).x == 2);
        CHECK(mercator::project(89.9, 0, 2).y < 0);
        CHECK(mercator::project(-89.9, 0, 2).y > 3);
    }
    SECTION("nan propagates")
    {
        const auto nan = std::numeric_limits<double>::quiet_NaN();
        CHECK(std::isnan(mercator::project(nan, 0, 3).y));
        CHECK(std::isnan(mercator::project(0, nan, 3).x));
    }
}
