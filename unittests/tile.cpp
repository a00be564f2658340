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

#include <unordered_set>

#include <catch2/catch.hpp>

#include "catch2_helpers.h"
#include "tile.h"

using namespace std::literals;

TEST_CASE("tile::Id scheme conversion")
{
    SECTION("tms -> slippy map")
    {
        CHECK(tile::Id{ 0, { 0, 0 }, tile::Scheme::Tms }.to(tile::Scheme::SlippyMap) == tile::Id{ 0, { 0, 0 }, tile::Scheme::SlippyMap });
        CHECK(tile::Id{ 1, { 0, 0 }, tile::Scheme::Tms }.to(tile::Scheme::SlippyMap) == tile::Id{ 1, { 0, 1 }, tile::Scheme::SlippyMap });
        CHECK(tile::Id{ 2, { 3, 1 }, tile::Scheme::Tms }.to(tile::Scheme::SlippyMap) == tile::Id{ 2, { 3, 2 }, tile::Scheme::SlippyMap });
        CHECK(tile::Id{ 12, { 2287, 1517 }, tile::Scheme::Tms }.to(tile::Scheme::SlippyMap) == tile::Id{ 12, { 2287, 2578 }, tile::Scheme::SlippyMap });
    }
    SECTION("slippy map -> tms")
    {
        CHECK(tile::Id{ 1, { 1, 1 }, tile::Scheme::SlippyMap }.to(tile::Scheme::Tms) == tile::Id{ 1, { 1, 0 }, tile::Scheme::Tms });
        CHECK(tile::Id{ 2, { 2, 3 }, tile::Scheme::SlippyMap }.to(tile::Scheme::Tms) == tile::Id{ 2, { 2, 0 }, tile::Scheme::Tms });
    }
    SECTION("no op for the same scheme")
    {
        CHECK(tile::Id{ 2, { 2, 3 }, tile::Scheme::Tms }.to(tile::Scheme::Tms) == tile::Id{ 2, { 2, 3 }, tile::Scheme::Tms });
        CHECK(tile::Id{ 2, { 3, 1 }, tile::Scheme::SlippyMap }.to(tile::Scheme::SlippyMap) == tile::Id{ 2, { 3, 1 }, tile::Scheme::SlippyMap });
    }
    SECTION("converting twice gives the original")
    {
        const auto id = tile::Id{ 7, { 100, 23 } };
        CHECK(id.to(tile::Scheme::Tms).to(tile::Scheme::SlippyMap) == id);
    }
}

TEST_CASE("tile::Id ordering and hashing")
{
    CHECK(tile::Id{ 0, { 0, 0 } } < tile::Id{ 1, { 0, 0 } });
    CHECK(tile::Id{ 1, { 0, 1 } } < tile::Id{ 1, { 1, 0 } });
    CHECK(tile::Id{ 1, { 1, 0 } } < tile::Id{ 1, { 1, 1 } });
    CHECK_FALSE(tile::Id{ 1, { 1, 1 } } < tile::Id{ 1, { 1, 1 } });

    std::unordered_set<tile::Id, tile::Id::Hasher> set;
    for (unsigned x = 0; x < 4; ++x) {
        for (unsigned y = 0; y < 4; ++y)
            set.insert({ 2, { x, y } });
    }
    set.insert({ 2, { 1, 1 } });
    CHECK(set.size() == 16);
    CHECK(set.contains({ 2, { 3, 0 } }));
    CHECK(!set.contains({ 3, { 3, 0 } }));
}

TEST_CASE("tile range count")
{
    CHECK(tile::count(tile::Range { { 0, 0 }, { 0, 0 } }) == 1);
    CHECK(tile::count(tile::Range { { 2, 5 }, { 4, 5 } }) == 3);
    CHECK(tile::count(tile::Range { { 0, 0 }, { (1u << 20) - 1, (1u << 20) - 1 } }) == (uint64_t(1) << 40));
    CHECK(tile::n_tiles(0) == 1);
    CHECK(tile::n_tiles(20) == 1048576);
}

TEST_CASE("tile templates")
{
    const auto id = tile::Id { 12, { 2287, 1577 } };
    CHECK(tile::to_string(id) == "12/2287/1577");
    CHECK(tile::format_template("http://localhost/tile/{z}/{x}/{y}.png", id) == "http://localhost/tile/12/2287/1577.png");
    CHECK(tile::format_template("/cache/{zoom}/{col}/{row}.png", id) == "/cache/12/2287/1577.png");
    CHECK(tile::format_template("{z}-{z}", id) == "12-12");
    CHECK(tile::format_template("no placeholders", id) == "no placeholders");

    std::string s = "aXbXc";
    tile::string_replace_all(s, "X"sv, "XX"sv);
    CHECK(s == "aXXbXXc");
}
