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

#include <catch2/catch.hpp>

#include "Exception.h"
#include "config.h"

using namespace std::literals;

TEST_CASE("render config")
{
    const auto bbox = coverage::BoundingBox::from_degrees(32.2, 34.5, 34.7, 35.8);
    const auto zoom_range = coverage::ZoomRange::make(0, 2);

    SECTION("render types")
    {
        CHECK(config::parse_render_type("bbox") == config::RenderType::Bbox);
        CHECK(config::parse_render_type("FULL") == config::RenderType::Full);
        CHECK_THROWS_AS(config::parse_render_type("polygon"), ConfigurationError);
        CHECK(config::to_string(config::RenderType::Full) == "full");
    }
    SECTION("bbox plan")
    {
        const auto render_config = config::make_render_config("cyprus", config::RenderType::Bbox, bbox, zoom_range);
        CHECK(render_config.coverage_plan() == coverage::plan(bbox, zoom_range));
    }
    SECTION("full plan ignores the box")
    {
        const auto render_config = config::make_render_config("world", config::RenderType::Full, bbox, zoom_range);
        CHECK(!render_config.bbox.has_value());
        CHECK(render_config.coverage_plan() == coverage::plan_full(zoom_range));
        CHECK(render_config.coverage_plan().count() == 21);
    }
    SECTION("invalid")
    {
        CHECK_THROWS_AS(config::make_render_config("", config::RenderType::Full, std::nullopt, zoom_range), ConfigurationError);
        CHECK_THROWS_AS(config::make_render_config("a/b", config::RenderType::Full, std::nullopt, zoom_range), ConfigurationError);
        CHECK_THROWS_AS(config::make_render_config("..", config::RenderType::Full, std::nullopt, zoom_range), ConfigurationError);
        CHECK_THROWS_AS(config::make_render_config("cyprus", config::RenderType::Bbox, std::nullopt, zoom_range), ConfigurationError);

        config::RenderConfig hand_made;
        hand_made.name = "broken";
        CHECK_THROWS_AS(hand_made.coverage_plan(), ConfigurationError);
    }
}

TEST_CASE("fetch config")
{
    SECTION("defaults are valid")
    {
        const auto config = config::make_fetch_config({});
        CHECK(config.max_attempts == 3);
        CHECK(config.retry_max_attempts == 10);
        CHECK(config.timeout == 30s);
        CHECK(config.backoff_base == 500ms);
        CHECK(config.backoff_jitter == 100ms);
        CHECK(config.scheme == tile::Scheme::SlippyMap);
    }
    SECTION("empty cache template means no cache")
    {
        config::FetchConfig draft;
        draft.cache_template = "";
        CHECK(!config::make_fetch_config(draft).cache_template.has_value());
    }
    SECTION("invalid")
    {
        config::FetchConfig draft;
        draft.url_template = "";
        CHECK_THROWS_AS(config::make_fetch_config(draft), ConfigurationError);
        draft.url_template = "http://localhost/tile.png";
        CHECK_THROWS_AS(config::make_fetch_config(draft), ConfigurationError);
        draft.url_template = "http://localhost/{zoom}/{col}/{row}.png";
        CHECK_NOTHROW(config::make_fetch_config(draft));

        draft.timeout = 0ms;
        CHECK_THROWS_AS(config::make_fetch_config(draft), ConfigurationError);
        draft.timeout = 1s;
        draft.backoff_base = -1ms;
        CHECK_THROWS_AS(config::make_fetch_config(draft), ConfigurationError);
        draft.backoff_base = 2h;
        CHECK_THROWS_AS(config::make_fetch_config(draft), ConfigurationError);
        draft.backoff_base = 1h;
        CHECK_NOTHROW(config::make_fetch_config(draft));
        draft.backoff_jitter = std::chrono::milliseconds(std::numeric_limits<int64_t>::max() / 2);
        CHECK_THROWS_AS(config::make_fetch_config(draft), ConfigurationError);
        draft.backoff_jitter = 0ms;
        draft.timeout = 90min;
        CHECK_THROWS_AS(config::make_fetch_config(draft), ConfigurationError);
        draft.timeout = 1s;
        draft.backoff_base = 0ms;
        draft.max_attempts = 0;
        CHECK_THROWS_AS(config::make_fetch_config(draft), ConfigurationError);
        draft.max_attempts = 1;
        draft.retry_max_attempts = 1000;
        CHECK_THROWS_AS(config::make_fetch_config(draft), ConfigurationError);
    }
}

TEST_CASE("durations in seconds")
{
    CHECK(config::milliseconds_from_seconds(0.5) == 500ms);
    CHECK(config::milliseconds_from_seconds(30) == 30s);
    CHECK(config::milliseconds_from_seconds(0.0004) == 0ms);
    CHECK_THROWS_AS(config::milliseconds_from_seconds(1e300), ConfigurationError);
    CHECK_THROWS_AS(config::milliseconds_from_seconds(-1e300), ConfigurationError);
    CHECK_THROWS_AS(config::milliseconds_from_seconds(std::numeric_limits<double>::infinity()), ConfigurationError);
    CHECK_THROWS_AS(config::milliseconds_from_seconds(std::numeric_limits<double>::quiet_NaN()), ConfigurationError);
}

TEST_CASE("reconcile config")
{
    const auto defaults = config::make_reconcile_config({});
    CHECK(defaults.workers == 4);
    CHECK(defaults.max_rounds == 3);
    CHECK(!defaults.round_timeout.has_value());

    config::ReconcileConfig draft;
    draft.workers = 0;
    CHECK_THROWS_AS(config::make_reconcile_config(draft), ConfigurationError);
    draft.workers = 65;
    CHECK_THROWS_AS(config::make_reconcile_config(draft), ConfigurationError);
    draft.workers = 8;
    draft.max_rounds = 0;
    CHECK_THROWS_AS(config::make_reconcile_config(draft), ConfigurationError);
    draft.max_rounds = 1;
    draft.round_timeout = 0ms;
    CHECK_THROWS_AS(config::make_reconcile_config(draft), ConfigurationError);
    draft.output_root = "";
    draft.round_timeout = 1s;
    CHECK_THROWS_AS(config::make_reconcile_config(draft), ConfigurationError);
}
