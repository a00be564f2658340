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

#include <set>
#include <stdexcept>

#include <catch2/catch.hpp>

#include "catch2_helpers.h"
#include "coverage_plan.h"
#include "mock_http_client.h"
#include "parallel_fetcher.h"

using namespace std::literals;
using test_helpers::png_bytes;
using test_helpers::TempDirectory;

namespace {
config::FetchConfig fast_config()
{
    config::FetchConfig config;
    config.url_template = "http://tiles.test/{z}/{x}/{y}.png";
    config.backoff_base = 0ms;
    config.backoff_jitter = 0ms;
    return config::make_fetch_config(config);
}

std::vector<tile::Id> tiles_of(const coverage::Plan& plan)
{
    return { plan.begin(), plan.end() };
}
}

TEST_CASE("parallel fetcher")
{
    TempDirectory dir;
    const auto store = store::TileStore(dir.path());
    const auto tiles = tiles_of(coverage::plan_full(coverage::ZoomRange::make(0, 3)));
    REQUIRE(tiles.size() == 85);

    SECTION("every tile is fetched exactly once")
    {
        MockBackend backend([](const std::string&, unsigned) { return MockBackend::ok(png_bytes()); });
        const fetch::ParallelFetcher fetcher(fast_config(), backend.factory(), 4);
        const auto round = fetcher.run(tiles, store, 3);
        CHECK(round.succeeded == tiles.size());
        CHECK(round.failed == 0);
        CHECK(round.not_attempted == 0);
        CHECK(round.fetch_calls == tiles.size());
        CHECK(!round.timed_out);
        CHECK(!round.cancelled);
        CHECK(backend.requests() == tiles.size());
        CHECK(backend.clients_created() <= 4);

        const auto urls = backend.urls();
        CHECK(std::set<std::string>(urls.begin(), urls.end()).size() == tiles.size());

        REQUIRE(round.outcomes.size() == tiles.size());
        for (size_t i = 0; i < tiles.size(); ++i) {
            REQUIRE(round.outcomes[i].tile_id == tiles[i]);
            REQUIRE(round.outcomes[i].attempted);
            REQUIRE(store.is_valid(tiles[i]));
        }
    }
    SECTION("failures are counted per tile")
    {
        MockBackend backend([](const std::string& url, unsigned) {
            if (url.starts_with("http://tiles.test/3/"))
                return MockBackend::status(404);
            return MockBackend::ok(png_bytes());
        });
        const fetch::ParallelFetcher fetcher(fast_config(), backend.factory(), 3);
        const auto round = fetcher.run(tiles, store, 2);
        CHECK(round.succeeded == 21);
        CHECK(round.failed == 64);
        CHECK(round.fetch_calls == 21 + 64 * 2);
        CHECK(!store.is_valid({ 3, { 0, 0 } }));
        CHECK(store.is_valid({ 2, { 0, 0 } }));
    }
    SECTION("no more workers than tiles")
    {
        MockBackend backend([](const std::string&, unsigned) { return MockBackend::ok(png_bytes()); });
        const fetch::ParallelFetcher fetcher(fast_config(), backend.factory(), 16);
        const auto round = fetcher.run({ tiles.front() }, store, 1);
        CHECK(round.succeeded == 1);
        CHECK(backend.clients_created() == 1);
    }
    SECTION("empty batch")
    {
        MockBackend backend([](const std::string&, unsigned) { return MockBackend::ok(png_bytes()); });
        const fetch::ParallelFetcher fetcher(fast_config(), backend.factory(), 4);
        const auto round = fetcher.run({}, store, 1);
        CHECK(round.outcomes.empty());
        CHECK(backend.clients_created() == 0);
    }
    SECTION("stopped before the round")
    {
        std::stop_source stop_source;
        stop_source.request_stop();
        MockBackend backend([](const std::string&, unsigned) { return MockBackend::ok(png_bytes()); });
        const fetch::ParallelFetcher fetcher(fast_config(), backend.factory(), 4);
        const auto round = fetcher.run(tiles, store, 3, stop_source.get_token());
        CHECK(round.cancelled);
        CHECK(round.not_attempted == tiles.size());
        CHECK(round.succeeded == 0);
        CHECK(backend.requests() == 0);
    }
    SECTION("stopped during the round")
    {
        std::stop_source stop_source;
        MockBackend backend([&](const std::string&, unsigned) {
            stop_source.request_stop();
            return MockBackend::ok(png_bytes());
        });
        const fetch::ParallelFetcher fetcher(fast_config(), backend.factory(), 2);
        const auto round = fetcher.run(tiles, store, 3, stop_source.get_token());
        CHECK(round.cancelled);
        CHECK(round.succeeded >= 1);
        CHECK(round.succeeded <= 2);
        CHECK(round.not_attempted == tiles.size() - round.succeeded);
    }
    SECTION("deadline in the past")
    {
        MockBackend backend([](const std::string&, unsigned) { return MockBackend::ok(png_bytes()); });
        const fetch::ParallelFetcher fetcher(fast_config(), backend.factory(), 4);
        const auto round = fetcher.run(tiles, store, 3, {}, fetch::ParallelFetcher::Clock::now() - 1s);
        CHECK(round.timed_out);
        CHECK(!round.cancelled);
        CHECK(round.not_attempted == tiles.size());
    }
    SECTION("deadline ends a slow round")
    {
        MockBackend backend([](const std::string&, unsigned) { return MockBackend::status(503); });
        auto config = fast_config();
        config.backoff_base = 60s;
        const fetch::ParallelFetcher fetcher(config, backend.factory(), 2);
        const auto t0 = fetch::ParallelFetcher::Clock::now();
        const auto round = fetcher.run(tiles, store, 3, {}, t0 + 200ms);
        CHECK(fetch::ParallelFetcher::Clock::now() - t0 < 30s);
        CHECK(round.timed_out);
        CHECK(round.succeeded == 0);
        CHECK(round.not_attempted >= tiles.size() - 2);
    }
    SECTION("worker errors are rethrown")
    {
        const fetch::HttpClientFactory failing_factory = []() -> std::unique_ptr<fetch::HttpClient> { throw std::runtime_error("no client"); };
        const fetch::ParallelFetcher fetcher(fast_config(), failing_factory, 4);
        CHECK_THROWS_AS(fetcher.run(tiles, store, 1), std::runtime_error);
    }
    SECTION("progress bar")
    {
        MockBackend backend([](const std::string&, unsigned) { return MockBackend::ok(png_bytes()); });
        const fetch::ParallelFetcher fetcher(fast_config(), backend.factory(), 4);
        const auto round = fetcher.run(tiles, store, 1, {}, std::nullopt, true);
        CHECK(round.succeeded == tiles.size());
    }
}
