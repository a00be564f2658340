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

#include <chrono>
#include <stop_token>

#include <catch2/catch.hpp>

#include "catch2_helpers.h"
#include "http_client.h"
#include "mock_http_client.h"
#include "tile_fetcher.h"
#include "tile_store.h"

using namespace std::literals;
using test_helpers::png_bytes;
using test_helpers::TempDirectory;
using test_helpers::write_file;

namespace {
config::FetchConfig fast_config()
{
    config::FetchConfig config;
    config.url_template = "http://tiles.test/{z}/{x}/{y}.png";
    config.backoff_base = 0ms;
    config.backoff_jitter = 0ms;
    return config::make_fetch_config(config);
}

const tile::Id tile_id = { 3, { 4, 2 } };
}

TEST_CASE("backoff")
{
    config::FetchConfig config;
    config.backoff_base = 500ms;
    config.backoff_jitter = 100ms;
    CHECK(fetch::backoff_delay(config, 0) == 500ms);
    CHECK(fetch::backoff_delay(config, 1) == 1100ms);
    CHECK(fetch::backoff_delay(config, 2) == 2200ms);
    CHECK(fetch::backoff_delay(config, 3) == 4300ms);
    CHECK(fetch::backoff_delay(fast_config(), 5) == 0ms);

    config.backoff_base = 1h;
    config.backoff_jitter = 1h;
    const auto capped = config::make_fetch_config(config);
    CHECK(fetch::backoff_delay(capped, 29) == 1h * (int64_t(1) << 20) + 1h * 29);

    SECTION("waiting is interrupted by a stop request")
    {
        std::stop_source stop_source;
        CHECK(fetch::wait_for_or_stopped(1ms, stop_source.get_token()));
        stop_source.request_stop();
        const auto t0 = std::chrono::steady_clock::now();
        CHECK(!fetch::wait_for_or_stopped(10s, stop_source.get_token()));
        CHECK(std::chrono::steady_clock::now() - t0 < 5s);
    }
}

TEST_CASE("tile fetcher urls")
{
    auto config = fast_config();
    MockBackend backend([](const std::string&, unsigned) { return MockBackend::status(404); });
    MockHttpClient client(backend);
    CHECK(fetch::TileFetcher(config, client).url_for(tile_id) == "http://tiles.test/3/4/2.png");
    CHECK(!fetch::TileFetcher(config, client).cache_path_for(tile_id).has_value());

    config.scheme = tile::Scheme::Tms;
    config.cache_template = "/cache/{zoom}/{col}/{row}.png";
    const auto fetcher = fetch::TileFetcher(config, client);
    CHECK(fetcher.url_for(tile_id) == "http://tiles.test/3/4/5.png");
    CHECK(fetcher.cache_path_for(tile_id) == std::filesystem::path("/cache/3/4/5.png"));
}

TEST_CASE("tile fetcher")
{
    TempDirectory dir;
    const auto store = store::TileStore(dir.path() / "store");
    const auto dest = store.tile_path(tile_id);
    auto part = dest;
    part += ".part";

    SECTION("success leaves a valid file")
    {
        MockBackend backend([](const std::string&, unsigned) { return MockBackend::ok(png_bytes()); });
        MockHttpClient client(backend);
        fetch::TileFetcher fetcher(fast_config(), client);
        const auto result = fetcher.fetch(tile_id, dest, 3);
        CHECK(result.ok());
        CHECK(result.status == fetch::FetchStatus::Downloaded);
        CHECK(result.attempts == 1);
        CHECK(store::is_valid(dest));
        CHECK(test_helpers::read_file(dest) == png_bytes());
        CHECK(!std::filesystem::exists(part));
        CHECK(backend.urls() == std::vector<std::string> { "http://tiles.test/3/4/2.png" });
    }
    SECTION("always 404 leaves no file after all attempts")
    {
        MockBackend backend([](const std::string&, unsigned) { return MockBackend::status(404); });
        MockHttpClient client(backend);
        fetch::TileFetcher fetcher(fast_config(), client);
        const auto result = fetcher.fetch(tile_id, dest, 3);
        CHECK(!result.ok());
        CHECK(result.status == fetch::FetchStatus::Failed);
        CHECK(result.attempts == 3);
        CHECK(backend.requests() == 3);
        CHECK(result.last_error.find("404") != std::string::npos);
        CHECK(!std::filesystem::exists(dest));
        CHECK(!std::filesystem::exists(part));
    }
    SECTION("transient failures are retried")
    {
        MockBackend backend([](const std::string&, unsigned request_number) {
            if (request_number < 2)
                return request_number == 0 ? MockBackend::status(503) : tl::expected<fetch::HttpResponse, fetch::HttpError>(tl::unexpect, fetch::HttpErrorKind::Timeout);
            return MockBackend::ok(png_bytes());
        });
        MockHttpClient client(backend);
        fetch::TileFetcher fetcher(fast_config(), client);
        const auto result = fetcher.fetch(tile_id, dest, 3);
        CHECK(result.status == fetch::FetchStatus::Downloaded);
        CHECK(result.attempts == 3);
        CHECK(store::is_valid(dest));
    }
    SECTION("html served with status 200 is rejected")
    {
        MockBackend backend([](const std::string&, unsigned) { return MockBackend::ok(test_helpers::html_bytes()); });
        MockHttpClient client(backend);
        fetch::TileFetcher fetcher(fast_config(), client);
        const auto result = fetcher.fetch(tile_id, dest, 2);
        CHECK(result.status == fetch::FetchStatus::Failed);
        CHECK(result.attempts == 2);
        CHECK(result.last_error.find("invalid tile content") != std::string::npos);
        CHECK(result.last_error.find("failed to write") == std::string::npos);
        CHECK(!std::filesystem::exists(dest));
        CHECK(!std::filesystem::exists(part));
    }
    SECTION("an existing valid artifact survives a failing fetch")
    {
        auto existing = png_bytes();
        existing.push_back(42);
        write_file(dest, existing);
        MockBackend backend([](const std::string&, unsigned) { return MockBackend::ok(test_helpers::html_bytes()); });
        MockHttpClient client(backend);
        fetch::TileFetcher fetcher(fast_config(), client);
        CHECK(!fetcher.fetch(tile_id, dest, 2).ok());
        CHECK(test_helpers::read_file(dest) == existing);
    }
    SECTION("an existing invalid artifact is removed")
    {
        write_file(dest, test_helpers::html_bytes());
        MockBackend backend([](const std::string&, unsigned) { return MockBackend::status(500); });
        MockHttpClient client(backend);
        fetch::TileFetcher fetcher(fast_config(), client);
        CHECK(!fetcher.fetch(tile_id, dest, 1).ok());
        CHECK(!std::filesystem::exists(dest));
    }
    SECTION("an existing invalid artifact is replaced")
    {
        write_file(dest, {});
        MockBackend backend([](const std::string&, unsigned) { return MockBackend::ok(png_bytes()); });
        MockHttpClient client(backend);
        fetch::TileFetcher fetcher(fast_config(), client);
        CHECK(fetcher.fetch(tile_id, dest, 1).ok());
        CHECK(store::is_valid(dest));
    }
    SECTION("zero attempts")
    {
        MockBackend backend([](const std::string&, unsigned) { return MockBackend::ok(png_bytes()); });
        MockHttpClient client(backend);
        fetch::TileFetcher fetcher(fast_config(), client);
        const auto result = fetcher.fetch(tile_id, dest, 0);
        CHECK(result.status == fetch::FetchStatus::Failed);
        CHECK(backend.requests() == 0);
    }
}

TEST_CASE("tile fetcher cache")
{
    TempDirectory dir;
    const auto dest = store::TileStore(dir.path() / "store").tile_path(tile_id);
    auto config = fast_config();
    config.cache_template = (dir.path() / "cache" / "{z}" / "{x}" / "{y}.png").string();
    MockBackend backend([](const std::string&, unsigned) { return MockBackend::ok(png_bytes()); });
    MockHttpClient client(backend);
    fetch::TileFetcher fetcher(config, client);

    SECTION("valid cache entry is copied without network access")
    {
        auto cached = png_bytes();
        cached.push_back(7);
        write_file(dir.path() / "cache/3/4/2.png", cached);
        const auto result = fetcher.fetch(tile_id, dest, 3);
        CHECK(result.status == fetch::FetchStatus::CopiedFromCache);
        CHECK(result.attempts == 0);
        CHECK(backend.requests() == 0);
        CHECK(test_helpers::read_file(dest) == cached);
        CHECK(std::filesystem::exists(dir.path() / "cache/3/4/2.png"));
    }
    SECTION("invalid cache entry falls through to the network")
    {
        write_file(dir.path() / "cache/3/4/2.png", test_helpers::html_bytes());
        const auto result = fetcher.fetch(tile_id, dest, 3);
        CHECK(result.status == fetch::FetchStatus::Downloaded);
        CHECK(backend.requests() == 1);
    }
    SECTION("cache miss falls through to the network")
    {
        CHECK(fetcher.fetch(tile_id, dest, 3).status == fetch::FetchStatus::Downloaded);
        CHECK(backend.requests() == 1);
    }
}

TEST_CASE("tile fetcher cancellation")
{
    TempDirectory dir;
    const auto dest = store::TileStore(dir.path()).tile_path(tile_id);

    SECTION("nothing happens after a stop request")
    {
        std::stop_source stop_source;
        stop_source.request_stop();
        MockBackend backend([](const std::string&, unsigned) { return MockBackend::ok(png_bytes()); });
        MockHttpClient client(backend);
        fetch::TileFetcher fetcher(fast_config(), client);
        const auto result = fetcher.fetch(tile_id, dest, 3, stop_source.get_token());
        CHECK(result.status == fetch::FetchStatus::Cancelled);
        CHECK(backend.requests() == 0);
        CHECK(!std::filesystem::exists(dest));
    }
    SECTION("a stop request ends the backoff wait")
    {
        std::stop_source stop_source;
        MockBackend backend([&](const std::string&, unsigned) {
            stop_source.request_stop();
            return MockBackend::status(503);
        });
        MockHttpClient client(backend);
        auto config = fast_config();
        config.backoff_base = 60s;
        fetch::TileFetcher fetcher(config, client);
        const auto t0 = std::chrono::steady_clock::now();
        const auto result = fetcher.fetch(tile_id, dest, 3, stop_source.get_token());
        CHECK(std::chrono::steady_clock::now() - t0 < 30s);
        CHECK(result.status == fetch::FetchStatus::Cancelled);
        CHECK(result.attempts == 1);
        CHECK(backend.requests() == 1);
    }
}

TEST_CASE("curl http client")
{
    TempDirectory dir;
    const auto source = store::TileStore(dir.path() / "source");
    write_file(source.tile_path(tile_id), png_bytes());

    fetch::CurlHttpClient client;
    SECTION("file urls report status 0")
    {
        const auto response = client.get("file://" + source.tile_path(tile_id).string(), 5s);
        REQUIRE(response.has_value());
        CHECK(response->status == 0);
        CHECK(response->body == png_bytes());
    }
    SECTION("unreadable file is an error")
    {
        const auto response = client.get("file://" + (dir.path() / "absent.png").string(), 5s);
        REQUIRE(!response.has_value());
        CHECK(response.error().kind() == fetch::HttpErrorKind::Transport);
        CHECK(!response.error().description().empty());
    }
    SECTION("fetching through curl")
    {
        auto config = fast_config();
        config.url_template = "file://" + (source.root() / "{z}" / "{x}" / "{y}.png").string();
        fetch::TileFetcher fetcher(config, client);
        const auto dest = store::TileStore(dir.path() / "store").tile_path(tile_id);
        CHECK(fetcher.fetch(tile_id, dest, 2).status == fetch::FetchStatus::Downloaded);
        CHECK(store::is_valid(dest));

        const auto missing = tile::Id { 3, { 0, 0 } };
        const auto missing_dest = store::TileStore(dir.path() / "store").tile_path(missing);
        CHECK(fetcher.fetch(missing, missing_dest, 2).status == fetch::FetchStatus::Failed);
        CHECK(!std::filesystem::exists(missing_dest));
    }
}

TEST_CASE("write bytes")
{
    TempDirectory dir;

    SECTION("the file holds exactly the bytes")
    {
        const auto path = dir.path() / "tile.png";
        CHECK(fetch::write_bytes(path, png_bytes()).has_value());
        CHECK(test_helpers::read_file(path) == png_bytes());
    }
    SECTION("a missing directory is a write error")
    {
        const auto written = fetch::write_bytes(dir.path() / "missing" / "tile.png", png_bytes());
        REQUIRE(!written.has_value());
        CHECK(written.error().kind() == fetch::HttpErrorKind::WriteFailed);
    }
    SECTION("an error while flushing on close is reported")
    {
        // /dev/full accepts the open and fails every write with ENOSPC
        if (!std::filesystem::exists("/dev/full"))
            return;
        const auto written = fetch::write_bytes("/dev/full", png_bytes());
        REQUIRE(!written.has_value());
        CHECK(written.error().kind() == fetch::HttpErrorKind::WriteFailed);
    }
}

TEST_CASE("http error description")
{
    CHECK(fetch::HttpError(fetch::HttpErrorKind::InvalidContent, 0, "missing png signature").description() == "invalid tile content (missing png signature)");
    CHECK(fetch::HttpError(fetch::HttpErrorKind::Status, 404).description() == "HTTP status 404");
    CHECK(fetch::HttpError(fetch::HttpErrorKind::Timeout, 0, "after 5000 ms").description() == "timed out (after 5000 ms)");
    CHECK(fetch::HttpError(fetch::HttpErrorKind::Timeout) == fetch::HttpErrorKind::Timeout);
    CHECK(fetch::to_string(fetch::FetchStatus::CopiedFromCache) == "copied from cache");
}
