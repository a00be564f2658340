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

#include <mutex>
#include <vector>

#include <catch2/catch.hpp>

#include "Exception.h"
#include "catch2_helpers.h"
#include "mock_http_client.h"
#include "reconciler.h"

using namespace std::literals;
using test_helpers::png_bytes;
using test_helpers::TempDirectory;
using reconcile::State;

namespace {
config::FetchConfig fast_config(unsigned max_attempts = 3, unsigned retry_max_attempts = 10)
{
    config::FetchConfig config;
    config.url_template = "http://tiles.test/{z}/{x}/{y}.png";
    config.backoff_base = 0ms;
    config.backoff_jitter = 0ms;
    config.max_attempts = max_attempts;
    config.retry_max_attempts = retry_max_attempts;
    return config::make_fetch_config(config);
}

config::ReconcileConfig reconcile_config(const std::filesystem::path& output_root, unsigned max_rounds = 3, unsigned workers = 4)
{
    config::ReconcileConfig config;
    config.output_root = output_root;
    config.max_rounds = max_rounds;
    config.workers = workers;
    return config::make_reconcile_config(config);
}

config::RenderConfig world(int max_zoom)
{
    return config::make_render_config("world", config::RenderType::Full, std::nullopt, coverage::ZoomRange::make(0, max_zoom));
}

class StateRecorder {
public:
    reconcile::StateObserver observer()
    {
        return [this](State state) {
            const std::scoped_lock lock(m_mutex);
            m_states.push_back(state);
        };
    }
    std::vector<State> states() const
    {
        const std::scoped_lock lock(m_mutex);
        return m_states;
    }

private:
    mutable std::mutex m_mutex;
    std::vector<State> m_states;
};
}

TEST_CASE("reconciler")
{
    TempDirectory dir;
    StateRecorder recorder;

    SECTION("complete store converges without fetching")
    {
        MockBackend backend([](const std::string&, unsigned) { return MockBackend::ok(png_bytes()); });
        reconcile::Reconciler reconciler(world(2), fast_config(), reconcile_config(dir.path()), backend.factory());
        reconciler.set_state_observer(recorder.observer());
        for (const auto& id : reconciler.plan())
            test_helpers::write_file(reconciler.store().tile_path(id), png_bytes());

        const auto result = reconciler.run();
        CHECK(result.converged());
        CHECK(result.rounds.size() == 1);
        CHECK(result.rounds.front().round == 0);
        CHECK(result.rounds.front().missing_after == 0);
        CHECK(result.fetch_calls == 0);
        CHECK(backend.requests() == 0);
        CHECK(backend.clients_created() == 0);
        CHECK(result.report.completion_rate == Approx(100.0));
        CHECK(recorder.states() == std::vector<State> { State::Planning, State::Converged });
    }
    SECTION("empty store converges after one round")
    {
        MockBackend backend([](const std::string&, unsigned) { return MockBackend::ok(png_bytes()); });
        reconcile::Reconciler reconciler(world(2), fast_config(), reconcile_config(dir.path()), backend.factory());
        reconciler.set_state_observer(recorder.observer());
        CHECK(reconciler.store().root() == dir.path() / "world");

        const auto result = reconciler.run();
        CHECK(result.state == State::Converged);
        REQUIRE(result.rounds.size() == 2);
        CHECK(result.rounds[0].missing_after == 21);
        CHECK(result.rounds[1].round == 1);
        CHECK(result.rounds[1].max_attempts == 3);
        CHECK(result.rounds[1].missing_before == 21);
        CHECK(result.rounds[1].attempted == 21);
        CHECK(result.rounds[1].succeeded == 21);
        CHECK(result.rounds[1].missing_after == 0);
        CHECK(result.fetch_calls == 21);
        CHECK(result.report.valid_count == 21);
        CHECK(recorder.states() == std::vector<State> { State::Planning, State::Fetching, State::Revalidating, State::Converged });
    }
    SECTION("a backend that never serves valid tiles is exhausted within the budget")
    {
        MockBackend backend([](const std::string&, unsigned) { return MockBackend::status(404); });
        reconcile::Reconciler reconciler(world(1), fast_config(), reconcile_config(dir.path(), 3), backend.factory());
        const auto result = reconciler.run();
        CHECK(result.state == State::Exhausted);
        CHECK(result.rounds.size() <= 4);
        CHECK(result.rounds.size() == 2); // the first round makes no progress
        CHECK(result.report.missing.size() == 5);
        CHECK(result.fetch_calls == 5 * 3);
        CHECK(result.report.valid_count == 0);
    }
    SECTION("html error pages are never accepted")
    {
        MockBackend backend([](const std::string&, unsigned) { return MockBackend::ok(test_helpers::html_bytes()); });
        reconcile::Reconciler reconciler(world(1), fast_config(1), reconcile_config(dir.path()), backend.factory());
        const auto result = reconciler.run();
        CHECK(result.state == State::Exhausted);
        CHECK(result.report.missing.size() == 5);
        for (const auto& id : reconciler.plan())
            CHECK(!std::filesystem::exists(reconciler.store().tile_path(id)));
    }
    SECTION("flaky tiles converge in the retry round")
    {
        // odd columns fail on their first request
        MockBackend backend([](const std::string& url, unsigned request_number) {
            const bool odd_column = url == "http://tiles.test/1/1/0.png" || url == "http://tiles.test/1/1/1.png";
            if (odd_column && request_number == 0)
                return MockBackend::status(503);
            return MockBackend::ok(png_bytes());
        });
        reconcile::Reconciler reconciler(world(1), fast_config(1, 10), reconcile_config(dir.path()), backend.factory());
        const auto result = reconciler.run();
        CHECK(result.state == State::Converged);
        REQUIRE(result.rounds.size() == 3);
        CHECK(result.rounds[1].failed == 2);
        CHECK(result.rounds[1].missing_after == 2);
        CHECK(result.rounds[2].max_attempts == 10);
        CHECK(result.rounds[2].missing_before == 2);
        CHECK(result.rounds[2].succeeded == 2);
        CHECK(result.fetch_calls == 5 + 2);
    }
    SECTION("round budget")
    {
        // tile (1, x, y) needs 2x + y failed requests before it is served, one request per round
        MockBackend backend([](const std::string& url, unsigned request_number) {
            unsigned threshold = 0;
            if (url == "http://tiles.test/1/0/1.png")
                threshold = 1;
            if (url == "http://tiles.test/1/1/0.png")
                threshold = 2;
            if (url == "http://tiles.test/1/1/1.png")
                threshold = 3;
            if (request_number < threshold)
                return MockBackend::status(500);
            return MockBackend::ok(png_bytes());
        });
        auto render_config = config::make_render_config("level1", config::RenderType::Full, std::nullopt, coverage::ZoomRange::make(1, 1));
        reconcile::Reconciler reconciler(render_config, fast_config(1, 1), reconcile_config(dir.path(), 2, 1), backend.factory());
        const auto result = reconciler.run();
        CHECK(result.state == State::Exhausted);
        REQUIRE(result.rounds.size() == 3);
        CHECK(result.rounds[0].missing_after == 4);
        CHECK(result.rounds[1].missing_after == 3);
        CHECK(result.rounds[2].missing_after == 2);
        CHECK(result.report.missing == std::vector<tile::Id> { { 1, { 1, 0 } }, { 1, { 1, 1 } } });
    }
    SECTION("cancellation during a round is partial")
    {
        std::stop_source stop_source;
        MockBackend backend([&](const std::string&, unsigned) {
            stop_source.request_stop();
            return MockBackend::ok(png_bytes());
        });
        reconcile::Reconciler reconciler(world(2), fast_config(), reconcile_config(dir.path(), 3, 1), backend.factory());
        reconciler.set_state_observer(recorder.observer());
        const auto result = reconciler.run(stop_source.get_token());
        CHECK(result.state == State::Partial);
        CHECK(result.rounds.size() == 2);
        CHECK(result.report.missing.size() == 20);
        CHECK(backend.requests() == 1);
        CHECK(recorder.states().back() == State::Partial);
    }
    SECTION("cancellation before the first round is partial")
    {
        std::stop_source stop_source;
        stop_source.request_stop();
        MockBackend backend([](const std::string&, unsigned) { return MockBackend::ok(png_bytes()); });
        reconcile::Reconciler reconciler(world(1), fast_config(), reconcile_config(dir.path()), backend.factory());
        const auto result = reconciler.run(stop_source.get_token());
        CHECK(result.state == State::Partial);
        CHECK(result.rounds.size() == 1);
        CHECK(backend.requests() == 0);
    }
    SECTION("round timeout is exhausted")
    {
        MockBackend backend([](const std::string&, unsigned) { return MockBackend::status(503); });
        auto fetch_config = fast_config();
        fetch_config.backoff_base = 60s;
        auto config = reconcile_config(dir.path(), 3, 2);
        config.round_timeout = 200ms;
        reconcile::Reconciler reconciler(world(2), fetch_config, config, backend.factory());
        const auto result = reconciler.run();
        CHECK(result.state == State::Exhausted);
        REQUIRE(result.rounds.size() == 2);
        CHECK(result.rounds[1].timed_out);
    }
    SECTION("invalid render config throws before any work")
    {
        config::RenderConfig broken;
        broken.name = "broken";
        MockBackend backend([](const std::string&, unsigned) { return MockBackend::ok(png_bytes()); });
        CHECK_THROWS_AS(reconcile::Reconciler(broken, fast_config(), reconcile_config(dir.path()), backend.factory()), ConfigurationError);
        CHECK(backend.clients_created() == 0);
        CHECK(!std::filesystem::exists(dir.path() / "broken"));
    }
}

TEST_CASE("reconciler summary")
{
    reconcile::Result result;
    result.state = State::Exhausted;
    result.report.expected_count = 5;
    result.report.valid_count = 2;
    result.report.completion_rate = 40.0;
    result.report.missing = { { 1, { 0, 0 } }, { 1, { 0, 1 } }, { 1, { 1, 0 } } };
    result.rounds.resize(3);
    result.fetch_calls = 17;

    const auto summary = reconcile::format_summary(result, 2);
    CHECK(summary.find("exhausted") != std::string::npos);
    CHECK(summary.find("Expected tiles: 5") != std::string::npos);
    CHECK(summary.find("Missing tiles:  3") != std::string::npos);
    CHECK(summary.find("Completion:     40.00%") != std::string::npos);
    CHECK(summary.find("Fetch rounds:   2") != std::string::npos);
    CHECK(summary.find("Missing (first 2 of 3)") != std::string::npos);
    CHECK(summary.find("1/0/1") != std::string::npos);
    CHECK(summary.find("1/1/0") == std::string::npos);

    CHECK(reconcile::format_summary(result, 0).find("Missing (") == std::string::npos);
    CHECK(reconcile::to_string(State::Partial) == "partial");
    CHECK(reconcile::is_terminal(State::Converged));
    CHECK(!reconcile::is_terminal(State::Fetching));
}
