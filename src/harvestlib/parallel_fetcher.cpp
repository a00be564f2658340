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

#include "parallel_fetcher.h"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <exception>
#include <mutex>
#include <thread>

#include "ProgressIndicator.h"
#include "log.h"

using namespace fetch;

ParallelFetcher::ParallelFetcher(config::FetchConfig config, HttpClientFactory client_factory, unsigned workers)
    : m_config(std::move(config))
    , m_client_factory(std::move(client_factory))
    , m_workers(std::max(1u, workers))
{
}

RoundOutcome ParallelFetcher::run(const std::vector<tile::Id>& tiles, const store::TileStore& store, unsigned max_attempts,
    std::stop_token stop_token, std::optional<Clock::time_point> deadline, bool progress_bar) const
{
    RoundOutcome round;
    round.outcomes.reserve(tiles.size());
    for (const auto& id : tiles)
        round.outcomes.push_back({ id, {}, false });
    if (tiles.empty())
        return round;

    std::stop_source round_stop;
    std::stop_callback forward_stop(stop_token, [&round_stop]() { round_stop.request_stop(); });
    std::atomic<bool> deadline_passed = false;
    const auto past_deadline = [&deadline]() { return deadline.has_value() && Clock::now() >= deadline.value(); };

    // ends in-flight backoff waits once the deadline passes
    std::jthread watchdog;
    if (deadline.has_value()) {
        watchdog = std::jthread([&, deadline_value = deadline.value()](std::stop_token watchdog_stop) {
            std::mutex mutex;
            std::condition_variable_any cv;
            std::unique_lock lock(mutex);
            cv.wait_until(lock, watchdog_stop, deadline_value, [] { return false; });
            if (!watchdog_stop.stop_requested()) {
                deadline_passed = true;
                round_stop.request_stop();
            }
        });
    }

    auto pi = ProgressIndicator(tiles.size());
    std::jthread monitoring_thread;
    if (progress_bar)
        monitoring_thread = pi.startMonitoring();

    std::atomic<size_t> next_index = 0;
    std::mutex error_mutex;
    std::exception_ptr worker_error;

    const auto work = [&]() {
        try {
            auto client = m_client_factory();
            TileFetcher fetcher(m_config, *client);
            const auto token = round_stop.get_token();
            while (!token.stop_requested()) {
                if (past_deadline()) {
                    deadline_passed = true;
                    break;
                }
                const size_t i = next_index++;
                if (i >= tiles.size())
                    break;
                auto& outcome = round.outcomes[i];
                outcome.result = fetcher.fetch(outcome.tile_id, store.tile_path(outcome.tile_id), max_attempts, token);
                outcome.attempted = true;
                pi.taskFinished();
            }
        } catch (const std::exception& e) {
            LOG_ERROR("Fetch worker failed: {}", e.what());
            const std::scoped_lock lock(error_mutex);
            if (!worker_error)
                worker_error = std::current_exception();
            round_stop.request_stop();
        }
    };

    const auto n_workers = unsigned(std::min<size_t>(m_workers, tiles.size()));
    std::vector<std::jthread> workers;
    workers.reserve(n_workers);
    for (unsigned i = 0; i < n_workers; ++i)
        workers.emplace_back(work);
    for (auto& worker : workers)
        worker.join();

    if (watchdog.joinable()) {
        watchdog.request_stop();
        watchdog.join();
    }
    if (monitoring_thread.joinable()) {
        monitoring_thread.request_stop();
        monitoring_thread.join();
    }

    if (worker_error)
        std::rethrow_exception(worker_error);

    for (const auto& outcome : round.outcomes) {
        round.fetch_calls += outcome.result.attempts;
        if (!outcome.attempted || (outcome.result.status == FetchStatus::Cancelled && outcome.result.attempts == 0))
            ++round.not_attempted;
        else if (outcome.result.ok())
            ++round.succeeded;
        else
            ++round.failed;
    }
    round.cancelled = stop_token.stop_requested();
    round.timed_out = deadline_passed;
    return round;
}
