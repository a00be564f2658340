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

#ifndef PARALLELFETCHER_H
#define PARALLELFETCHER_H

#include <chrono>
#include <optional>
#include <stop_token>
#include <vector>

#include "config.h"
#include "http_client.h"
#include "tile.h"
#include "tile_fetcher.h"
#include "tile_store.h"

namespace fetch {

struct TileOutcome {
    tile::Id tile_id;
    FetchResult result;
    bool attempted = false;
};

struct RoundOutcome {
    std::vector<TileOutcome> outcomes; // same order as the requested tiles
    uint64_t succeeded = 0;
    uint64_t failed = 0;
    uint64_t not_attempted = 0;
    uint64_t fetch_calls = 0; // network attempts, cache copies do not count
    bool timed_out = false;
    bool cancelled = false;
};

/// Fetches a batch of tiles with a bounded pool of worker threads. Every worker owns a client from the
/// factory and pulls the next tile from a shared counter, so each tile is handled by exactly one worker.
class ParallelFetcher {
public:
    using Clock = std::chrono::steady_clock;

    ParallelFetcher(config::FetchConfig config, HttpClientFactory client_factory, unsigned workers);

    // No new tile is started after a stop request or after the deadline. Exceptions thrown inside a
    // worker are rethrown here once all workers have joined.
    RoundOutcome run(const std::vector<tile::Id>& tiles, const store::TileStore& store, unsigned max_attempts,
        std::stop_token stop_token = {}, std::optional<Clock::time_point> deadline = std::nullopt, bool progress_bar = false) const;

private:
    config::FetchConfig m_config;
    HttpClientFactory m_client_factory;
    unsigned m_workers;
};

}

#endif // PARALLELFETCHER_H
