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

#ifndef RECONCILER_H
#define RECONCILER_H

#include <chrono>
#include <cstdint>
#include <functional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

#include "config.h"
#include "coverage_plan.h"
#include "http_client.h"
#include "tile_store.h"

namespace reconcile {

enum class State {
    Planning,
    Fetching,
    Revalidating,
    Converged, // every planned tile is valid
    Partial, // cancelled before converging
    Exhausted // budget used up, deadline hit or no progress
};

[[nodiscard]] std::string_view to_string(State state);
[[nodiscard]] bool is_terminal(State state);

struct RoundRecord {
    unsigned round = 0; // 0 is the initial inspection
    unsigned max_attempts = 0;
    uint64_t missing_before = 0;
    uint64_t attempted = 0;
    uint64_t succeeded = 0;
    uint64_t failed = 0;
    uint64_t missing_after = 0;
    std::chrono::milliseconds duration = {};
    bool timed_out = false;
};

struct Result {
    State state = State::Planning;
    std::vector<RoundRecord> rounds;
    store::ValidationReport report;
    uint64_t fetch_calls = 0;

    [[nodiscard]] bool converged() const { return state == State::Converged; }
};

using StateObserver = std::function<void(State)>;

/// Drives inspection and fetch rounds until the store holds every planned tile, the round budget is
/// used up, a round makes no progress, or a stop is requested. Phases never overlap.
class Reconciler {
public:
    // Builds the coverage plan up front, so an unusable configuration throws before any file or network access.
    Reconciler(config::RenderConfig render_config, config::FetchConfig fetch_config, config::ReconcileConfig reconcile_config,
        fetch::HttpClientFactory client_factory);

    void set_state_observer(StateObserver observer);

    Result run(std::stop_token stop_token = {}) const;

    [[nodiscard]] const coverage::Plan& plan() const;
    [[nodiscard]] const store::TileStore& store() const;

private:
    void transition(State state) const;

    config::RenderConfig m_render_config;
    config::FetchConfig m_fetch_config;
    config::ReconcileConfig m_reconcile_config;
    fetch::HttpClientFactory m_client_factory;
    coverage::Plan m_plan;
    store::TileStore m_store;
    StateObserver m_observer;
};

// Console summary: counts, completion and at most missing_sample of the missing tiles.
[[nodiscard]] std::string format_summary(const Result& result, size_t missing_sample);

}

#endif // RECONCILER_H
