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

#include "reconciler.h"

#include <algorithm>

#include <fmt/core.h>

#include "log.h"
#include "parallel_fetcher.h"

using namespace reconcile;

namespace {
using Clock = std::chrono::steady_clock;

std::chrono::milliseconds elapsed_since(Clock::time_point t0)
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - t0);
}

void log_report(const store::ValidationReport& report)
{
    for (const auto& level : report.levels) {
        LOG_INFO("Zoom {:>2}: {}/{} valid ({:.2f}%), {} missing",
            level.zoom_level, level.valid_count, level.expected_count, level.completion_rate, level.missing_count);
    }
    LOG_INFO("Total: {} expected, {} valid in store, {} missing ({:.2f}%)",
        report.expected_count, report.valid_count, report.missing.size(), report.completion_rate);
}
}

std::string_view reconcile::to_string(State state)
{
    switch (state) {
    case State::Planning:
        return "planning";
    case State::Fetching:
        return "fetching";
    case State::Revalidating:
        return "revalidating";
    case State::Converged:
        return "converged";
    case State::Partial:
        return "partial";
    case State::Exhausted:
        return "exhausted";
    }
    return "unknown";
}

bool reconcile::is_terminal(State state)
{
    return state == State::Converged || state == State::Partial || state == State::Exhausted;
}

Reconciler::Reconciler(config::RenderConfig render_config, config::FetchConfig fetch_config, config::ReconcileConfig reconcile_config,
    fetch::HttpClientFactory client_factory)
    : m_render_config(std::move(render_config))
    , m_fetch_config(std::move(fetch_config))
    , m_reconcile_config(std::move(reconcile_config))
    , m_client_factory(std::move(client_factory))
    , m_plan(m_render_config.coverage_plan())
    , m_store(store::TileStore::for_project(m_reconcile_config.output_root, m_render_config.name))
{
}

void Reconciler::set_state_observer(StateObserver observer)
{
    m_observer = std::move(observer);
}

const coverage::Plan& Reconciler::plan() const
{
    return m_plan;
}

const store::TileStore& Reconciler::store() const
{
    return m_store;
}

void Reconciler::transition(State state) const
{
    LOG_DEBUG("Reconciler state: {}", to_string(state));
    if (m_observer)
        m_observer(state);
}

Result Reconciler::run(std::stop_token stop_token) const
{
    Result result;
    const auto finish = [&](State state) {
        result.state = state;
        transition(state);
        return result;
    };

    transition(State::Planning);
    LOG_INFO("Project \"{}\" ({}): {} tiles planned on zoom levels {}-{}, store at {}",
        m_render_config.name, config::to_string(m_render_config.render_type), m_plan.count(),
        m_render_config.zoom_range.min_zoom(), m_render_config.zoom_range.max_zoom(), m_store.root().string());

    auto t0 = Clock::now();
    result.report = store::report(m_plan, m_store);
    result.rounds.push_back({ 0, 0, result.report.expected_count, 0, 0, 0, result.report.missing.size(), elapsed_since(t0), false });
    log_report(result.report);

    if (result.report.missing.empty()) {
        LOG_INFO("All {} tiles are present, nothing to fetch.", result.report.expected_count);
        return finish(State::Converged);
    }
    if (stop_token.stop_requested())
        return finish(State::Partial);

    const fetch::ParallelFetcher fetcher(m_fetch_config, m_client_factory, m_reconcile_config.workers);
    for (unsigned round = 1; round <= m_reconcile_config.max_rounds; ++round) {
        transition(State::Fetching);
        const unsigned max_attempts = round == 1 ? m_fetch_config.max_attempts : m_fetch_config.retry_max_attempts;
        const uint64_t missing_before = result.report.missing.size();
        LOG_INFO("Round {}/{}: fetching {} missing tiles with up to {} attempts each using {} workers.",
            round, m_reconcile_config.max_rounds, missing_before, max_attempts, m_reconcile_config.workers);

        t0 = Clock::now();
        std::optional<Clock::time_point> deadline;
        if (m_reconcile_config.round_timeout.has_value())
            deadline = t0 + m_reconcile_config.round_timeout.value();
        const auto outcome = fetcher.run(result.report.missing, m_store, max_attempts, stop_token, deadline, m_reconcile_config.progress_bar);
        result.fetch_calls += outcome.fetch_calls;

        transition(State::Revalidating);
        result.report = store::report(m_plan, m_store);
        result.rounds.push_back({ round, max_attempts, missing_before, outcome.succeeded + outcome.failed, outcome.succeeded, outcome.failed,
            result.report.missing.size(), elapsed_since(t0), outcome.timed_out });
        LOG_INFO("Round {} finished in {} ms: {} succeeded, {} failed, {} not attempted.",
            round, result.rounds.back().duration.count(), outcome.succeeded, outcome.failed, outcome.not_attempted);
        log_report(result.report);

        if (result.report.missing.empty())
            return finish(State::Converged);
        if (stop_token.stop_requested()) {
            LOG_WARN("Cancelled with {} tiles missing.", result.report.missing.size());
            return finish(State::Partial);
        }
        if (outcome.timed_out) {
            LOG_WARN("Round {} exceeded its time limit of {} ms.", round, m_reconcile_config.round_timeout.value_or(std::chrono::milliseconds(0)).count());
            return finish(State::Exhausted);
        }
        if (result.report.missing.size() >= missing_before) {
            LOG_WARN("Round {} made no progress, {} tiles are still missing.", round, result.report.missing.size());
            return finish(State::Exhausted);
        }
    }

    LOG_WARN("Round budget of {} used up, {} tiles are still missing.", m_reconcile_config.max_rounds, result.report.missing.size());
    return finish(State::Exhausted);
}

std::string reconcile::format_summary(const Result& result, size_t missing_sample)
{
    const auto& report = result.report;
    std::string summary = fmt::format("State:          {}\n", to_string(result.state));
    summary += fmt::format("Expected tiles: {}\n", report.expected_count);
    summary += fmt::format("Valid tiles:    {}\n", report.valid_count);
    summary += fmt::format("Missing tiles:  {}\n", report.missing.size());
    summary += fmt::format("Completion:     {:.2f}%\n", report.completion_rate);
    summary += fmt::format("Fetch rounds:   {}\n", result.rounds.empty() ? 0 : result.rounds.size() - 1);
    summary += fmt::format("Fetch calls:    {}\n", result.fetch_calls);

    if (!report.missing.empty() && missing_sample > 0) {
        const size_t n = std::min(missing_sample, report.missing.size());
        summary += fmt::format("Missing (first {} of {}):\n", n, report.missing.size());
        for (size_t i = 0; i < n; ++i)
            summary += fmt::format("  {}\n", tile::to_string(report.missing[i]));
    }
    return summary;
}
