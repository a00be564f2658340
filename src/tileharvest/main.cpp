#include <chrono>
#include <csignal>
#include <stop_token>
#include <thread>

#include <fmt/core.h>

#include "Exception.h"
#include "config.h"
#include "coverage_plan.h"
#include "http_client.h"
#include "log.h"
#include "reconciler.h"
#include "report_json_writer.h"
#include "tile_fetcher.h"
#include "tile_store.h"
#include "cli.h"

using namespace std::literals;

namespace {
enum ExitCode {
    Converged = 0,
    ConfigurationFailure = 1,
    Exhausted = 2,
    Partial = 3
};

volatile std::sig_atomic_t g_interrupted = 0;

void signal_handler(int) {
    g_interrupted = 1;
}

// stop_source::request_stop is not async signal safe, so the handler only sets a flag that this thread forwards.
std::jthread start_interrupt_watcher(std::stop_source stop_source) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    return std::jthread([stop_source](std::stop_token watcher_stop) mutable {
        while (fetch::wait_for_or_stopped(100ms, watcher_stop)) {
            if (g_interrupted) {
                LOG_WARN("Interrupted, letting running downloads finish...");
                stop_source.request_stop();
                return;
            }
        }
    });
}

struct Configs {
    config::RenderConfig render;
    config::FetchConfig fetch;
    config::ReconcileConfig reconcile;
};

Configs make_configs(const cli::Args& args) {
    const auto render_type = config::parse_render_type(args.render_type);
    if (args.zoom.size() != 2)
        throw ConfigurationError("--zoom takes exactly two values: min_zoom max_zoom");
    const auto zoom_range = coverage::ZoomRange::make(args.zoom[0], args.zoom[1]);

    std::optional<coverage::BoundingBox> bbox;
    if (render_type == config::RenderType::Bbox) {
        if (args.bbox.size() != 4)
            throw ConfigurationError("--bbox takes exactly four values: min_lon min_lat max_lon max_lat");
        bbox = coverage::BoundingBox::from_degrees(args.bbox[0], args.bbox[1], args.bbox[2], args.bbox[3]);
    } else if (!args.bbox.empty()) {
        LOG_WARN("Ignoring --bbox for render type full.");
    }

    config::FetchConfig fetch;
    fetch.url_template = args.url_template;
    fetch.cache_template = args.cache_template;
    fetch.scheme = args.scheme == "tms" ? tile::Scheme::Tms : tile::Scheme::SlippyMap;
    fetch.timeout = config::milliseconds_from_seconds(args.timeout);
    fetch.backoff_base = config::milliseconds_from_seconds(args.backoff_base);
    fetch.backoff_jitter = config::milliseconds_from_seconds(args.backoff_jitter);
    fetch.max_attempts = args.max_attempts;
    fetch.retry_max_attempts = args.retry_max_attempts;

    config::ReconcileConfig reconcile;
    reconcile.output_root = args.output_root;
    reconcile.workers = args.workers;
    reconcile.max_rounds = args.max_rounds;
    if (args.round_timeout > 0)
        reconcile.round_timeout = config::milliseconds_from_seconds(args.round_timeout);
    reconcile.progress_bar = args.progress;

    return {config::make_render_config(args.name, render_type, bbox, zoom_range),
        config::make_fetch_config(fetch),
        config::make_reconcile_config(reconcile)};
}

int exit_code(reconcile::State state) {
    switch (state) {
    case reconcile::State::Converged:
        return ExitCode::Converged;
    case reconcile::State::Partial:
        return ExitCode::Partial;
    default:
        return ExitCode::Exhausted;
    }
}

void print_estimate(const config::RenderConfig& render_config, const coverage::Plan& plan) {
    fmt::print("Project \"{}\" ({})\n", render_config.name, config::to_string(render_config.render_type));
    for (const auto& level : plan.levels()) {
        fmt::print("  zoom {:>2}: columns {}-{}, rows {}-{}, {} tiles\n", level.zoom_level,
            level.range.min.x, level.range.max.x, level.range.min.y, level.range.max.y, level.count());
    }
    fmt::print("Total: {} tiles\n", plan.count());
}

int finish(const cli::Args& args, const reconcile::Result& result) {
    fmt::print("{}", reconcile::format_summary(result, args.missing_sample));
    if (args.report_json.has_value()) {
        // a report that cannot be written keeps the exit code of the run
        try {
            report_json_writer::write_to_file(args.report_json.value(), args.name, result);
            LOG_INFO("Report written to {}", args.report_json->string());
        } catch (const Exception& e) {
            LOG_ERROR("{}", e.what());
        }
    }
    return exit_code(result.state);
}

int run(const cli::Args& args) {
    Configs configs;
    coverage::Plan plan;
    try {
        configs = make_configs(args);
        plan = configs.render.coverage_plan();
    } catch (const ConfigurationError& e) {
        LOG_ERROR("Invalid configuration: {}", e.what());
        return ExitCode::ConfigurationFailure;
    }

    if (args.estimate) {
        print_estimate(configs.render, plan);
        return ExitCode::Converged;
    }

    if (args.check_only) {
        const auto tile_store = store::TileStore::for_project(configs.reconcile.output_root, configs.render.name);
        reconcile::Result result;
        result.report = store::report(plan, tile_store);
        result.state = result.report.missing.empty() ? reconcile::State::Converged : reconcile::State::Exhausted;
        return finish(args, result);
    }

    const auto user_agent = configs.fetch.user_agent;
    reconcile::Reconciler reconciler(configs.render, configs.fetch, configs.reconcile, fetch::curl_client_factory(user_agent));

    std::stop_source stop_source;
    auto interrupt_watcher = start_interrupt_watcher(stop_source);
    const auto result = reconciler.run(stop_source.get_token());
    interrupt_watcher.request_stop();

    return finish(args, result);
}
}

int main(int argc, char **argv) {
    const cli::Args args = cli::parse(argc, argv);

    try {
        Log::init(args.log_level, args.log_file);
        return run(args);
    } catch (const ConfigurationError& e) {
        LOG_ERROR("Invalid configuration: {}", e.what());
        return ExitCode::ConfigurationFailure;
    } catch (const std::exception& e) {
        LOG_FATAL("{}", e.what());
        return ExitCode::ConfigurationFailure;
    }
}
