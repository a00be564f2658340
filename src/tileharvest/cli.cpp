#include <CLI/CLI.hpp>

#include "cli.h"

using namespace cli;

Args cli::parse(int argc, const char * const* argv) {
    CLI::App app{"Tile Harvest"};
    app.set_config("--config", "", "Read options from a TOML or INI file (keys are the long option names)");

    std::string name;
    app.add_option("--name", name, "Project name, tiles are stored in <output-root>/<name>")
        ->required();

    std::string render_type = "bbox";
    app.add_option("--render-type", render_type, "Tiles covering the bounding box or the whole world")
        ->check(CLI::IsMember({"bbox", "full"}, CLI::ignore_case))
        ->capture_default_str();

    std::vector<double> bbox;
    app.add_option("--bbox", bbox, "Bounding box in degrees: min_lon min_lat max_lon max_lat")
        ->expected(4)
        ->delimiter(',');

    std::vector<int> zoom = {0, 12};
    app.add_option("--zoom", zoom, "Zoom range: min_zoom max_zoom")
        ->expected(2)
        ->delimiter(',')
        ->capture_default_str();

    std::filesystem::path output_root = "tiles";
    app.add_option("--output-root", output_root, "Root directory of the tile store")
        ->capture_default_str();

    std::string url_template = "http://localhost/tile/{z}/{x}/{y}.png";
    app.add_option("--url-template", url_template, "Tile url with {z}, {x} and {y} placeholders")
        ->capture_default_str();

    std::string cache_template;
    app.add_option("--cache-template", cache_template, "Local cache path with {z}, {x} and {y} placeholders, checked before the network");

    std::string scheme = "xyz";
    app.add_option("--scheme", scheme, "Row numbering of the tile endpoint")
        ->check(CLI::IsMember({"xyz", "tms"}, CLI::ignore_case))
        ->capture_default_str();

    unsigned max_attempts = 3;
    app.add_option("--max-attempts", max_attempts, "Attempts per tile in the first round")
        ->check(CLI::PositiveNumber)
        ->capture_default_str();

    unsigned retry_max_attempts = 10;
    app.add_option("--retry-max-attempts", retry_max_attempts, "Attempts per tile in later rounds")
        ->check(CLI::PositiveNumber)
        ->capture_default_str();

    double timeout = 30;
    app.add_option("--timeout", timeout, "Timeout of a single request in seconds")
        ->check(CLI::PositiveNumber)
        ->capture_default_str();

    double backoff_base = 0.5;
    app.add_option("--backoff-base", backoff_base, "Base of the exponential backoff in seconds")
        ->check(CLI::NonNegativeNumber)
        ->capture_default_str();

    double backoff_jitter = 0.1;
    app.add_option("--backoff-jitter", backoff_jitter, "Linear backoff increment per attempt in seconds")
        ->check(CLI::NonNegativeNumber)
        ->capture_default_str();

    unsigned workers = 4;
    app.add_option("--workers", workers, "Number of concurrent downloads")
        ->check(CLI::Range(1, 64))
        ->capture_default_str();

    unsigned max_rounds = 3;
    app.add_option("--max-rounds", max_rounds, "Maximum number of fetch rounds")
        ->check(CLI::PositiveNumber)
        ->capture_default_str();

    double round_timeout = 0;
    app.add_option("--round-timeout", round_timeout, "Wall clock limit of a fetch round in seconds, 0 for none")
        ->check(CLI::NonNegativeNumber)
        ->capture_default_str();

    size_t missing_sample = 10;
    app.add_option("--missing-sample", missing_sample, "Number of missing tiles listed in the summary")
        ->capture_default_str();

    spdlog::level::level_enum log_level = spdlog::level::level_enum::info;
    const std::map<std::string, spdlog::level::level_enum> log_level_names{
        {"off", spdlog::level::level_enum::off},
        {"critical", spdlog::level::level_enum::critical},
        {"error", spdlog::level::level_enum::err},
        {"warn", spdlog::level::level_enum::warn},
        {"info", spdlog::level::level_enum::info},
        {"debug", spdlog::level::level_enum::debug},
        {"trace", spdlog::level::level_enum::trace}};
    app.add_option("--verbosity", log_level, "Verbosity level of logging")
        ->transform(CLI::CheckedTransformer(log_level_names, CLI::ignore_case));

    std::filesystem::path log_file;
    app.add_option("--log-file", log_file, "Additionally append the log to this file");

    std::filesystem::path report_json;
    app.add_option("--report-json", report_json, "Write the final report as json to this file");

    bool check_only = false;
    app.add_flag("--check-only", check_only, "Inspect the tile store and report, without fetching");

    bool estimate = false;
    app.add_flag("--estimate", estimate, "Print the number of planned tiles per zoom level and exit");

    bool progress = false;
    app.add_flag("--progress", progress, "Show a progress bar on the console during fetch rounds");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError &e) {
        exit(app.exit(e));
    }

    Args args;
    args.name = name;
    args.render_type = render_type;
    args.bbox = bbox;
    args.zoom = zoom;
    args.output_root = output_root;
    args.url_template = url_template;
    if (!cache_template.empty()) {
        args.cache_template = cache_template;
    }
    args.scheme = scheme;
    args.max_attempts = max_attempts;
    args.retry_max_attempts = retry_max_attempts;
    args.timeout = timeout;
    args.backoff_base = backoff_base;
    args.backoff_jitter = backoff_jitter;
    args.workers = workers;
    args.max_rounds = max_rounds;
    args.round_timeout = round_timeout;
    args.missing_sample = missing_sample;
    args.log_level = log_level;
    if (!log_file.empty()) {
        args.log_file = log_file;
    }
    if (!report_json.empty()) {
        args.report_json = report_json;
    }
    args.check_only = check_only;
    args.estimate = estimate;
    args.progress = progress;

    return args;
}
