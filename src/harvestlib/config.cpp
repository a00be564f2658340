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

#include "config.h"

#include <algorithm>
#include <cctype>
#include <cmath>

#include <fmt/core.h>

#include "Exception.h"

using namespace std::literals;

namespace {
constexpr unsigned max_attempts_limit = 30;
constexpr unsigned max_workers_limit = 64;
// with at most 30 attempts these keep base * 2^attempt + jitter * attempt far from overflowing
constexpr std::chrono::milliseconds max_timeout = 1h;
constexpr std::chrono::milliseconds max_backoff = 1h;
constexpr double max_seconds = 1e9;

bool char_equals_ignore_case(const char a, const char b)
{
    return std::tolower(std::char_traits<char>::to_int_type(a)) == std::tolower(std::char_traits<char>::to_int_type(b));
}
bool string_equals_ignore_case(const std::string_view& a, const std::string_view& b)
{
    return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), char_equals_ignore_case);
}

bool contains_any(std::string_view s, std::initializer_list<std::string_view> needles)
{
    return std::any_of(needles.begin(), needles.end(), [&](std::string_view needle) { return s.find(needle) != std::string_view::npos; });
}
}

config::RenderType config::parse_render_type(std::string_view s)
{
    if (string_equals_ignore_case(s, "bbox"))
        return RenderType::Bbox;
    if (string_equals_ignore_case(s, "full"))
        return RenderType::Full;
    throw ConfigurationError(fmt::format("unsupported render type \"{}\" (expected \"bbox\" or \"full\")", s));
}

std::string_view config::to_string(RenderType render_type)
{
    switch (render_type) {
    case RenderType::Bbox:
        return "bbox";
    case RenderType::Full:
        return "full";
    }
    throw Exception("Not implemented!");
}

coverage::Plan config::RenderConfig::coverage_plan() const
{
    switch (render_type) {
    case RenderType::Full:
        return coverage::plan_full(zoom_range);
    case RenderType::Bbox:
        // make_render_config guarantees the box, but a hand assembled config may lack it
        if (!bbox.has_value())
            throw ConfigurationError(fmt::format("Project \"{}\" uses render type bbox but has no bounding box.", name));
        return coverage::plan(bbox.value(), zoom_range);
    }
    throw Exception("Not implemented!");
}

std::chrono::milliseconds config::milliseconds_from_seconds(double seconds)
{
    if (!std::isfinite(seconds) || std::abs(seconds) > max_seconds)
        throw ConfigurationError(fmt::format("The duration {} s is out of range.", seconds));
    return std::chrono::milliseconds(std::llround(seconds * 1000.0));
}

config::RenderConfig config::make_render_config(const std::string& name, RenderType render_type,
    const std::optional<coverage::BoundingBox>& bbox, const coverage::ZoomRange& zoom_range)
{
    if (name.empty())
        throw ConfigurationError("The project name must not be empty.");
    if (name == "." || name == ".." || contains_any(name, { "/"sv, "\\"sv }))
        throw ConfigurationError(fmt::format("The project name \"{}\" must be a plain directory name.", name));
    if (render_type == RenderType::Bbox && !bbox.has_value())
        throw ConfigurationError("Render type bbox requires a bounding box.");

    RenderConfig config;
    config.name = name;
    config.render_type = render_type;
    config.bbox = render_type == RenderType::Bbox ? bbox : std::nullopt;
    config.zoom_range = zoom_range;
    return config;
}

config::FetchConfig config::make_fetch_config(FetchConfig config)
{
    if (config.url_template.empty())
        throw ConfigurationError("The tile url template must not be empty.");
    if (!contains_any(config.url_template, { "{z}"sv, "{zoom}"sv })
        || !contains_any(config.url_template, { "{x}"sv, "{col}"sv })
        || !contains_any(config.url_template, { "{y}"sv, "{row}"sv }))
        throw ConfigurationError(fmt::format("The tile url template \"{}\" needs zoom, column and row placeholders.", config.url_template));
    if (config.cache_template.has_value() && config.cache_template->empty())
        config.cache_template.reset();
    if (config.timeout <= 0ms || config.timeout > max_timeout)
        throw ConfigurationError(fmt::format("The per attempt timeout must be positive and at most {} s (got {} ms).",
            std::chrono::duration_cast<std::chrono::seconds>(max_timeout).count(), config.timeout.count()));
    if (config.backoff_base < 0ms || config.backoff_jitter < 0ms)
        throw ConfigurationError("Backoff durations must not be negative.");
    if (config.backoff_base > max_backoff || config.backoff_jitter > max_backoff)
        throw ConfigurationError(fmt::format("Backoff durations must be at most {} s.", std::chrono::duration_cast<std::chrono::seconds>(max_backoff).count()));
    if (config.max_attempts < 1 || config.max_attempts > max_attempts_limit)
        throw ConfigurationError(fmt::format("max attempts must be between 1 and {} (got {}).", max_attempts_limit, config.max_attempts));
    if (config.retry_max_attempts < 1 || config.retry_max_attempts > max_attempts_limit)
        throw ConfigurationError(fmt::format("retry max attempts must be between 1 and {} (got {}).", max_attempts_limit, config.retry_max_attempts));
    return config;
}

config::ReconcileConfig config::make_reconcile_config(ReconcileConfig config)
{
    if (config.output_root.empty())
        throw ConfigurationError("The output root must not be empty.");
    if (config.max_rounds < 1)
        throw ConfigurationError("At least one reconciliation round is required.");
    if (config.workers < 1 || config.workers > max_workers_limit)
        throw ConfigurationError(fmt::format("The worker count must be between 1 and {} (got {}).", max_workers_limit, config.workers));
    if (config.round_timeout.has_value() && config.round_timeout.value() <= 0ms)
        throw ConfigurationError("The round timeout must be positive.");
    return config;
}
