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

#ifndef CONFIG_H
#define CONFIG_H

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "coverage_plan.h"
#include "tile.h"

// Validated settings of a harvest run. The make_* factories check every value once and throw
// ConfigurationError; code receiving one of these structs does not re-check them.
namespace config {

enum class RenderType {
    Bbox, // tiles covering the bounding box
    Full // the whole world on every zoom level
};

[[nodiscard]] RenderType parse_render_type(std::string_view s);
[[nodiscard]] std::string_view to_string(RenderType render_type);

struct RenderConfig {
    std::string name;
    RenderType render_type = RenderType::Bbox;
    std::optional<coverage::BoundingBox> bbox;
    coverage::ZoomRange zoom_range = coverage::ZoomRange::make(0, 0);

    [[nodiscard]] coverage::Plan coverage_plan() const;
};

struct FetchConfig {
    std::string url_template = "http://localhost/tile/{z}/{x}/{y}.png";
    std::optional<std::string> cache_template;
    tile::Scheme scheme = tile::Scheme::SlippyMap; // row numbering of the endpoint
    std::chrono::milliseconds timeout { 30'000 };
    std::chrono::milliseconds backoff_base { 500 };
    std::chrono::milliseconds backoff_jitter { 100 };
    unsigned max_attempts = 3;
    unsigned retry_max_attempts = 10;
    std::string user_agent = "tileharvest/1.0";
};

struct ReconcileConfig {
    std::filesystem::path output_root = "tiles";
    unsigned max_rounds = 3;
    unsigned workers = 4;
    std::optional<std::chrono::milliseconds> round_timeout;
    bool progress_bar = false;
};

// Converts a duration given in seconds on the command line. Throws ConfigurationError for values that are not finite or too large to represent.
[[nodiscard]] std::chrono::milliseconds milliseconds_from_seconds(double seconds);

[[nodiscard]] RenderConfig make_render_config(const std::string& name, RenderType render_type,
    const std::optional<coverage::BoundingBox>& bbox, const coverage::ZoomRange& zoom_range);

[[nodiscard]] FetchConfig make_fetch_config(FetchConfig config);

[[nodiscard]] ReconcileConfig make_reconcile_config(ReconcileConfig config);

}

#endif // CONFIG_H
