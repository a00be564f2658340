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

#include "coverage_plan.h"

#include <algorithm>
#include <cmath>
#include <numeric>

#include <fmt/core.h>

#include "Exception.h"
#include "mercator.h"

using namespace coverage;

BoundingBox BoundingBox::from_degrees(double min_lon, double min_lat, double max_lon, double max_lat)
{
    const auto describe = [&]() {
        return fmt::format("[min_lon={}, min_lat={}, max_lon={}, max_lat={}]", min_lon, min_lat, max_lon, max_lat);
    };

    for (const double v : { min_lon, min_lat, max_lon, max_lat }) {
        if (!std::isfinite(v))
            throw ConfigurationError(fmt::format("Bounding box {} contains a non finite value.", describe()));
    }
    if (min_lon < -180.0 || max_lon > 180.0)
        throw ConfigurationError(fmt::format("Bounding box {} exceeds the longitude range [-180, 180].", describe()));
    if (min_lat < -90.0 || max_lat > 90.0)
        throw ConfigurationError(fmt::format("Bounding box {} exceeds the latitude range [-90, 90].", describe()));
    if (!(min_lon < max_lon))
        throw ConfigurationError(fmt::format("Bounding box {} requires min_lon < max_lon.", describe()));
    if (!(min_lat < max_lat))
        throw ConfigurationError(fmt::format("Bounding box {} requires min_lat < max_lat.", describe()));

    return BoundingBox({ { min_lon, min_lat }, { max_lon, max_lat } });
}

ZoomRange ZoomRange::make(int min_zoom, int max_zoom)
{
    if (min_zoom < 0 || max_zoom > int(max_zoom_level))
        throw ConfigurationError(fmt::format("Zoom levels must be between 0 and {} (got {} - {}).", max_zoom_level, min_zoom, max_zoom));
    if (min_zoom > max_zoom)
        throw ConfigurationError(fmt::format("Minimum zoom {} is larger than maximum zoom {}.", min_zoom, max_zoom));
    return { unsigned(min_zoom), unsigned(max_zoom) };
}

Plan::const_iterator::const_iterator(const std::vector<LevelCoverage>* levels, size_t level_index)
    : m_levels(levels)
    , m_level_index(level_index)
{
    if (m_level_index < m_levels->size())
        m_coords = (*m_levels)[m_level_index].range.min;
}

Plan::const_iterator::reference Plan::const_iterator::operator*() const
{
    return { (*m_levels)[m_level_index].zoom_level, m_coords, tile::Scheme::SlippyMap };
}

Plan::const_iterator& Plan::const_iterator::operator++()
{
    const auto& range = (*m_levels)[m_level_index].range;
    // rows first, so that one column directory is completed before the next one is touched
    if (m_coords.y < range.max.y) {
        ++m_coords.y;
        return *this;
    }
    m_coords.y = range.min.y;
    if (m_coords.x < range.max.x) {
        ++m_coords.x;
        return *this;
    }
    ++m_level_index;
    m_coords = m_level_index < m_levels->size() ? (*m_levels)[m_level_index].range.min : glm::uvec2 {};
    return *this;
}

Plan::const_iterator Plan::const_iterator::operator++(int)
{
    auto copy = *this;
    ++(*this);
    return copy;
}

bool Plan::const_iterator::operator==(const const_iterator& other) const
{
    return m_levels == other.m_levels && m_level_index == other.m_level_index && m_coords == other.m_coords;
}

Plan::Plan(std::vector<LevelCoverage> levels)
    : m_levels(std::move(levels))
{
    std::sort(m_levels.begin(), m_levels.end(), [](const LevelCoverage& a, const LevelCoverage& b) { return a.zoom_level < b.zoom_level; });
}

const std::vector<LevelCoverage>& Plan::levels() const
{
    return m_levels;
}

std::optional<LevelCoverage> Plan::level(unsigned zoom_level) const
{
    const auto iter = std::find_if(m_levels.begin(), m_levels.end(), [=](const LevelCoverage& l) { return l.zoom_level == zoom_level; });
    if (iter == m_levels.end())
        return std::nullopt;
    return *iter;
}

uint64_t Plan::count() const
{
    return std::accumulate(m_levels.begin(), m_levels.end(), uint64_t(0), [](uint64_t sum, const LevelCoverage& l) { return sum + l.count(); });
}

uint64_t Plan::level_count(unsigned zoom_level) const
{
    const auto l = level(zoom_level);
    return l.has_value() ? l->count() : 0;
}

bool Plan::contains(const tile::Id& tile_id) const
{
    const auto l = level(tile_id.zoom_level);
    if (!l.has_value())
        return false;
    const auto coords = tile_id.to(tile::Scheme::SlippyMap).coords;
    return glm::all(glm::greaterThanEqual(coords, l->range.min)) && glm::all(glm::lessThanEqual(coords, l->range.max));
}

Plan::const_iterator Plan::begin() const
{
    return { &m_levels, 0 };
}

Plan::const_iterator Plan::end() const
{
    return { &m_levels, m_levels.size() };
}

Plan coverage::plan(const BoundingBox& bbox, const ZoomRange& zoom_range)
{
    std::vector<LevelCoverage> levels;
    levels.reserve(zoom_range.size());
    for (unsigned z = zoom_range.min_zoom(); z <= zoom_range.max_zoom(); ++z) {
        // rows grow southwards, so the northern edge gives the smallest row
        const glm::dvec2 north_west = mercator::project(bbox.max_lat(), bbox.min_lon(), z);
        const glm::dvec2 south_east = mercator::project(bbox.min_lat(), bbox.max_lon(), z);
        if (!std::isfinite(north_west.x) || !std::isfinite(north_west.y) || !std::isfinite(south_east.x) || !std::isfinite(south_east.y))
            throw ConfigurationError(fmt::format("Projecting the bounding box at zoom level {} gives non finite tile coordinates.", z));

        const double last = double(tile::n_tiles(z) - 1);
        const auto clip = [last](double v) { return unsigned(std::clamp(v, 0.0, last)); };
        const tile::Range range = { { clip(north_west.x), clip(north_west.y) }, { clip(south_east.x), clip(south_east.y) } };
        if (range.min.x > range.max.x || range.min.y > range.max.y)
            throw ConfigurationError(fmt::format("Bounding box gives an inverted tile rectangle at zoom level {} (columns {}-{}, rows {}-{}).",
                z, range.min.x, range.max.x, range.min.y, range.max.y));

        levels.push_back({ z, range });
    }
    return Plan(std::move(levels));
}

Plan coverage::plan_full(const ZoomRange& zoom_range)
{
    std::vector<LevelCoverage> levels;
    levels.reserve(zoom_range.size());
    for (unsigned z = zoom_range.min_zoom(); z <= zoom_range.max_zoom(); ++z) {
        const unsigned last = tile::n_tiles(z) - 1;
        levels.push_back({ z, { { 0, 0 }, { last, last } } });
    }
    return Plan(std::move(levels));
}
