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

#ifndef COVERAGEPLAN_H
#define COVERAGEPLAN_H

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>
#include <vector>

#include "tile.h"

namespace coverage {

inline constexpr unsigned max_zoom_level = 20;

/// Geographic rectangle in degrees. Can only be obtained through from_degrees, which
/// rejects inverted, degenerate and out of range boxes.
class BoundingBox {
public:
    [[nodiscard]] static BoundingBox from_degrees(double min_lon, double min_lat, double max_lon, double max_lat);

    [[nodiscard]] double min_lon() const { return m_bounds.min.x; }
    [[nodiscard]] double min_lat() const { return m_bounds.min.y; }
    [[nodiscard]] double max_lon() const { return m_bounds.max.x; }
    [[nodiscard]] double max_lat() const { return m_bounds.max.y; }

    bool operator==(const BoundingBox& other) const = default;

private:
    explicit BoundingBox(const tile::Aabb<double>& bounds) : m_bounds(bounds) {}

    tile::Aabb<double> m_bounds; // x = longitude, y = latitude
};

class ZoomRange {
public:
    [[nodiscard]] static ZoomRange make(int min_zoom, int max_zoom);

    [[nodiscard]] unsigned min_zoom() const { return m_min; }
    [[nodiscard]] unsigned max_zoom() const { return m_max; }
    [[nodiscard]] unsigned size() const { return m_max - m_min + 1; }

    bool operator==(const ZoomRange& other) const = default;

private:
    ZoomRange(unsigned min_zoom, unsigned max_zoom) : m_min(min_zoom), m_max(max_zoom) {}

    unsigned m_min;
    unsigned m_max;
};

struct LevelCoverage {
    unsigned zoom_level;
    tile::Range range;

    [[nodiscard]] uint64_t count() const { return tile::count(range); }
    bool operator==(const LevelCoverage& other) const = default;
};

/// The tiles required per zoom level, as one dense rectangle per level.
/// Iterating yields every tile::Id (zoom, then column, then row) without materialising them,
/// and can be repeated any number of times with the same result.
class Plan {
public:
    class const_iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = tile::Id;
        using difference_type = std::ptrdiff_t;
        using pointer = const tile::Id*;
        using reference = tile::Id;

        const_iterator() = default;
        const_iterator(const std::vector<LevelCoverage>* levels, size_t level_index);

        reference operator*() const;
        const_iterator& operator++();
        const_iterator operator++(int);
        bool operator==(const const_iterator& other) const;

    private:
        const std::vector<LevelCoverage>* m_levels = nullptr;
        size_t m_level_index = 0;
        glm::uvec2 m_coords = {};
    };

    Plan() = default;
    explicit Plan(std::vector<LevelCoverage> levels);

    [[nodiscard]] const std::vector<LevelCoverage>& levels() const;
    [[nodiscard]] std::optional<LevelCoverage> level(unsigned zoom_level) const;
    [[nodiscard]] uint64_t count() const;
    [[nodiscard]] uint64_t level_count(unsigned zoom_level) const;
    [[nodiscard]] bool contains(const tile::Id& tile_id) const;

    [[nodiscard]] const_iterator begin() const;
    [[nodiscard]] const_iterator end() const;

    bool operator==(const Plan& other) const = default;

private:
    std::vector<LevelCoverage> m_levels;
};

// Dense rectangle covering the bounding box on every level of the zoom range, clipped to the grid.
// Throws ConfigurationError if the projected corners are not finite or the rectangle ends up inverted.
[[nodiscard]] Plan plan(const BoundingBox& bbox, const ZoomRange& zoom_range);

// The whole 2^z x 2^z grid on every level.
[[nodiscard]] Plan plan_full(const ZoomRange& zoom_range);

}

#endif // COVERAGEPLAN_H
