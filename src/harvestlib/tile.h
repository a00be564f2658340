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

#pragma once

#include <cstdint>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>
#include <tuple>

#include <glm/glm.hpp>

namespace tile {
/// A representation of an extent
template <class T>
class Aabb {
public:
    glm::tvec2<T> min = {};
    glm::tvec2<T> max = {};

    bool operator==(const Aabb<T>& other) const = default;

    T width() const { return max.x - min.x; }
    T height() const { return max.y - min.y; }
};

// Inclusive column (x) / row (y) rectangle of one zoom level.
using Range = Aabb<unsigned>;

[[nodiscard]] inline uint64_t count(const Range& range)
{
    return uint64_t(range.width() + 1) * uint64_t(range.height() + 1);
}

// Number of tiles along one axis at the given zoom level.
[[nodiscard]] constexpr unsigned n_tiles(unsigned zoom_level) { return 1u << zoom_level; }

// The difference between TMS and slippyMap is whether y starts counting from the bottom (south) or top (north).
// https://www.maptiler.com/google-maps-coordinates-tile-bounds-projection/#1/-16.88/79.02
//
enum class Scheme {
    Tms, // southern most tile is y = 0
    SlippyMap // aka Google, XYZ, webmap tiles; northern most tile is y = 0
};

struct Id {
    unsigned zoom_level = unsigned(-1);
    glm::uvec2 coords; // x = column, y = row
    Scheme scheme = Scheme::SlippyMap;

    [[nodiscard]] Id to(Scheme new_scheme) const
    {
        if (scheme == new_scheme)
            return *this;

        const auto coord_y = n_tiles(zoom_level) - coords.y - 1;
        return { zoom_level, { coords.x, coord_y }, new_scheme };
    }
    [[nodiscard]] unsigned column() const { return coords.x; }
    [[nodiscard]] unsigned row() const { return coords.y; }

    bool operator==(const Id& other) const { return other.coords == coords && other.scheme == scheme && other.zoom_level == zoom_level; };
    bool operator<(const Id& other) const { return std::tie(zoom_level, coords.x, coords.y, scheme) < std::tie(other.zoom_level, other.coords.x, other.coords.y, other.scheme); };

    struct Hasher {
        size_t operator()(const Id& id) const
        {
            // zoom <= 20 and coords < 2^20 fit into 64 bits without collisions
            const uint64_t key = (uint64_t(id.zoom_level) << 58) ^ (uint64_t(id.coords.x) << 29) ^ uint64_t(id.coords.y) ^ (uint64_t(id.scheme) << 63);
            return std::hash<uint64_t>()(key);
        }
    };
};

// "zoom/column/row", the form used in logs and reports.
[[nodiscard]] std::string to_string(const Id& id);

inline std::ostream& operator<<(std::ostream& os, const Id& id)
{
    return os << to_string(id);
}

// Substitutes {z}/{zoom}, {x}/{col} and {y}/{row} in url and path templates.
[[nodiscard]] std::string format_template(std::string_view pattern, const Id& id);

void string_replace_all(std::string& s, std::string_view find, std::string_view replace);
}
