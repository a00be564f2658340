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

#include "tile.h"

#include <fmt/core.h>

using namespace std::literals;

std::string tile::to_string(const Id& id)
{
    return fmt::format("{}/{}/{}", id.zoom_level, id.coords.x, id.coords.y);
}

void tile::string_replace_all(std::string& s, std::string_view find, std::string_view replace)
{
    size_t pos = 0;
    const size_t find_len = find.length();
    const size_t replace_len = replace.length();

    while ((pos = s.find(find, pos)) != std::string::npos) {
        s.replace(pos, find_len, replace);
        pos += replace_len; // Move past the replaced part
    }
}

std::string tile::format_template(std::string_view pattern, const Id& id)
{
    const auto zoom = std::to_string(id.zoom_level);
    const auto column = std::to_string(id.coords.x);
    const auto row = std::to_string(id.coords.y);

    std::string s(pattern);
    string_replace_all(s, "{zoom}"sv, zoom);
    string_replace_all(s, "{z}"sv, zoom);
    string_replace_all(s, "{col}"sv, column);
    string_replace_all(s, "{x}"sv, column);
    string_replace_all(s, "{row}"sv, row);
    string_replace_all(s, "{y}"sv, row);
    return s;
}
