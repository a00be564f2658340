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

#include "mercator.h"

#include <cmath>
#include <numbers>

glm::dvec2 mercator::project(double latitude, double longitude, unsigned zoom_level)
{
    const double n = std::ldexp(1.0, int(zoom_level));
    const double latitude_rad = latitude * std::numbers::pi / 180.0;

    const double x = (longitude + 180.0) / 360.0 * n;
    const double y = (1.0 - std::asinh(std::tan(latitude_rad)) / std::numbers::pi) / 2.0 * n;
    return { std::floor(x), std::floor(y) };
}
