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

#ifndef MERCATOR_H
#define MERCATOR_H

#include <glm/glm.hpp>

namespace mercator {

/// Slippy map (spherical mercator, EPSG:3857) tile column (x) and row (y) containing a WGS84 position.
/// The values are floored but neither clipped nor converted to integers: positions outside of the
/// world give out of range values, and NaN input stays NaN. Validating the result is up to the caller.
[[nodiscard]] glm::dvec2 project(double latitude, double longitude, unsigned zoom_level);

}

#endif // MERCATOR_H
