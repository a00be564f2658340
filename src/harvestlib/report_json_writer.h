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

#ifndef REPORTJSONWRITER_H
#define REPORTJSONWRITER_H

#include <filesystem>
#include <string>

#include "reconciler.h"
#include "tile.h"
#include "tile_store.h"

namespace report_json_writer {
[[nodiscard]] std::string process(const std::string& project_name, const reconcile::Result& result);

// Throws Exception if the file can't be written.
void write_to_file(const std::filesystem::path& path, const std::string& project_name, const reconcile::Result& result);

namespace internal {
    [[nodiscard]] std::string escape(const std::string& s);
    [[nodiscard]] std::string string_attribute(const std::string& name, const std::string& s);
    [[nodiscard]] std::string tile(const tile::Id& id);
    [[nodiscard]] std::string level(const store::LevelStatistics& level);
    [[nodiscard]] std::string round(const reconcile::RoundRecord& round);
}
}

#endif // REPORTJSONWRITER_H
