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

#ifndef TILESTORE_H
#define TILESTORE_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <vector>

#include "coverage_plan.h"
#include "tile.h"

namespace store {

inline constexpr std::array<uint8_t, 8> png_signature = { 0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A };

[[nodiscard]] bool has_png_signature(std::span<const uint8_t> bytes);

// True if the file exists and starts with the PNG signature. The image is not decoded.
// Never throws, unreadable files are simply invalid.
[[nodiscard]] bool is_valid(const std::filesystem::path& path);

/// The artifact directory of one project: {root}/{zoom}/{column}/{row}.png with xyz rows.
class TileStore {
public:
    explicit TileStore(std::filesystem::path root);
    [[nodiscard]] static TileStore for_project(const std::filesystem::path& output_root, const std::string& project_name);

    [[nodiscard]] const std::filesystem::path& root() const;
    [[nodiscard]] std::filesystem::path tile_path(const tile::Id& tile_id) const;
    [[nodiscard]] bool is_valid(const tile::Id& tile_id) const;

    // Valid *.png files anywhere below the root, whether planned or not.
    [[nodiscard]] uint64_t count_valid_artifacts() const;

private:
    std::filesystem::path m_root;
};

struct LevelStatistics {
    unsigned zoom_level = 0;
    uint64_t expected_count = 0;
    uint64_t valid_count = 0;
    uint64_t missing_count = 0;
    double completion_rate = 0;

    bool operator==(const LevelStatistics& other) const = default;
};

struct ValidationReport {
    uint64_t expected_count = 0;
    uint64_t valid_count = 0;
    std::vector<tile::Id> missing;
    double completion_rate = 0; // percent
    std::vector<LevelStatistics> levels;
};

// Percentage, 0 if nothing is expected.
[[nodiscard]] double completion_rate(uint64_t valid_count, uint64_t expected_count);

// Planned tiles without a valid artifact, in plan order.
[[nodiscard]] std::vector<tile::Id> find_missing(const coverage::Plan& plan, const TileStore& store);

[[nodiscard]] ValidationReport report(const coverage::Plan& plan, const TileStore& store);

}

#endif // TILESTORE_H
