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

#include "tile_store.h"

#include <algorithm>
#include <execution>
#include <fstream>
#include <numeric>

#include <fmt/core.h>

using namespace store;

bool store::has_png_signature(std::span<const uint8_t> bytes)
{
    return bytes.size() >= png_signature.size() && std::equal(png_signature.begin(), png_signature.end(), bytes.begin());
}

bool store::is_valid(const std::filesystem::path& path)
{
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec) || ec)
        return false;

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open())
        return false;

    std::array<char, png_signature.size()> buffer = {};
    file.read(buffer.data(), buffer.size());
    if (file.gcount() != std::streamsize(buffer.size()))
        return false;

    std::array<uint8_t, png_signature.size()> bytes = {};
    std::transform(buffer.begin(), buffer.end(), bytes.begin(), [](char c) { return uint8_t(c); });
    return has_png_signature(bytes);
}

TileStore::TileStore(std::filesystem::path root)
    : m_root(std::move(root))
{
}

TileStore TileStore::for_project(const std::filesystem::path& output_root, const std::string& project_name)
{
    return TileStore(output_root / project_name);
}

const std::filesystem::path& TileStore::root() const
{
    return m_root;
}

std::filesystem::path TileStore::tile_path(const tile::Id& tile_id) const
{
    const auto id = tile_id.to(tile::Scheme::SlippyMap);
    return m_root / std::to_string(id.zoom_level) / std::to_string(id.coords.x) / fmt::format("{}.png", id.coords.y);
}

bool TileStore::is_valid(const tile::Id& tile_id) const
{
    return store::is_valid(tile_path(tile_id));
}

uint64_t TileStore::count_valid_artifacts() const
{
    std::error_code ec;
    auto iter = std::filesystem::recursive_directory_iterator(m_root, std::filesystem::directory_options::skip_permission_denied, ec);
    if (ec)
        return 0;

    uint64_t count = 0;
    while (iter != std::filesystem::recursive_directory_iterator()) {
        const auto& path = iter->path();
        if (path.extension() == ".png" && store::is_valid(path))
            ++count;
        iter.increment(ec);
        if (ec)
            break;
    }
    return count;
}

double store::completion_rate(uint64_t valid_count, uint64_t expected_count)
{
    if (expected_count == 0)
        return 0;
    return double(valid_count) / double(expected_count) * 100.0;
}

namespace {
struct ColumnScan {
    unsigned zoom_level;
    unsigned column;
    unsigned min_row;
    unsigned max_row;
    std::vector<tile::Id> missing;
};
}

std::vector<tile::Id> store::find_missing(const coverage::Plan& plan, const TileStore& store)
{
    std::vector<ColumnScan> columns;
    for (const auto& level : plan.levels()) {
        for (unsigned x = level.range.min.x; x <= level.range.max.x; ++x)
            columns.push_back({ level.zoom_level, x, level.range.min.y, level.range.max.y, {} });
    }

    // columns are independent directories, so they can be checked concurrently. merging in vector order keeps plan order.
    std::for_each(std::execution::par, columns.begin(), columns.end(), [&store](ColumnScan& scan) {
        for (unsigned y = scan.min_row; y <= scan.max_row; ++y) {
            const tile::Id id = { scan.zoom_level, { scan.column, y }, tile::Scheme::SlippyMap };
            if (!store.is_valid(id))
                scan.missing.push_back(id);
        }
    });

    const auto n_missing = std::accumulate(columns.begin(), columns.end(), size_t(0), [](size_t sum, const ColumnScan& scan) { return sum + scan.missing.size(); });
    std::vector<tile::Id> missing;
    missing.reserve(n_missing);
    for (const auto& scan : columns)
        missing.insert(missing.end(), scan.missing.begin(), scan.missing.end());
    return missing;
}

ValidationReport store::report(const coverage::Plan& plan, const TileStore& store)
{
    ValidationReport report;
    report.expected_count = plan.count();
    report.missing = find_missing(plan, store);
    report.valid_count = store.count_valid_artifacts();
    report.completion_rate = completion_rate(report.valid_count, report.expected_count);

    for (const auto& level : plan.levels()) {
        LevelStatistics stats;
        stats.zoom_level = level.zoom_level;
        stats.expected_count = level.count();
        stats.missing_count = uint64_t(std::count_if(report.missing.begin(), report.missing.end(), [&](const tile::Id& id) { return id.zoom_level == level.zoom_level; }));
        stats.valid_count = stats.expected_count - stats.missing_count;
        stats.completion_rate = completion_rate(stats.valid_count, stats.expected_count);
        report.levels.push_back(stats);
    }
    return report;
}
