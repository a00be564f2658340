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

#ifndef TILEFETCHER_H
#define TILEFETCHER_H

#include <chrono>
#include <filesystem>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

#include "config.h"
#include "http_client.h"
#include "tile.h"

namespace fetch {

// base * 2^attempt + jitter * attempt, attempt counting from 0.
[[nodiscard]] std::chrono::milliseconds backoff_delay(const config::FetchConfig& config, unsigned attempt);

// Sleeps for the duration unless a stop is requested first. Returns false if it was stopped.
bool wait_for_or_stopped(std::chrono::milliseconds duration, std::stop_token stop_token);

// Writes the bytes to the file and closes it. Buffered data is flushed before success is reported.
[[nodiscard]] tl::expected<void, HttpError> write_bytes(const std::filesystem::path& path, const std::vector<uint8_t>& bytes);

enum class FetchStatus {
    Downloaded,
    CopiedFromCache,
    Failed,
    Cancelled
};

[[nodiscard]] std::string_view to_string(FetchStatus status);

struct FetchResult {
    FetchStatus status = FetchStatus::Failed;
    unsigned attempts = 0;
    std::string last_error;

    [[nodiscard]] bool ok() const { return status == FetchStatus::Downloaded || status == FetchStatus::CopiedFromCache; }
};

/// Retrieves a single tile and publishes it atomically: the body is written next to the destination,
/// validated, and only then renamed onto it. A valid artifact at the destination is never removed.
class TileFetcher {
public:
    TileFetcher(config::FetchConfig config, HttpClient& client);

    FetchResult fetch(const tile::Id& tile_id, const std::filesystem::path& dest_path, unsigned max_attempts, std::stop_token stop_token = {});

    [[nodiscard]] std::string url_for(const tile::Id& tile_id) const;
    [[nodiscard]] std::optional<std::filesystem::path> cache_path_for(const tile::Id& tile_id) const;

private:
    bool copy_from_cache(const tile::Id& tile_id, const std::filesystem::path& dest_path) const;
    tl::expected<void, HttpError> publish(const std::vector<uint8_t>& body, const std::filesystem::path& dest_path) const;
    static void discard_invalid(const std::filesystem::path& dest_path);

    config::FetchConfig m_config;
    HttpClient& m_client;
};

}

#endif // TILEFETCHER_H
