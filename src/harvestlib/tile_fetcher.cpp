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

#include "tile_fetcher.h"

#include <algorithm>
#include <condition_variable>
#include <fstream>
#include <mutex>

#include <fmt/core.h>

#include "log.h"
#include "tile_store.h"

using namespace fetch;

namespace {
bool create_directories2(const std::filesystem::path& path)
{
    std::error_code err;
    if (!std::filesystem::create_directories(path, err)) {
        // The folder may already exist
        return std::filesystem::is_directory(path, err);
    }
    return true;
}

std::filesystem::path part_path_for(const std::filesystem::path& dest_path)
{
    auto part_path = dest_path;
    part_path += ".part";
    return part_path;
}

// Validates the staged file and moves it onto the destination. The staged file is removed on failure.
tl::expected<void, HttpError> promote(const std::filesystem::path& part_path, const std::filesystem::path& dest_path)
{
    std::error_code ec;
    if (!store::is_valid(part_path)) {
        std::filesystem::remove(part_path, ec);
        return tl::unexpected(HttpError(HttpErrorKind::InvalidContent, 0, "missing png signature"));
    }
    std::filesystem::rename(part_path, dest_path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(part_path, ignored);
        return tl::unexpected(HttpError(HttpErrorKind::WriteFailed, 0, ec.message()));
    }
    return {};
}
}

std::chrono::milliseconds fetch::backoff_delay(const config::FetchConfig& config, unsigned attempt)
{
    const unsigned shift = std::min(attempt, 20u);
    return config.backoff_base * (int64_t(1) << shift) + config.backoff_jitter * int64_t(attempt);
}

bool fetch::wait_for_or_stopped(std::chrono::milliseconds duration, std::stop_token stop_token)
{
    if (duration <= std::chrono::milliseconds::zero())
        return !stop_token.stop_requested();

    std::mutex mutex;
    std::condition_variable_any cv;
    std::unique_lock lock(mutex);
    // wait_for returns the predicate, which only becomes true through the stop token
    return !cv.wait_for(lock, stop_token, duration, [] { return false; });
}

tl::expected<void, HttpError> fetch::write_bytes(const std::filesystem::path& path, const std::vector<uint8_t>& bytes)
{
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open())
        return tl::unexpected(HttpError(HttpErrorKind::WriteFailed, 0, fmt::format("cannot open \"{}\"", path.string())));
    file.write(reinterpret_cast<const char*>(bytes.data()), std::streamsize(bytes.size()));
    // small bodies stay in the stream buffer until close, so errors such as ENOSPC only show up here
    file.close();
    if (file.fail())
        return tl::unexpected(HttpError(HttpErrorKind::WriteFailed, 0, fmt::format("cannot write \"{}\"", path.string())));
    return {};
}

std::string_view fetch::to_string(FetchStatus status)
{
    switch (status) {
    case FetchStatus::Downloaded:
        return "downloaded";
    case FetchStatus::CopiedFromCache:
        return "copied from cache";
    case FetchStatus::Failed:
        return "failed";
    case FetchStatus::Cancelled:
        return "cancelled";
    }
    return "unknown";
}

TileFetcher::TileFetcher(config::FetchConfig config, HttpClient& client)
    : m_config(std::move(config))
    , m_client(client)
{
}

std::string TileFetcher::url_for(const tile::Id& tile_id) const
{
    return tile::format_template(m_config.url_template, tile_id.to(m_config.scheme));
}

std::optional<std::filesystem::path> TileFetcher::cache_path_for(const tile::Id& tile_id) const
{
    if (!m_config.cache_template.has_value())
        return std::nullopt;
    return std::filesystem::path(tile::format_template(m_config.cache_template.value(), tile_id.to(m_config.scheme)));
}

FetchResult TileFetcher::fetch(const tile::Id& tile_id, const std::filesystem::path& dest_path, unsigned max_attempts, std::stop_token stop_token)
{
    FetchResult result;
    if (stop_token.stop_requested()) {
        result.status = FetchStatus::Cancelled;
        return result;
    }

    if (!create_directories2(dest_path.parent_path())) {
        result.last_error = fmt::format("failed to create directories \"{}\"", dest_path.parent_path().string());
        LOG_WARN("Tile {}: {}", tile::to_string(tile_id), result.last_error);
        return result;
    }

    if (copy_from_cache(tile_id, dest_path)) {
        LOG_TRACE("Tile {} copied from cache.", tile::to_string(tile_id));
        result.status = FetchStatus::CopiedFromCache;
        return result;
    }

    const std::string url = url_for(tile_id);
    for (unsigned attempt = 0; attempt < max_attempts; ++attempt) {
        if (stop_token.stop_requested()) {
            result.status = FetchStatus::Cancelled;
            return result;
        }

        result.attempts = attempt + 1;
        const auto outcome = m_client.get(url, m_config.timeout)
                                 .and_then([&](const HttpResponse& response) { return publish(response.body, dest_path); });
        if (outcome.has_value()) {
            LOG_TRACE("Tile {} downloaded after {} attempt(s).", tile::to_string(tile_id), result.attempts);
            result.status = FetchStatus::Downloaded;
            result.last_error.clear();
            return result;
        }

        result.last_error = outcome.error().description();
        discard_invalid(dest_path);
        LOG_DEBUG("Tile {} attempt {}/{} failed: {} [{}]", tile::to_string(tile_id), result.attempts, max_attempts, result.last_error, url);

        if (attempt + 1 < max_attempts && !wait_for_or_stopped(backoff_delay(m_config, attempt), stop_token)) {
            result.status = FetchStatus::Cancelled;
            return result;
        }
    }

    LOG_WARN("Tile {} failed after {} attempt(s): {}", tile::to_string(tile_id), result.attempts, result.last_error);
    result.status = FetchStatus::Failed;
    return result;
}

bool TileFetcher::copy_from_cache(const tile::Id& tile_id, const std::filesystem::path& dest_path) const
{
    const auto cache_path = cache_path_for(tile_id);
    if (!cache_path.has_value() || !store::is_valid(cache_path.value()))
        return false;

    const auto part_path = part_path_for(dest_path);
    std::error_code ec;
    std::filesystem::copy_file(cache_path.value(), part_path, std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        LOG_DEBUG("Copying {} from cache failed: {}", tile::to_string(tile_id), ec.message());
        std::filesystem::remove(part_path, ec);
        return false;
    }
    const auto promoted = promote(part_path, dest_path);
    if (!promoted.has_value())
        LOG_DEBUG("Copying {} from cache failed: {}", tile::to_string(tile_id), promoted.error().description());
    return promoted.has_value();
}

tl::expected<void, HttpError> TileFetcher::publish(const std::vector<uint8_t>& body, const std::filesystem::path& dest_path) const
{
    const auto part_path = part_path_for(dest_path);
    const auto written = write_bytes(part_path, body);
    if (!written.has_value()) {
        std::error_code ec;
        std::filesystem::remove(part_path, ec);
        return written;
    }
    return promote(part_path, dest_path);
}

void TileFetcher::discard_invalid(const std::filesystem::path& dest_path)
{
    std::error_code ec;
    if (std::filesystem::exists(dest_path, ec) && !store::is_valid(dest_path))
        std::filesystem::remove(dest_path, ec);
}
