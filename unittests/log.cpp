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

#include <catch2/catch.hpp>

#include "Exception.h"
#include "catch2_helpers.h"
#include "log.h"

TEST_CASE("log")
{
    test_helpers::TempDirectory dir;

    SECTION("messages reach the log file")
    {
        const auto log_file = dir.path() / "harvest.log";
        Log::init(spdlog::level::info, log_file);
        LOG_INFO("round {} finished", 1);
        LOG_DEBUG("below the level");
        Log::get_logger()->flush();
        const auto bytes = test_helpers::read_file(log_file);
        const auto text = std::string(bytes.begin(), bytes.end());
        CHECK(text.find("round 1 finished") != std::string::npos);
        CHECK(text.find("below the level") == std::string::npos);
    }
    SECTION("a log file that cannot be opened is a configuration error")
    {
        CHECK_THROWS_AS(Log::init(spdlog::level::info, dir.path()), ConfigurationError);
        CHECK(Log::get_logger() != nullptr);
        CHECK_NOTHROW(LOG_WARN("still logging after a failed init"));
    }

    // the log file lives in the temporary directory, later tests log to stderr only
    Log::init(spdlog::level::info);
}
