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

#include <chrono>
#include <execution>
#include <thread>
#include <vector>

#include <catch2/catch.hpp>

#include "ProgressIndicator.h"

using namespace std::literals;

TEST_CASE("progress indicator") {
  SECTION("throws on overflow") {
    {
      auto pi = ProgressIndicator(0);
      CHECK_THROWS(pi.taskFinished());
    }
    {
      auto pi = ProgressIndicator(1);
      pi.taskFinished();
      CHECK_THROWS(pi.taskFinished());
    }
  }
  SECTION("bar and message") {
    const std::string m5 = "-----";
    const std::string m10 = m5 + m5;
    const std::string m20 = m10 + m10;
    const std::string m50 = m20 + m20 + m10;
    const std::string b5 = "|||||";
    const std::string b10 = b5 + b5;
    const std::string b20 = b10 + b10;
    const std::string b50 = b20 + b20 + b10;

    auto pi = ProgressIndicator(4);
    CHECK(pi.progressBar() == m50 + m50);
    CHECK(pi.xOfYDoneMessagE() == "0/4");
    pi.taskFinished();
    CHECK(pi.progressBar() == b20 + b5 + m20 + m5 + m50);
    CHECK(pi.xOfYDoneMessagE() == "1/4");
    pi.taskFinished();
    CHECK(pi.progressBar() == b50 + m50);
    CHECK(pi.finishedTasks() == 2);
    pi.taskFinished();
    pi.taskFinished();
    CHECK(pi.progressBar() == b50 + b50);
    CHECK(pi.xOfYDoneMessagE() == "4/4");

    CHECK(ProgressIndicator(0).progressBar() == b50 + b50);
  }

  SECTION("taskFinished is thread safe") {
    const auto tasks = std::vector<int>(100000);
    auto pi = ProgressIndicator(tasks.size());
    std::for_each(std::execution::par, tasks.begin(), tasks.end(), [&](const auto&) { pi.taskFinished(); });
    CHECK(pi.finishedTasks() == tasks.size());
    CHECK_THROWS(pi.taskFinished());
  }

  SECTION("thread parallel reporting") {
    // console output can't be easily tested, but the monitor has to terminate once everything is done
    const auto tasks = std::vector<int>(151);
    auto pi = ProgressIndicator(tasks.size());
    auto monitoring_thread = pi.startMonitoring();
    std::for_each(std::execution::par, tasks.begin(), tasks.end(), [&](const auto&) { std::this_thread::sleep_for(1ms); pi.taskFinished(); });
    monitoring_thread.join();
    CHECK_THROWS(pi.taskFinished());
  }

  SECTION("monitoring stops on request") {
    auto pi = ProgressIndicator(10);
    auto monitoring_thread = pi.startMonitoring();
    pi.taskFinished();
    const auto t0 = std::chrono::steady_clock::now();
    monitoring_thread.request_stop();
    monitoring_thread.join();
    CHECK(std::chrono::steady_clock::now() - t0 < 5s);
  }
}
