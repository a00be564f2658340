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

#ifndef PROGRESSINDICATOR_H
#define PROGRESSINDICATOR_H

#include <atomic>
#include <string>
#include <thread>

#include "Exception.h"

class ProgressIndicator {
    const size_t m_n_steps;
    std::atomic<size_t> m_step = 0;

public:
    ProgressIndicator(size_t n_steps);

    void taskFinished();
    [[nodiscard]] size_t finishedTasks() const;
    // The monitor stops once all steps are done or when a stop is requested on the returned thread.
    [[nodiscard]] std::jthread startMonitoring() const;
    [[nodiscard]] std::string progressBar() const;
    [[nodiscard]] std::string xOfYDoneMessagE() const;
};

#endif // PROGRESSINDICATOR_H
