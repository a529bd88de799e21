/* worker_pool.h
 *
 * Copyright 2025 Anivice Ives
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
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#ifndef WORKER_POOL_H
#define WORKER_POOL_H

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace piper {

/*
 * Fixed number of threads behind a bounded queue. Slow actions run here so
 * the input thread never waits on them.
 */
class worker_pool
{
public:
    struct job_t {
        std::string label; // chord and action, for the log
        std::function<void()> work;
    };

    /// Threads are named `name` plus their index
    worker_pool(unsigned int workers, std::size_t queue_limit, std::string name = "PiperWorker");
    ~worker_pool();
    worker_pool(const worker_pool &) = delete;
    worker_pool & operator=(const worker_pool &) = delete;

    /// False if the queue is full or the pool is shutting down; the job is not run then
    [[nodiscard]] bool submit(job_t job);

    /// Blocks until nothing is queued or running
    void wait_idle();

    /// Stop accepting, give in-flight work `grace`, then drop what is queued
    /// and join every worker once its running job returns
    void shutdown(std::chrono::milliseconds grace);

    [[nodiscard]] std::size_t pending() const;

private:
    void worker_main(unsigned int index);

    mutable std::mutex pool_mutex;
    std::condition_variable work_available;
    std::condition_variable work_done;
    std::deque<job_t> queue;
    std::vector<std::thread> workers;
    std::string thread_name;
    std::size_t limit;
    std::size_t active = 0;
    bool stopping = false;
};

}

#endif //WORKER_POOL_H
