/* worker_pool.cpp
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

#include "worker_pool.h"
#include "log.hpp"
#include <pthread.h>
#include <stdexcept>

piper::worker_pool::worker_pool(const unsigned int workers_count, const std::size_t queue_limit, std::string name)
    : thread_name(std::move(name)), limit(queue_limit)
{
    if (workers_count == 0 || queue_limit == 0) {
        throw std::invalid_argument("Worker pool needs at least one worker and one queue slot");
    }

    workers.reserve(workers_count);
    for (unsigned int i = 0; i < workers_count; i++) {
        workers.emplace_back(&worker_pool::worker_main, this, i);
    }
}

piper::worker_pool::~worker_pool()
{
    shutdown(std::chrono::milliseconds(0));
}

bool piper::worker_pool::submit(job_t job)
{
    {
        std::lock_guard<std::mutex> lock(pool_mutex);
        if (stopping) {
            return false;
        }

        if (queue.size() >= limit) {
            return false;
        }

        queue.push_back(std::move(job));
    }

    work_available.notify_one();
    return true;
}

void piper::worker_pool::wait_idle()
{
    std::unique_lock<std::mutex> lock(pool_mutex);
    work_done.wait(lock, [this] { return queue.empty() && active == 0; });
}

void piper::worker_pool::shutdown(const std::chrono::milliseconds grace)
{
    {
        std::unique_lock<std::mutex> lock(pool_mutex);
        if (workers.empty()) {
            return; // already shut down
        }

        stopping = true;
        const bool drained = work_done.wait_for(lock, grace, [this] { return queue.empty() && active == 0; });
        if (!drained)
        {
            print_log(WARNING_LOG, "Grace period over, dropping ", queue.size(), " queued and waiting for ",
                active, " running action(s)\n");
            queue.clear();
        }
    }

    work_available.notify_all();

    for (auto & worker : workers)
    {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers.clear();
}

std::size_t piper::worker_pool::pending() const
{
    std::lock_guard<std::mutex> lock(pool_mutex);
    return queue.size() + active;
}

void piper::worker_pool::worker_main(const unsigned int index)
{
    pthread_setname_np(pthread_self(), (thread_name + std::to_string(index)).c_str());

    while (true)
    {
        job_t job;
        {
            std::unique_lock<std::mutex> lock(pool_mutex);
            work_available.wait(lock, [this] { return stopping || !queue.empty(); });
            if (queue.empty()) {
                return; // stopping and nothing left
            }

            job = std::move(queue.front());
            queue.pop_front();
            active++;
        }

        try {
            job.work();
        } catch (const std::exception & e) {
            print_log(ERROR_LOG, "Action ", job.label, " threw: ", e.what(), "\n");
        }

        {
            std::lock_guard<std::mutex> lock(pool_mutex);
            active--;
        }
        work_done.notify_all();
    }
}
