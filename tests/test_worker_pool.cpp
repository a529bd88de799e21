/* test_worker_pool.cpp
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

#include <gtest/gtest.h>
#include <atomic>
#include <future>
#include <stdexcept>
#include <thread>
#include <pthread.h>
#include "worker_pool.h"

using namespace piper;
using namespace std::chrono_literals;

TEST(WorkerPool, RunsEverySubmittedJob)
{
    worker_pool pool(3, 32);
    std::atomic<int> done = 0;
    for (int i = 0; i < 20; i++) {
        ASSERT_TRUE(pool.submit({ .label = "job", .work = [&] { done++; } }));
    }

    pool.wait_idle();
    EXPECT_EQ(done, 20);
    EXPECT_EQ(pool.pending(), 0u);
}

TEST(WorkerPool, FullQueueRejects)
{
    worker_pool pool(1, 1);
    std::promise<void> gate;
    auto opened = gate.get_future().share();
    std::promise<void> started;

    ASSERT_TRUE(pool.submit({ .label = "blocker", .work = [&, opened] { started.set_value(); opened.wait(); } }));
    started.get_future().wait();

    EXPECT_TRUE(pool.submit({ .label = "queued", .work = [] { } }));
    EXPECT_FALSE(pool.submit({ .label = "overflow", .work = [] { } }));

    gate.set_value();
    pool.wait_idle();
}

TEST(WorkerPool, ThrowingJobDoesNotKillWorker)
{
    worker_pool pool(1, 4);
    std::atomic<bool> ran = false;
    ASSERT_TRUE(pool.submit({ .label = "bad", .work = [] { throw std::runtime_error("boom"); } }));
    ASSERT_TRUE(pool.submit({ .label = "good", .work = [&] { ran = true; } }));
    pool.wait_idle();
    EXPECT_TRUE(ran);
}

TEST(WorkerPool, ShutdownDrainsWithinGrace)
{
    worker_pool pool(2, 8);
    std::atomic<int> done = 0;
    for (int i = 0; i < 4; i++) {
        ASSERT_TRUE(pool.submit({ .label = "short", .work = [&] { std::this_thread::sleep_for(10ms); done++; } }));
    }

    pool.shutdown(2s);
    EXPECT_EQ(done, 4);
    EXPECT_FALSE(pool.submit({ .label = "late", .work = [] { } }));
}

TEST(WorkerPool, ShutdownDropsQueueAfterGrace)
{
    worker_pool pool(1, 8);
    std::promise<void> gate;
    auto opened = gate.get_future().share();
    std::atomic<bool> queued_ran = false;

    ASSERT_TRUE(pool.submit({ .label = "stuck", .work = [opened] { opened.wait(); } }));
    ASSERT_TRUE(pool.submit({ .label = "never", .work = [&] { queued_ran = true; } }));

    std::thread opener([&] { std::this_thread::sleep_for(200ms); gate.set_value(); });
    const auto started = std::chrono::steady_clock::now();
    pool.shutdown(50ms);
    opener.join();

    // joined only after the running job returned, the queued one never ran
    EXPECT_GE(std::chrono::steady_clock::now() - started, 150ms);
    EXPECT_FALSE(queued_ran);
}

TEST(WorkerPool, ThreadsCarryTheirName)
{
    worker_pool pool(1, 1, "PiperTest");
    std::promise<std::string> named;
    ASSERT_TRUE(pool.submit({ .label = "name", .work = [&] {
        char name[16] = {};
        pthread_getname_np(pthread_self(), name, sizeof(name));
        named.set_value(name);
    } }));
    EXPECT_EQ(named.get_future().get(), "PiperTest0");
}

TEST(WorkerPool, RejectsEmptyConfiguration)
{
    EXPECT_THROW(worker_pool(0, 4), std::invalid_argument);
    EXPECT_THROW(worker_pool(2, 0), std::invalid_argument);
}
