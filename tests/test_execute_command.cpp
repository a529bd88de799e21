/* test_execute_command.cpp
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
#include <csignal>
#include <future>
#include "execute_command.h"

using namespace std::chrono_literals;

namespace {

cmd_status run_to_exit(command_reaper & reaper, const std::string & cmd, const std::vector<std::string> & args,
    const std::string & input = "", const std::chrono::milliseconds timeout = 0ms)
{
    std::promise<cmd_status> done;
    auto result = done.get_future();
    if (!reaper.run(cmd, args, input, timeout, [&done](const cmd_status & status) { done.set_value(status); }))
    {
        ADD_FAILURE() << "reaper refused " << cmd;
        return {};
    }

    return result.get();
}

}

TEST(CommandReaper, CapturesOutputAndStatus)
{
    command_reaper reaper;
    const auto status = run_to_exit(reaper, "/bin/sh", { "-c", "echo out; echo err >&2; exit 3" });
    EXPECT_EQ(status.fd_stdout, "out\n");
    EXPECT_EQ(status.fd_stderr, "err\n");
    EXPECT_EQ(status.exit_status, 3);
    EXPECT_FALSE(status.spawn_failed);
    EXPECT_FALSE(status.timed_out);
}

TEST(CommandReaper, FeedsInput)
{
    command_reaper reaper;
    const auto status = run_to_exit(reaper, "/bin/cat", {}, "hello");
    EXPECT_EQ(status.exit_status, 0);
    EXPECT_EQ(status.fd_stdout, "hello\n");
}

TEST(CommandReaper, MissingBinaryIsReportedBeforeRunReturns)
{
    command_reaper reaper;
    bool reported = false;
    cmd_status status;
    EXPECT_TRUE(reaper.run("/nonexistent/binary", {}, "", 0ms, [&](const cmd_status & s) { status = s; reported = true; }));

    ASSERT_TRUE(reported);
    EXPECT_TRUE(status.spawn_failed);
    EXPECT_EQ(status.exit_status, 127);
    EXPECT_NE(status.fd_stderr.find("/nonexistent/binary"), std::string::npos);
    EXPECT_EQ(reaper.running(), 0u);
}

TEST(CommandReaper, RunReturnsWhileCommandKeepsRunning)
{
    command_reaper reaper;
    std::promise<cmd_status> done;
    auto result = done.get_future();

    const auto started = std::chrono::steady_clock::now();
    ASSERT_TRUE(reaper.run("/bin/sh", { "-c", "sleep 0.5; echo late" }, "", 0ms,
        [&done](const cmd_status & status) { done.set_value(status); }));
    EXPECT_LT(std::chrono::steady_clock::now() - started, 300ms);
    EXPECT_EQ(reaper.running(), 1u);

    const auto status = result.get();
    EXPECT_EQ(status.fd_stdout, "late\n");
    EXPECT_EQ(status.exit_status, 0);
}

TEST(CommandReaper, ExitIsSeenWhileBackgroundChildHoldsOutput)
{
    command_reaper reaper;
    const auto started = std::chrono::steady_clock::now();
    const auto status = run_to_exit(reaper, "/bin/sh", { "-c", "sleep 3 & echo started" });

    EXPECT_EQ(status.exit_status, 0);
    EXPECT_EQ(status.fd_stdout, "started\n");
    EXPECT_LT(std::chrono::steady_clock::now() - started, 2s);
}

TEST(CommandReaper, TimeoutKillsWholeGroup)
{
    command_reaper reaper;
    const auto started = std::chrono::steady_clock::now();
    const auto status = run_to_exit(reaper, "/bin/sh", { "-c", "sleep 10 & sleep 10; wait" }, "", 200ms);
    EXPECT_TRUE(status.timed_out);
    EXPECT_EQ(status.exit_status, 128 + SIGKILL);
    EXPECT_LT(std::chrono::steady_clock::now() - started, 5s);
}

TEST(CommandReaper, KillRunning)
{
    command_reaper reaper;
    std::promise<cmd_status> done;
    auto result = done.get_future();
    ASSERT_TRUE(reaper.run("/bin/sh", { "-c", "sleep 10" }, "", 0ms,
        [&done](const cmd_status & status) { done.set_value(status); }));

    reaper.kill_running();
    EXPECT_EQ(result.get().exit_status, 128 + SIGKILL);
}

TEST(CommandReaper, ShutdownKillsWhatOutlivesGrace)
{
    command_reaper reaper;
    std::promise<cmd_status> quick_done, slow_done;
    auto quick = quick_done.get_future();
    auto slow = slow_done.get_future();
    ASSERT_TRUE(reaper.run("/bin/sh", { "-c", "sleep 0.1" }, "", 0ms,
        [&quick_done](const cmd_status & status) { quick_done.set_value(status); }));
    ASSERT_TRUE(reaper.run("/bin/sh", { "-c", "sleep 10" }, "", 0ms,
        [&slow_done](const cmd_status & status) { slow_done.set_value(status); }));

    const auto started = std::chrono::steady_clock::now();
    reaper.shutdown(500ms);
    EXPECT_LT(std::chrono::steady_clock::now() - started, 3s);

    EXPECT_EQ(quick.get().exit_status, 0);
    EXPECT_EQ(slow.get().exit_status, 128 + SIGKILL);
    EXPECT_EQ(reaper.running(), 0u);
    EXPECT_FALSE(reaper.run("/bin/true", {}, "", 0ms, {}));
}
