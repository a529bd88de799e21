/* execute_command.h
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

#ifndef EXECUTE_COMMAND_H
#define EXECUTE_COMMAND_H

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>
#include <sys/types.h>
#include "event_source.h"

struct cmd_status
{
    std::string fd_stdout; // normal output
    std::string fd_stderr; // error information
    int exit_status{}; // exit status
    bool spawn_failed = false; // the program never started
    bool timed_out = false; // killed after the timeout
};

/*
 * Starts commands and collects their output and exit status on one thread of
 * its own, so whoever starts a command never waits for it to finish. Every
 * command gets its own process group; a command that outlives its timeout is
 * killed together with everything it started.
 */
class command_reaper
{
public:
    using on_exit_t = std::function<void(const cmd_status &)>;

    command_reaper();
    ~command_reaper();
    command_reaper(const command_reaper &) = delete;
    command_reaper & operator=(const command_reaper &) = delete;

    /// Runs `cmd` (an absolute path) with `args`, feeding `input` on stdin, and returns
    /// once it is running. A zero timeout lets it run forever. `on_exit` is called once
    /// with the result: on the calling thread if the program could not be started,
    /// otherwise on the reaper thread. False, with nothing started, after shutdown().
    bool run(const std::string & cmd, const std::vector<std::string> & args, const std::string & input,
        std::chrono::milliseconds timeout, on_exit_t on_exit);

    /// SIGKILL every process group not reaped yet
    void kill_running();

    /// Stop accepting, give running commands `grace` to exit, kill the rest and
    /// join the reaper thread once they are reaped
    void shutdown(std::chrono::milliseconds grace);

    [[nodiscard]] std::size_t running() const;

private:
    struct child_t
    {
        pid_t pid = -1;
        int fds[2] = { -1, -1 }; // stdout, stderr
        cmd_status status;
        std::chrono::steady_clock::time_point deadline{}; // epoch = none
        on_exit_t on_exit;
    };

    void reaper_main();
    void finish(child_t & child);

    mutable std::mutex reaper_mutex;
    std::condition_variable all_reaped;
    std::vector<child_t> incoming; // adopted, not yet seen by the reaper thread
    std::set<pid_t> groups; // every process group not reaped yet
    bool stopping = false;

    std::vector<child_t> children; // reaper thread only
    piper::wake_event wake;
    std::thread reaper;
};

#endif //EXECUTE_COMMAND_H
