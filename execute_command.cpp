/* execute_command.cpp
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

#include "execute_command.h"
#include "log.hpp"
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <pthread.h>
#include <algorithm>
#include <csignal>
#include <cerrno>
#include <cstring>
#include <iterator>
#include <sstream>
#include <sys/wait.h>

/* Since pipes are unidirectional, we need three pipes for the standard streams:
   1. Parent writes to child's stdin
   2. Child writes to parent's stdout
   3. Child writes to parent's stderr
   and a fourth, close-on-exec one through which a failed execv() reports errno.
   It reads EOF as soon as the exec succeeds. */

namespace {

/* Always in a pipe[], pipe[0] is for read and
   pipe[1] is for write */
constexpr int READ_FD  = 0;
constexpr int WRITE_FD = 1;

constexpr std::size_t max_captured_output = 64 * 1024;
constexpr int max_reads_per_wakeup = 16;

// exit is only noticed through waitpid(), the pipes may outlive the child
constexpr int exit_check_ms = 100;
constexpr int closed_check_ms = 10;

inline std::string get_errno_message(const std::string &prefix = "") {
    return prefix + std::strerror(errno);
}

struct pipe_t
{
    int fd[2] = { -1, -1 };

    pipe_t() = default;
    pipe_t(const pipe_t &) = delete;
    pipe_t & operator=(const pipe_t &) = delete;
    ~pipe_t() { close_end(READ_FD); close_end(WRITE_FD); }

    bool open() { return pipe2(fd, O_CLOEXEC) == 0; }

    void close_end(const int end)
    {
        if (fd[end] != -1) {
            close(fd[end]);
            fd[end] = -1;
        }
    }

    int release(const int end)
    {
        const int ret = fd[end];
        fd[end] = -1;
        return ret;
    }
};

void record_exit(const int wstatus, cmd_status & status)
{
    if (WIFEXITED(wstatus)) {
        status.exit_status = WEXITSTATUS(wstatus);
    } else if (WIFSIGNALED(wstatus)) {
        std::ostringstream oss;
        oss << "Child terminated by signal " << WTERMSIG(wstatus) << "\n";
        status.fd_stderr += oss.str();
        status.exit_status = 128 + WTERMSIG(wstatus);
    } else {
        // Other cases like stopped or continued
        status.fd_stderr += "Child process ended abnormally.\n";
        status.exit_status = 1;
    }
}

void wait_blocking(const pid_t pid, cmd_status & status)
{
    int wstatus = 0;
    pid_t ret;
    do {
        ret = waitpid(pid, &wstatus, 0);
    } while (ret == -1 && errno == EINTR);

    if (ret == -1)
    {
        status.fd_stderr += get_errno_message("waitpid() failed: ");
        status.exit_status = 1;
        return;
    }

    record_exit(wstatus, status);
}

/// Non-blocking read of what the pipe holds; false at EOF or on error
bool read_available(const int fd, std::string & sink)
{
    for (int i = 0; i < max_reads_per_wakeup; i++)
    {
        char buffer[4096];
        const ssize_t count = read(fd, buffer, sizeof(buffer));
        if (count > 0)
        {
            if (sink.size() < max_captured_output) {
                sink.append(buffer, std::min(static_cast<std::size_t>(count), max_captured_output - sink.size()));
            }
            continue;
        }

        if (count == -1 && errno == EINTR) {
            continue;
        }

        return count == -1 && (errno == EAGAIN || errno == EWOULDBLOCK);
    }

    return true;
}

/// Forks and execs `cmd`. On success `pid` is the child and `fds` hold the
/// non-blocking read ends of its stdout and stderr.
bool spawn(const std::string &cmd, const std::vector<std::string> &args, const std::string &input,
    pid_t & pid, int (&fds)[2], cmd_status & status)
{
    status.exit_status = 1; // Default to failure

    pipe_t child_stdin, child_stdout, child_stderr, exec_error;
    for (auto * pipe : { &child_stdin, &child_stdout, &child_stderr, &exec_error })
    {
        if (!pipe->open()) {
            status.fd_stderr += get_errno_message("pipe() failed: ");
            status.spawn_failed = true;
            return false;
        }
    }

    // nothing that allocates may run in the child of a threaded process
    std::vector<char *> argv;
    argv.push_back(const_cast<char *>(cmd.c_str()));
    for (const auto &arg : args) {
        argv.push_back(const_cast<char *>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid = fork();
    if (pid < 0)
    {
        status.fd_stderr += get_errno_message("fork() failed: ");
        status.spawn_failed = true;
        return false;
    }

    if (pid == 0)
    {
        // Child process, own group so the whole pipeline can be killed at once
        setpgid(0, 0);

        // dup2() clears close-on-exec on the new descriptors
        if (dup2(child_stdin.fd[READ_FD], STDIN_FILENO) == -1
            || dup2(child_stdout.fd[WRITE_FD], STDOUT_FILENO) == -1
            || dup2(child_stderr.fd[WRITE_FD], STDERR_FILENO) == -1)
        {
            const int err = errno;
            (void)!write(exec_error.fd[WRITE_FD], &err, sizeof(err));
            _exit(127);
        }

        // the service ignores SIGPIPE, commands should not inherit that
        signal(SIGPIPE, SIG_DFL);

        execv(cmd.c_str(), argv.data());

        const int err = errno;
        (void)!write(exec_error.fd[WRITE_FD], &err, sizeof(err));
        _exit(127);
    }

    // Parent process
    setpgid(pid, pid);

    child_stdin.close_end(READ_FD);
    child_stdout.close_end(WRITE_FD);
    child_stderr.close_end(WRITE_FD);
    exec_error.close_end(WRITE_FD);

    int exec_errno = 0;
    ssize_t got;
    do {
        got = read(exec_error.fd[READ_FD], &exec_errno, sizeof(exec_errno));
    } while (got == -1 && errno == EINTR);

    if (got == static_cast<ssize_t>(sizeof(exec_errno)))
    {
        wait_blocking(pid, status);
        status.spawn_failed = true;
        status.exit_status = 127;
        status.fd_stderr += "Unable to execute " + cmd + ": " + std::strerror(exec_errno);
        return false;
    }

    // Write to child's stdin
    if (!input.empty())
    {
        // Ensure input ends with a newline
        std::string modified_input = input;
        if (modified_input.back() != '\n') {
            modified_input += "\n";
        }

        std::size_t total_written = 0;
        while (total_written < modified_input.size())
        {
            const ssize_t written = write(child_stdin.fd[WRITE_FD], modified_input.data() + total_written,
                modified_input.size() - total_written);
            if (written == -1)
            {
                if (errno == EINTR)
                    continue; // Retry on interrupt

                // the child may legitimately not read its input
                status.fd_stderr += get_errno_message("write() to child stdin failed: ");
                break;
            }

            total_written += static_cast<std::size_t>(written);
        }
    }
    child_stdin.close_end(WRITE_FD);

    for (auto * pipe : { &child_stdout, &child_stderr }) {
        fcntl(pipe->fd[READ_FD], F_SETFL, fcntl(pipe->fd[READ_FD], F_GETFL) | O_NONBLOCK);
    }
    fds[0] = child_stdout.release(READ_FD);
    fds[1] = child_stderr.release(READ_FD);
    status.exit_status = 0;
    return true;
}

}

command_reaper::command_reaper()
    : reaper(&command_reaper::reaper_main, this)
{
}

command_reaper::~command_reaper()
{
    shutdown(std::chrono::milliseconds(0));
}

bool command_reaper::run(const std::string & cmd, const std::vector<std::string> & args, const std::string & input,
    const std::chrono::milliseconds timeout, on_exit_t on_exit)
{
    {
        std::lock_guard<std::mutex> lock(reaper_mutex);
        if (stopping) {
            return false;
        }
    }

    child_t child;
    child.on_exit = std::move(on_exit);
    if (!spawn(cmd, args, input, child.pid, child.fds, child.status))
    {
        if (child.on_exit) {
            child.on_exit(child.status);
        }
        return true;
    }

    if (timeout.count() > 0) {
        child.deadline = std::chrono::steady_clock::now() + timeout;
    }

    const pid_t pid = child.pid;
    const int fds[2] = { child.fds[0], child.fds[1] };
    bool adopted = false;
    {
        std::lock_guard<std::mutex> lock(reaper_mutex);
        if (!stopping)
        {
            groups.insert(pid);
            incoming.push_back(std::move(child));
            adopted = true;
        }
    }

    if (!adopted)
    {
        // shut down while the command was starting
        kill(-pid, SIGKILL);
        cmd_status ignored;
        wait_blocking(pid, ignored);
        close(fds[0]);
        close(fds[1]);
        return false;
    }

    wake.signal();
    return true;
}

void command_reaper::kill_running()
{
    std::lock_guard<std::mutex> lock(reaper_mutex);
    for (const auto group : groups) {
        kill(-group, SIGKILL);
    }
}

void command_reaper::shutdown(const std::chrono::milliseconds grace)
{
    {
        std::unique_lock<std::mutex> lock(reaper_mutex);
        if (!reaper.joinable()) {
            return; // already shut down
        }

        stopping = true;
        if (!all_reaped.wait_for(lock, grace, [this] { return groups.empty(); }))
        {
            print_log(WARNING_LOG, "Grace period over, killing ", groups.size(), " running command(s)\n");
            for (const auto group : groups) {
                kill(-group, SIGKILL);
            }
        }
    }

    wake.signal();
    reaper.join();
}

std::size_t command_reaper::running() const
{
    std::lock_guard<std::mutex> lock(reaper_mutex);
    return groups.size();
}

void command_reaper::reaper_main()
{
    pthread_setname_np(pthread_self(), "PiperReaper");

    while (true)
    {
        // cleared before `incoming` is looked at, a later run() signals again
        wake.clear();
        {
            std::lock_guard<std::mutex> lock(reaper_mutex);
            std::ranges::move(incoming, std::back_inserter(children));
            incoming.clear();
            if (stopping && children.empty()) {
                return;
            }
        }

        // Drain stdout and stderr of every child so no pipe can fill up and stall it
        std::vector<pollfd> fds = { { wake.fd(), POLLIN, 0 } };
        std::vector<std::pair<child_t *, int>> owners;
        int wait_ms = children.empty() ? -1 : exit_check_ms;
        const auto now = std::chrono::steady_clock::now();
        for (auto & child : children)
        {
            bool open = false;
            for (int i = 0; i < 2; i++)
            {
                if (child.fds[i] != -1)
                {
                    fds.push_back({ child.fds[i], POLLIN, 0 });
                    owners.emplace_back(&child, i);
                    open = true;
                }
            }

            if (!open) {
                wait_ms = std::min(wait_ms, closed_check_ms);
            }

            if (child.deadline != std::chrono::steady_clock::time_point{} && !child.status.timed_out)
            {
                const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(child.deadline - now).count() + 1;
                wait_ms = std::min(wait_ms, static_cast<int>(std::max<int64_t>(left, 0)));
            }
        }

        if (poll(fds.data(), fds.size(), wait_ms) == -1 && errno != EINTR)
        {
            print_log(ERROR_LOG, "poll() failed in the command reaper: ", std::strerror(errno), "\n");
            std::this_thread::sleep_for(std::chrono::milliseconds(exit_check_ms));
            continue;
        }

        for (std::size_t i = 1; i < fds.size(); i++)
        {
            if (fds[i].revents == 0) {
                continue;
            }

            auto & [child, stream] = owners[i - 1];
            if (!read_available(child->fds[stream], stream == 0 ? child->status.fd_stdout : child->status.fd_stderr))
            {
                close(child->fds[stream]); // EOF or a broken pipe
                child->fds[stream] = -1;
            }
        }

        const auto checked = std::chrono::steady_clock::now();
        std::vector<child_t> finished;
        for (auto it = children.begin(); it != children.end(); )
        {
            if (it->deadline != std::chrono::steady_clock::time_point{} && !it->status.timed_out && checked >= it->deadline)
            {
                kill(-it->pid, SIGKILL);
                it->status.timed_out = true;
            }

            int wstatus = 0;
            const pid_t ret = waitpid(it->pid, &wstatus, WNOHANG);
            if (ret == 0 || (ret == -1 && errno == EINTR)) {
                ++it;
                continue;
            }

            if (ret == -1)
            {
                it->status.fd_stderr += get_errno_message("waitpid() failed: ");
                it->status.exit_status = 1;
            }
            else
            {
                record_exit(wstatus, it->status);
            }

            finished.push_back(std::move(*it));
            it = children.erase(it);
        }

        for (auto & child : finished) {
            finish(child);
        }
    }
}

void command_reaper::finish(child_t & child)
{
    for (int i = 0; i < 2; i++)
    {
        if (child.fds[i] != -1)
        {
            // whatever is still buffered; a background process may hold the pipe open for longer
            (void)read_available(child.fds[i], i == 0 ? child.status.fd_stdout : child.status.fd_stderr);
            close(child.fds[i]);
            child.fds[i] = -1;
        }
    }

    if (child.on_exit)
    {
        try {
            child.on_exit(child.status);
        } catch (const std::exception & e) {
            print_log(ERROR_LOG, "Exit handler of child ", child.pid, " threw: ", e.what(), "\n");
        }
    }

    {
        std::lock_guard<std::mutex> lock(reaper_mutex);
        groups.erase(child.pid);
    }
    all_reaped.notify_all();
}
