/* dispatcher.h
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

#ifndef DISPATCHER_H
#define DISPATCHER_H

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include "input_event.h"
#include "mapping_table.h"

class command_reaper;

namespace piper {

class key_sink;
class worker_pool;
class builtin_registry;

struct dispatcher_settings_t {
    std::chrono::milliseconds builtin_timeout{2000};
    std::chrono::milliseconds command_timeout{0}; // 0 = commands may run forever
    unsigned int builtin_threads = 2; // an overrunning handler keeps its thread until it returns
};

/// Diagnostic counters, shared with the jobs that finish after dispatch() returned
struct dispatch_stats_t {
    std::atomic<uint64_t> dispatched{0};
    std::atomic<uint64_t> unmapped{0};
    std::atomic<uint64_t> failed{0};
};

/*
 * Executes the action bound to a chord. Key sequences go out inline on the
 * calling thread, commands and builtins are queued on the worker pool.
 * A command job only starts the process, which is then watched by the
 * command reaper. A builtin job hands the handler to one of a fixed set of
 * builtin threads and waits at most builtin_timeout for it.
 * Failures are logged and counted, never thrown back at the caller.
 *
 * Any chord other than one bound to a builtin that holds keys releases the
 * keys such a builtin left held.
 */
class dispatcher
{
public:
    dispatcher(key_sink & keyboard, worker_pool & pool, const builtin_registry & builtins,
        dispatcher_settings_t settings = {});
    ~dispatcher();
    dispatcher(const dispatcher &) = delete;
    dispatcher & operator=(const dispatcher &) = delete;

    void dispatch(const chord_t & chord, const mapping_table & table);

    /// Gives running commands and builtin handlers `grace` to finish, then kills the
    /// commands and waits for the handlers. Nothing reaches the key sink afterwards.
    void shutdown(std::chrono::milliseconds grace);

    [[nodiscard]] uint64_t dispatched() const { return stats->dispatched; }
    [[nodiscard]] uint64_t unmapped() const { return stats->unmapped; }
    [[nodiscard]] uint64_t failed() const { return stats->failed; }

    /// Commands started and not reaped yet
    [[nodiscard]] std::size_t running_commands() const;

private:
    void run_command(const std::string & label, const run_command_t & command);
    void run_builtin(const std::string & label, const builtin_function_t & builtin);
    void enqueue(const std::string & label, std::function<void()> work);
    [[nodiscard]] bool holds_keys(const action_descriptor_t & action) const;

    key_sink & keyboard;
    worker_pool & pool;
    const builtin_registry & builtins;
    dispatcher_settings_t config;

    // shared with queued jobs, which may outlive a dispatch() call
    std::shared_ptr<dispatch_stats_t> stats;
    std::shared_ptr<command_reaper> reaper;
    std::shared_ptr<worker_pool> handler_threads;
};

}

#endif //DISPATCHER_H
