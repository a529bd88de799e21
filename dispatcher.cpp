/* dispatcher.cpp
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

#include "dispatcher.h"
#include "builtin_functions.h"
#include "execute_command.h"
#include "virtual_device.h"
#include "worker_pool.h"
#include "piper_error.h"
#include "log.hpp"
#include <algorithm>
#include <future>

namespace {

// handlers waiting for a free builtin thread
constexpr std::size_t handler_queue_limit = 32;

}

piper::dispatcher::dispatcher(key_sink & keyboard_, worker_pool & pool_, const builtin_registry & builtins_,
    const dispatcher_settings_t settings)
    : keyboard(keyboard_), pool(pool_), builtins(builtins_), config(settings),
      stats(std::make_shared<dispatch_stats_t>()),
      reaper(std::make_shared<command_reaper>()),
      handler_threads(std::make_shared<worker_pool>(settings.builtin_threads, handler_queue_limit, "PiperBuiltin"))
{
}

piper::dispatcher::~dispatcher()
{
    shutdown(std::chrono::milliseconds(0));
}

void piper::dispatcher::shutdown(const std::chrono::milliseconds grace)
{
    const auto deadline = std::chrono::steady_clock::now() + grace;
    handler_threads->shutdown(grace);

    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    reaper->shutdown(std::max(left, std::chrono::milliseconds(0)));
}

std::size_t piper::dispatcher::running_commands() const
{
    return reaper->running();
}

bool piper::dispatcher::holds_keys(const action_descriptor_t & action) const
{
    const auto * builtin = std::get_if<builtin_function_t>(&action);
    return builtin != nullptr && builtins.holds_keys(builtin->name);
}

void piper::dispatcher::dispatch(const chord_t & chord, const mapping_table & table)
{
    const auto match = table.lookup(chord.buttons);
    if (!match || !holds_keys(match->action)) {
        keyboard.release_held();
    }

    if (!match)
    {
        stats->unmapped++;
        print_log(DEBUG_LOG, "Chord ", describe_chord(chord.buttons), " not mapped\n");
        return;
    }

    stats->dispatched++;
    const std::string label = describe_chord(chord.buttons)
        + (match->chord != chord.buttons ? " (as " + describe_chord(match->chord) + ")" : "")
        + (chord.repeat ? " [repeat]" : "")
        + " -> " + describe_action(match->action);
    print_log(DEBUG_LOG, "Dispatching ", label, "\n");

    std::visit(overloaded {
        [&](const emit_key_sequence_t & sequence) {
            keyboard.send(sequence.steps);
        },
        [&](const run_command_t & command) {
            run_command(label, command);
        },
        [&](const builtin_function_t & builtin) {
            run_builtin(label, builtin);
        },
    }, match->action);
}

void piper::dispatcher::enqueue(const std::string & label, std::function<void()> work)
{
    if (!pool.submit({ .label = label, .work = std::move(work) }))
    {
        stats->failed++;
        print_log(ERROR_LOG, action_execution_failure("Action queue full, dropped " + label).what(), "\n");
    }
}

void piper::dispatcher::run_command(const std::string & label, const run_command_t & command)
{
    enqueue(label, [label, line = command.command_line, timeout = config.command_timeout, stats_ = stats, reaper_ = reaper]
    {
        auto on_exit = [label, timeout, stats_](const cmd_status & status)
        {
            if (!status.fd_stdout.empty()) {
                print_log(DEBUG_LOG, "Output of ", label, ":\n", status.fd_stdout, "\n");
            }

            std::string reason;
            if (status.spawn_failed) {
                reason = "failed to start";
            } else if (status.timed_out) {
                reason = "killed after " + std::to_string(timeout.count()) + " ms";
            } else if (status.exit_status != 0) {
                reason = "exited with status " + std::to_string(status.exit_status);
            } else {
                return;
            }

            stats_->failed++;
            print_log(ERROR_LOG, action_execution_failure(label + ": " + reason).what(),
                status.fd_stderr.empty() ? "" : "\n    ", status.fd_stderr, "\n");
        };

        if (!reaper_->run("/bin/sh", { "-c", line }, "", timeout, std::move(on_exit)))
        {
            stats_->failed++;
            print_log(ERROR_LOG, action_execution_failure(label + ": shutting down, not started").what(), "\n");
        }
    });
}

void piper::dispatcher::run_builtin(const std::string & label, const builtin_function_t & builtin)
{
    const auto * handler = builtins.find(builtin.name);
    if (handler == nullptr)
    {
        // the table was built against another registry
        stats->failed++;
        print_log(ERROR_LOG, action_execution_failure(label + ": no builtin named " + builtin.name).what(), "\n");
        return;
    }

    enqueue(label, [label, function = *handler, parameters = builtin.parameters, timeout = config.builtin_timeout,
        stats_ = stats, threads = handler_threads, &sink = keyboard]
    {
        auto task = std::make_shared<std::packaged_task<void()>>([function, parameters, &sink] {
            function(sink, parameters);
        });
        auto abandoned = std::make_shared<std::atomic<bool>>(false);
        auto result = task->get_future();

        // a handler that was given up on before it started is not run at all
        const bool queued = threads->submit({ .label = label, .work = [task, abandoned] {
            if (!*abandoned) {
                (*task)();
            }
        } });
        if (!queued)
        {
            stats_->failed++;
            print_log(ERROR_LOG, action_execution_failure(label + ": every builtin thread is busy").what(), "\n");
            return;
        }

        // an overrunning handler cannot be interrupted, it keeps its builtin thread until it returns
        if (result.wait_for(timeout) != std::future_status::ready)
        {
            *abandoned = true;
            stats_->failed++;
            print_log(ERROR_LOG, action_timeout(label + ": no result after " + std::to_string(timeout.count()) + " ms").what(), "\n");
            return;
        }

        try {
            result.get();
        } catch (const std::exception & e) {
            stats_->failed++;
            print_log(ERROR_LOG, action_execution_failure(label + ": " + e.what()).what(), "\n");
        }
    });
}
