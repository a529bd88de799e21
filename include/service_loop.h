/* service_loop.h
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

#ifndef SERVICE_LOOP_H
#define SERVICE_LOOP_H

#include <atomic>
#include <functional>
#include <memory>
#include <set>
#include <string>
#include "builtin_functions.h"
#include "chord_normalizer.h"
#include "config_reader.h"
#include "dispatcher.h"
#include "event_source.h"
#include "mapping_table.h"
#include "worker_pool.h"

namespace piper {

class key_sink;
class passthrough_sink;

/*
 * Owns the pipeline: event source -> chord normalizer -> dispatcher.
 * Everything except request_stop(), request_reload() and current_table()
 * runs on the thread that called run().
 */
class service_loop
{
public:
    /// Opens the device; gets the fd the reader must poll so the loop can wake it
    using source_factory_t = std::function<std::unique_ptr<event_source>(int wake_fd)>;
    using clock_source_t = std::function<timestamp_us_t()>;

    /// Throws invalid_mapping if the initial mapping does not build
    service_loop(service_config_t config, key_sink & keyboard, passthrough_sink * pointer,
        source_factory_t open_source, std::string config_path = "",
        const builtin_registry & builtins = builtin_registry::defaults());
    ~service_loop();
    service_loop(const service_loop &) = delete;
    service_loop & operator=(const service_loop &) = delete;

    /// Returns after request_stop(). Throws device_unavailable when the first open
    /// fails and device_disconnected when reconnecting gives up.
    void run();

    /// Async-signal-safe
    void request_stop() noexcept;
    void request_reload() noexcept;

    /// Builds a table from `config` and swaps it in; on failure the running table stays
    bool reload(const service_config_t & config);
    bool reload_from_file();

    /// One button transition through the pipeline
    void process(const raw_event_t & event);

    /// Lets the normalizer's window or repeat deadline fire
    void tick(timestamp_us_t now);

    /// Drain the worker pool within the grace period, then release the device
    void shutdown();

    [[nodiscard]] std::shared_ptr<const mapping_table> current_table() const { return table.load(); }
    [[nodiscard]] dispatcher & get_dispatcher() { return actions; }
    [[nodiscard]] worker_pool & get_worker_pool() { return pool; }
    [[nodiscard]] const service_settings_t & settings() const { return config.settings; }

    void set_clock(clock_source_t clock) { now = std::move(clock); }

private:
    void deliver(const std::vector<chord_t> & chords, const std::string & device_id);
    void forward(const raw_event_t & event);
    void release_forwarded();
    std::unique_ptr<event_source> reconnect(const std::string & reason);
    void handle_requests();

    service_config_t config;
    std::string config_path;
    key_sink & keyboard;
    passthrough_sink * pointer;
    source_factory_t open_source;
    clock_source_t now;

    wake_event wake;
    std::atomic<bool> stop_requested = false;
    std::atomic<bool> reload_requested = false;
    bool shut_down = false;

    std::atomic<std::shared_ptr<const mapping_table>> table;
    chord_normalizer normalizer;
    worker_pool pool;
    dispatcher actions;
    std::unique_ptr<event_source> source;
    std::set<button_code_t> forwarded; // pressed buttons whose press went to the OS
};

/*
 * Routes SIGINT, SIGTERM and SIGHUP to the registered loop. A stop that
 * arrives while no loop is registered is handed to the next one to register.
 */
class signal_registration
{
public:
    explicit signal_registration(service_loop & loop);
    ~signal_registration();
    signal_registration(const signal_registration &) = delete;
    signal_registration & operator=(const signal_registration &) = delete;

    /// Signal handler; SIGHUP reloads, anything else stops
    static void deliver(int signum) noexcept;
};

}

#endif //SERVICE_LOOP_H
