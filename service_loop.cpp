/* service_loop.cpp
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

#include "service_loop.h"
#include "key_names.h"
#include "piper_error.h"
#include "virtual_device.h"
#include "log.hpp"
#include <algorithm>
#include <csignal>
#include <unistd.h>

piper::service_loop::service_loop(service_config_t config_, key_sink & keyboard_, passthrough_sink * pointer_,
    source_factory_t open_source_, std::string config_path_, const builtin_registry & builtins)
    : config(std::move(config_)),
      config_path(std::move(config_path_)),
      keyboard(keyboard_),
      pointer(pointer_),
      open_source(std::move(open_source_)),
      now(monotonic_now_us),
      table(std::make_shared<const mapping_table>(mapping_table::build(config.mapping))),
      normalizer(config.settings.normalizer),
      pool(config.settings.workers, config.settings.queue_limit),
      actions(keyboard, pool, builtins, config.settings.dispatcher)
{
    print_log(INFO_LOG, "Loaded ", table.load()->size(), " mapping(s), ", config.settings.workers,
        " worker(s), coincidence window ", config.settings.normalizer.window.count(), " ms\n");
}

piper::service_loop::~service_loop()
{
    try {
        shutdown();
    } catch (const std::exception & e) {
        print_log(ERROR_LOG, "Shutdown failed: ", e.what(), "\n");
    }
}

void piper::service_loop::request_stop() noexcept
{
    stop_requested = true;
    wake.signal();
}

void piper::service_loop::request_reload() noexcept
{
    reload_requested = true;
    wake.signal();
}

void piper::service_loop::run()
{
    if (!source) {
        source = open_source(wake.fd());
    }

    print_log(INFO_LOG, "Main loop started, stop with SIGINT(2) or SIGTERM(15), reload with SIGHUP(1) (pid=",
        getpid(), ").\n");

    while (true)
    {
        // flags are set before the wake-up is written, so clearing first loses nothing
        wake.clear();
        handle_requests();
        if (stop_requested) {
            break;
        }

        std::optional<std::chrono::microseconds> timeout;
        if (const auto deadline = normalizer.next_deadline())
        {
            const auto current = now();
            timeout = std::chrono::microseconds(*deadline > current ? *deadline - current : 0);
        }

        std::optional<raw_event_t> event;
        try {
            event = source->read_next(timeout);
        } catch (const device_disconnected & e) {
            source = reconnect(e.what());
            if (!source) {
                break; // stopped while waiting
            }
            continue;
        }

        if (event) {
            process(*event);
        } else {
            tick(now());
        }
    }

    shutdown();
}

void piper::service_loop::handle_requests()
{
    if (reload_requested.exchange(false)) {
        reload_from_file();
    }
}

bool piper::service_loop::reload(const service_config_t & new_config)
{
    std::shared_ptr<const mapping_table> new_table;
    try {
        new_table = std::make_shared<const mapping_table>(mapping_table::build(new_config.mapping));
    } catch (const invalid_mapping & e) {
        print_log(ERROR_LOG, "Reload rejected, keeping the current mapping: ", e.what(), "\n");
        return false;
    }

    if (!(new_config.settings == config.settings)) {
        print_log(WARNING_LOG, "Device, grab, timing and pool settings changed; they take effect after a restart\n");
    }

    config.mapping = new_config.mapping;
    table.store(std::move(new_table));
    print_log(INFO_LOG, "Mapping reloaded, ", table.load()->size(), " mapping(s)\n");
    return true;
}

bool piper::service_loop::reload_from_file()
{
    if (config_path.empty())
    {
        print_log(WARNING_LOG, "No configuration file to reload from\n");
        return false;
    }

    print_log(INFO_LOG, "Reloading ", config_path, "\n");
    try {
        return reload(load_service_config(config_path));
    } catch (const invalid_mapping & e) {
        print_log(ERROR_LOG, "Reload rejected, keeping the current mapping: ", e.what(), "\n");
        return false;
    }
}

void piper::service_loop::process(const raw_event_t & event)
{
    try
    {
        print_log(DEBUG_LOG, event.device_id, ": ", key_name(event.button_code),
            event.direction == button_direction_t::pressed ? " pressed" : " released", "\n");
        forward(event);
        if (event.direction == button_direction_t::pressed && !current_table()->in_any_chord(event.button_code)) {
            keyboard.release_held(); // e.g. a click that picks the window from the switcher
        }
        deliver(normalizer.feed(event), event.device_id);
    }
    catch (const std::exception & e)
    {
        print_log(ERROR_LOG, "Unexpected error on ", event.device_id, " handling ", key_name(event.button_code),
            event.direction == button_direction_t::pressed ? " press" : " release", ": ", e.what(), "\n");
    }
}

void piper::service_loop::tick(const timestamp_us_t current)
{
    try {
        deliver(normalizer.advance(current), source ? source->describe() : std::string("<no device>"));
    } catch (const std::exception & e) {
        print_log(ERROR_LOG, "Unexpected error in the chord normalizer: ", e.what(), "\n");
    }
}

void piper::service_loop::deliver(const std::vector<chord_t> & chords, const std::string & device_id)
{
    if (chords.empty()) {
        return;
    }

    // one snapshot for the whole batch, a reload in between swaps the pointer only
    const auto snapshot = current_table();
    for (const auto & chord : chords)
    {
        try {
            actions.dispatch(chord, *snapshot);
        } catch (const std::exception & e) {
            const auto match = snapshot->lookup(chord.buttons);
            print_log(ERROR_LOG, "Unexpected error on ", device_id, " dispatching ", describe_chord(chord.buttons),
                " -> ", match ? describe_action(match->action) : std::string("<unmapped>"), ": ", e.what(), "\n");
        }
    }
}

void piper::service_loop::forward(const raw_event_t & event)
{
    if (pointer == nullptr || config.settings.grab != grab_mode_t::exclusive) {
        return;
    }

    if (event.direction == button_direction_t::pressed)
    {
        if (!current_table()->consumes(event.button_code) && forwarded.insert(event.button_code).second) {
            pointer->button(event.button_code, true);
        }
    }
    else if (forwarded.erase(event.button_code) != 0)
    {
        pointer->button(event.button_code, false);
    }
}

void piper::service_loop::release_forwarded()
{
    if (pointer != nullptr)
    {
        for (const auto button : forwarded) {
            pointer->button(button, false);
        }
    }
    forwarded.clear();
}

std::unique_ptr<piper::event_source> piper::service_loop::reconnect(const std::string & reason)
{
    print_log(WARNING_LOG, reason, ", reconnecting\n");
    source.reset();
    normalizer.reset();
    release_forwarded();
    keyboard.release_held();

    auto backoff = config.settings.reconnect_backoff;
    const auto attempts = config.settings.reconnect_attempts;
    for (unsigned int attempt = 1; attempt <= attempts; attempt++)
    {
        if (wake.wait_for(backoff))
        {
            wake.clear();
            handle_requests();
            if (stop_requested) {
                return nullptr;
            }
        }

        try
        {
            auto reopened = open_source(wake.fd());
            print_log(INFO_LOG, "Reconnected to ", reopened->describe(), " on attempt ", attempt, "\n");
            return reopened;
        }
        catch (const device_unavailable & e)
        {
            print_log(WARNING_LOG, "Reconnect attempt ", attempt, "/", attempts, " failed: ", e.what(), "\n");
        }

        backoff *= 2;
    }

    throw device_disconnected(reason + ", gave up after " + std::to_string(attempts) + " reconnect attempt(s)");
}

void piper::service_loop::shutdown()
{
    if (shut_down) {
        return;
    }
    shut_down = true;

    print_log(INFO_LOG, "Shutting down, waiting up to ", config.settings.shutdown_grace.count(), " ms for running actions\n");
    const auto deadline = std::chrono::steady_clock::now() + config.settings.shutdown_grace;
    pool.shutdown(config.settings.shutdown_grace);

    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    actions.shutdown(std::max(left, std::chrono::milliseconds(0)));
    keyboard.release_held();
    release_forwarded();
    source.reset(); // releases the grab
    print_log(INFO_LOG, "Service loop stopped, ", actions.dispatched(), " dispatched, ", actions.unmapped(),
        " unmapped, ", actions.failed(), " failed\n");
}

namespace {

std::atomic<piper::service_loop *> registered_loop = nullptr;
std::atomic<bool> stop_pending = false;

}

piper::signal_registration::signal_registration(service_loop & loop)
{
    registered_loop = &loop;
    // pairs with deliver(): one of the two sees the other's store
    if (stop_pending.exchange(false)) {
        loop.request_stop();
    }
}

piper::signal_registration::~signal_registration()
{
    registered_loop = nullptr;
}

void piper::signal_registration::deliver(const int signum) noexcept
{
    if (signum != SIGHUP) {
        stop_pending = true;
    }

    service_loop * loop = registered_loop;
    if (loop == nullptr) {
        return;
    }

    if (signum == SIGHUP) {
        loop->request_reload();
    } else {
        stop_pending = false;
        loop->request_stop();
    }
}
