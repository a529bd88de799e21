/* event_source.h
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

#ifndef EVENT_SOURCE_H
#define EVENT_SOURCE_H

#include <chrono>
#include <optional>
#include <string>
#include "input_event.h"

namespace piper {

/// Pull side of an input device, owned by the thread running the service loop
class event_source
{
public:
    virtual ~event_source() = default;

    /// Next button transition. Returns nothing once `timeout` has passed or the
    /// wake fd handed to the source was signaled; without a timeout it blocks
    /// until one of the two. Throws device_disconnected if the device goes away.
    virtual std::optional<raw_event_t> read_next(std::optional<std::chrono::microseconds> timeout) = 0;

    [[nodiscard]] virtual std::string describe() const = 0;
};

/// eventfd that signal handlers poke to wake the loop
class wake_event
{
public:
    wake_event();
    ~wake_event();
    wake_event(const wake_event &) = delete;
    wake_event & operator=(const wake_event &) = delete;

    /// Async-signal-safe
    void signal() const noexcept;

    /// Consume pending wake-ups
    void clear() const;

    /// True if signaled before `timeout` ran out; does not consume the wake-up
    [[nodiscard]] bool wait_for(std::chrono::milliseconds timeout) const;

    [[nodiscard]] int fd() const { return event_fd; }

private:
    int event_fd = -1;
};

}

#endif //EVENT_SOURCE_H
