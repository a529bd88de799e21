/* event_source.cpp
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

#include "event_source.h"
#include "piper_error.h"
#include <sys/eventfd.h>
#include <poll.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <cstdint>

piper::wake_event::wake_event()
{
    event_fd = eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK);
    assert_throw(event_fd >= 0);
}

piper::wake_event::~wake_event()
{
    close(event_fd);
}

void piper::wake_event::signal() const noexcept
{
    constexpr uint64_t one = 1;
    // a full counter already means "woken", nothing to report from a signal handler anyway
    (void)!write(event_fd, &one, sizeof(one));
}

void piper::wake_event::clear() const
{
    uint64_t value;
    while (read(event_fd, &value, sizeof(value)) == sizeof(value)) { }
}

bool piper::wake_event::wait_for(const std::chrono::milliseconds timeout) const
{
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true)
    {
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        pollfd pfd = { event_fd, POLLIN, 0 };
        const int ready = poll(&pfd, 1, static_cast<int>(std::max<int64_t>(left.count(), 0)));
        if (ready == -1 && errno == EINTR) {
            continue;
        }

        assert_throw(ready != -1);
        return ready > 0;
    }
}
