/* device_reader.cpp
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

#include "device_reader.h"
#include "virtual_device.h"
#include "piper_error.h"
#include "log.hpp"
#include <libinput.h>
#include <linux/input.h>
#include <sys/ioctl.h>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstring>

const libinput_interface piper::device_reader::interface =
{
    .open_restricted = piper::device_reader::open_restricted,
    .close_restricted = piper::device_reader::close_restricted,
};

int piper::device_reader::open_restricted(const char * path, const int flags, void * user_data)
{
    const auto * self = static_cast<device_reader *>(user_data);
    const int fd = open(path, flags | O_CLOEXEC);
    if (fd < 0)
    {
        const int err = errno;
        print_log(ERROR_LOG, "Cannot open ", path, ": ", std::strerror(err), "\n");
        return -err;
    }

    if (self->grab == grab_mode_t::exclusive && ioctl(fd, EVIOCGRAB, 1) < 0)
    {
        const int err = errno;
        print_log(ERROR_LOG, "Cannot grab ", path, ": ", std::strerror(err), "\n");
        close(fd);
        return -err;
    }

    return fd;
}

void piper::device_reader::close_restricted(const int fd, void * user_data)
{
    const auto * self = static_cast<device_reader *>(user_data);
    if (self->grab == grab_mode_t::exclusive) {
        (void)ioctl(fd, EVIOCGRAB, 0); // fails with ENODEV once the device is gone
    }
    close(fd);
}

piper::device_reader::device_reader(std::string node_, const grab_mode_t grab_, passthrough_sink * pointer_,
    const int wake_fd_)
    : node(std::move(node_)), grab(grab_), pointer(pointer_), wake_fd(wake_fd_)
{
    if (access(node.c_str(), F_OK) != 0) {
        throw device_unavailable(node + ": " + std::strerror(errno));
    }

    if (access(node.c_str(), R_OK) != 0) {
        throw device_unavailable(node + ": " + std::strerror(errno));
    }

    li = libinput_path_create_context(&interface, this);
    if (li == nullptr) {
        throw device_unavailable("Failed to create libinput context for " + node);
    }

    device = libinput_path_add_device(li, node.c_str());
    if (device == nullptr)
    {
        libinput_unref(li);
        li = nullptr;
        throw device_unavailable(node + ": not an input device, or it cannot be "
            + (grab == grab_mode_t::exclusive ? "grabbed" : "opened"));
    }

    libinput_device_ref(device);
    name = libinput_device_get_name(device);
    print_log(INFO_LOG, "Reading ", name, " (", node, ")",
        grab == grab_mode_t::exclusive ? ", exclusive grab" : ", shared", "\n");
}

piper::device_reader::~device_reader()
{
    if (device != nullptr) {
        if (!removed) {
            libinput_path_remove_device(device); // releases the grab
        }
        libinput_device_unref(device);
    }

    if (li != nullptr) {
        libinput_unref(li);
    }
}

std::optional<piper::raw_event_t> piper::device_reader::read_next(const std::optional<std::chrono::microseconds> timeout)
{
    if (pending.empty() && !removed)
    {
        pollfd fds[2] = {
            { libinput_get_fd(li), POLLIN, 0 },
            { wake_fd, POLLIN, 0 },
        };

        int wait_ms = -1;
        if (timeout) {
            wait_ms = static_cast<int>((std::max<int64_t>(timeout->count(), 0) + 999) / 1000);
        }

        const int ready = poll(fds, wake_fd >= 0 ? 2 : 1, wait_ms);
        if (ready == -1)
        {
            if (errno == EINTR) {
                return std::nullopt;
            }
            throw std::runtime_error("poll() failed on " + describe() + ": " + std::strerror(errno));
        }

        if (fds[0].revents != 0) {
            drain();
        }
    }

    if (!pending.empty())
    {
        auto event = pending.front();
        pending.pop_front();
        return event;
    }

    if (removed) {
        throw device_disconnected(describe() + " was removed");
    }

    // timed out, woken, or only motion arrived
    return std::nullopt;
}

std::string piper::device_reader::describe() const
{
    return name.empty() ? node : name + " (" + node + ")";
}

void piper::device_reader::drain()
{
    if (const int ret = libinput_dispatch(li); ret < 0) {
        print_log(WARNING_LOG, "libinput_dispatch() failed on ", describe(), ": ", std::strerror(-ret), "\n");
    }

    libinput_event * ev;
    while ((ev = libinput_get_event(li)))
    {
        translate(ev);
        libinput_event_destroy(ev);
    }
}

void piper::device_reader::translate(libinput_event * event)
{
    switch (libinput_event_get_type(event))
    {
    case LIBINPUT_EVENT_DEVICE_REMOVED:
        removed = true;
        print_log(WARNING_LOG, describe(), " removed\n");
        break;

    case LIBINPUT_EVENT_POINTER_BUTTON:
    {
        auto * pev = libinput_event_get_pointer_event(event);
        pending.push_back({
            .device_id = node,
            .button_code = static_cast<button_code_t>(libinput_event_pointer_get_button(pev)),
            .direction = libinput_event_pointer_get_button_state(pev) == LIBINPUT_BUTTON_STATE_PRESSED
                ? button_direction_t::pressed : button_direction_t::released,
            .timestamp = libinput_event_pointer_get_time_usec(pev),
        });
        break;
    }

    case LIBINPUT_EVENT_KEYBOARD_KEY:
    {
        // extra buttons of gaming mice often arrive as KEY_* codes
        auto * kev = libinput_event_get_keyboard_event(event);
        pending.push_back({
            .device_id = node,
            .button_code = static_cast<button_code_t>(libinput_event_keyboard_get_key(kev)),
            .direction = libinput_event_keyboard_get_key_state(kev) == LIBINPUT_KEY_STATE_PRESSED
                ? button_direction_t::pressed : button_direction_t::released,
            .timestamp = libinput_event_keyboard_get_time_usec(kev),
        });
        break;
    }

    case LIBINPUT_EVENT_POINTER_MOTION:
    {
        if (pointer == nullptr) {
            break;
        }

        auto * pev = libinput_event_get_pointer_event(event);
        motion_x += libinput_event_pointer_get_dx_unaccelerated(pev);
        motion_y += libinput_event_pointer_get_dy_unaccelerated(pev);
        const auto dx = static_cast<int32_t>(std::trunc(motion_x));
        const auto dy = static_cast<int32_t>(std::trunc(motion_y));
        motion_x -= dx;
        motion_y -= dy;
        if (dx != 0 || dy != 0) {
            pointer->motion(dx, dy);
        }
        break;
    }

    case LIBINPUT_EVENT_POINTER_SCROLL_WHEEL:
    {
        if (pointer == nullptr) {
            break;
        }

        auto * pev = libinput_event_get_pointer_event(event);
        if (libinput_event_pointer_has_axis(pev, LIBINPUT_POINTER_AXIS_SCROLL_VERTICAL)) {
            wheel_v120 += libinput_event_pointer_get_scroll_value_v120(pev, LIBINPUT_POINTER_AXIS_SCROLL_VERTICAL);
        }
        if (libinput_event_pointer_has_axis(pev, LIBINPUT_POINTER_AXIS_SCROLL_HORIZONTAL)) {
            hwheel_v120 += libinput_event_pointer_get_scroll_value_v120(pev, LIBINPUT_POINTER_AXIS_SCROLL_HORIZONTAL);
        }

        // libinput counts down as positive, REL_WHEEL counts up as positive
        const auto notches_v = static_cast<int32_t>(std::trunc(wheel_v120 / 120.0));
        const auto notches_h = static_cast<int32_t>(std::trunc(hwheel_v120 / 120.0));
        wheel_v120 -= notches_v * 120.0;
        hwheel_v120 -= notches_h * 120.0;
        if (notches_v != 0 || notches_h != 0) {
            pointer->scroll(-notches_v, notches_h);
        }
        break;
    }

    default:
        break;
    }
}
