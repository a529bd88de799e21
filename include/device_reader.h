/* device_reader.h
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

#ifndef DEVICE_READER_H
#define DEVICE_READER_H

#include <deque>
#include <string>
#include "config_reader.h"
#include "event_source.h"

struct libinput;
struct libinput_device;
struct libinput_event;
struct libinput_interface;

namespace piper {

class passthrough_sink;

/*
 * One evdev node read through libinput's path backend. Under an exclusive grab
 * the node is EVIOCGRAB'ed as libinput opens it, and motion and wheel events
 * go straight to `pointer`. Button transitions come back from read_next(),
 * whether the kernel reports them as BTN_* or KEY_* codes.
 */
class device_reader : public event_source
{
public:
    /// Throws device_unavailable if the node is missing, unreadable, or cannot be grabbed
    device_reader(std::string node, grab_mode_t grab, passthrough_sink * pointer, int wake_fd);
    ~device_reader() override;
    device_reader(const device_reader &) = delete;
    device_reader & operator=(const device_reader &) = delete;

    std::optional<raw_event_t> read_next(std::optional<std::chrono::microseconds> timeout) override;
    [[nodiscard]] std::string describe() const override;

private:
    static int open_restricted(const char * path, int flags, void * user_data);
    static void close_restricted(int fd, void * user_data);
    static const libinput_interface interface;

    void drain();
    void translate(libinput_event * event);

    std::string node;
    std::string name;
    grab_mode_t grab;
    passthrough_sink * pointer;
    int wake_fd;
    libinput * li = nullptr;
    libinput_device * device = nullptr;
    std::deque<raw_event_t> pending;
    bool removed = false;

    // sub-unit leftovers of relative motion and wheel travel
    double motion_x = 0, motion_y = 0;
    double wheel_v120 = 0, hwheel_v120 = 0;
};

}

#endif //DEVICE_READER_H
