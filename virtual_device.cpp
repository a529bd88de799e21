/* virtual_device.cpp
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

#include <unistd.h>
#include <linux/uinput.h>
#include <sys/ioctl.h>
#include <sys/time.h>
#include <algorithm>
#include <cstdint>
#include <cstring>
#include <cerrno>
#include <fcntl.h>
#include "virtual_device.h"
#include "piper_error.h"
#include "log.hpp"

namespace {

constexpr uint16_t virtual_vendor_id  = 0x91cb;
constexpr uint16_t virtual_product_id = 0x6d70;

int open_uinput()
{
    const int fd = open("/dev/uinput", O_WRONLY | O_NONBLOCK | O_CLOEXEC);
    if (fd < 0) {
        throw std::runtime_error(std::string("Unable to open /dev/uinput: ") + std::strerror(errno));
    }

    return fd;
}

void create_device(const int fd, const std::string & name, const uint16_t product)
{
    uinput_setup usetup{};
    std::strncpy(usetup.name, name.c_str(), UINPUT_MAX_NAME_SIZE - 1);
    usetup.id.bustype = BUS_VIRTUAL;
    usetup.id.vendor  = virtual_vendor_id;
    usetup.id.product = product;
    usetup.id.version = 0x1;
    assert_throw(ioctl(fd, UI_DEV_SETUP, &usetup) != -1);
    assert_throw(ioctl(fd, UI_DEV_CREATE) != -1);

    // give udev a moment to announce the device before the first event
    usleep(5000);
}

void destroy_device(const int fd)
{
    if (fd < 0) {
        return;
    }

    if (ioctl(fd, UI_DEV_DESTROY) == -1) {
        print_log(WARNING_LOG, "UI_DEV_DESTROY failed: ", std::strerror(errno), "\n");
    }
    close(fd);
}

}

void piper::emit(const int fd, const uint16_t type, const uint16_t code, const int32_t value)
{
    input_event ev{};
    ev.type = type;
    ev.code = code;
    ev.value = value;
    gettimeofday(&ev.time, nullptr);

    ssize_t written;
    do {
        written = write(fd, &ev, sizeof(ev));
    } while (written == -1 && errno == EINTR);

    if (written != static_cast<ssize_t>(sizeof(ev))) {
        print_log(ERROR_LOG, "Dropped event type=", type, " code=", code, " value=", value, ": ",
            (written == -1 ? std::strerror(errno) : "short write"), "\n");
    }
}

void piper::key_sink::write_step(const uint16_t code, const bool press)
{
    write_event(EV_KEY, code, press ? 1 : 0);
    write_event(EV_SYN, SYN_REPORT, 0); // sync
}

void piper::key_sink::send(const std::vector<key_step_t> & steps)
{
    std::lock_guard<std::mutex> lock(sequence_mutex);
    for (const auto & [code, press] : steps) {
        write_step(code, press);
    }
}

void piper::key_sink::send_holding(const uint16_t modifier, const std::vector<key_step_t> & steps)
{
    std::lock_guard<std::mutex> lock(sequence_mutex);
    if (std::ranges::find(held, modifier) == held.end())
    {
        write_step(modifier, true);
        held.push_back(modifier);
    }

    for (const auto & [code, press] : steps) {
        write_step(code, press);
    }
}

void piper::key_sink::release_held()
{
    std::lock_guard<std::mutex> lock(sequence_mutex);
    while (!held.empty())
    {
        const auto code = held.back();
        held.pop_back();
        write_step(code, false);
    }
}

bool piper::key_sink::holding() const
{
    std::lock_guard<std::mutex> lock(sequence_mutex);
    return !held.empty();
}

piper::virtual_keyboard::virtual_keyboard(const std::string & name)
{
    fd = open_uinput();
    try
    {
        assert_throw(ioctl(fd, UI_SET_EVBIT, EV_KEY) != -1);
        assert_throw(ioctl(fd, UI_SET_EVBIT, EV_SYN) != -1);

        // every keyboard key; buttons belong to the pointer
        for (unsigned int key = KEY_ESC; key < BTN_MISC; key++) {
            assert_throw(ioctl(fd, UI_SET_KEYBIT, key) != -1);
        }

        create_device(fd, name, virtual_product_id);
    }
    catch (const std::exception &)
    {
        close(fd);
        throw;
    }
}

piper::virtual_keyboard::~virtual_keyboard()
{
    destroy_device(fd);
}

void piper::virtual_keyboard::write_event(const uint16_t type, const uint16_t code, const int32_t value)
{
    emit(fd, type, code, value);
}

piper::virtual_pointer::virtual_pointer(const std::string & name)
{
    fd = open_uinput();
    try
    {
        /* event & key capability bits */
        assert_throw(ioctl(fd, UI_SET_EVBIT, EV_KEY) != -1);
        assert_throw(ioctl(fd, UI_SET_EVBIT, EV_REL) != -1);
        assert_throw(ioctl(fd, UI_SET_EVBIT, EV_SYN) != -1);

        for (unsigned int button = BTN_MOUSE; button <= BTN_TASK; button++) {
            assert_throw(ioctl(fd, UI_SET_KEYBIT, button) != -1);
        }
        for (unsigned int button = BTN_MISC; button <= BTN_9; button++) {
            assert_throw(ioctl(fd, UI_SET_KEYBIT, button) != -1);
        }
        // gaming mice report their extra buttons as keys
        for (unsigned int key = KEY_ESC; key < BTN_MISC; key++) {
            assert_throw(ioctl(fd, UI_SET_KEYBIT, key) != -1);
        }

        assert_throw(ioctl(fd, UI_SET_RELBIT, REL_X) != -1);
        assert_throw(ioctl(fd, UI_SET_RELBIT, REL_Y) != -1);
        assert_throw(ioctl(fd, UI_SET_RELBIT, REL_WHEEL) != -1);
        assert_throw(ioctl(fd, UI_SET_RELBIT, REL_HWHEEL) != -1);
        assert_throw(ioctl(fd, UI_SET_PROPBIT, INPUT_PROP_POINTER) != -1);

        create_device(fd, name, virtual_product_id + 1);
    }
    catch (const std::exception &)
    {
        close(fd);
        throw;
    }
}

piper::virtual_pointer::~virtual_pointer()
{
    destroy_device(fd);
}

void piper::virtual_pointer::button(const uint16_t code, const bool pressed)
{
    std::lock_guard<std::mutex> lock(pointer_mutex);
    emit(fd, EV_KEY, code, pressed ? 1 : 0);
    emit(fd, EV_SYN, SYN_REPORT, 0);
}

void piper::virtual_pointer::motion(const int32_t dx, const int32_t dy)
{
    if (dx == 0 && dy == 0) {
        return;
    }

    std::lock_guard<std::mutex> lock(pointer_mutex);
    if (dx != 0) emit(fd, EV_REL, REL_X, dx);
    if (dy != 0) emit(fd, EV_REL, REL_Y, dy);
    emit(fd, EV_SYN, SYN_REPORT, 0);
}

void piper::virtual_pointer::scroll(const int32_t vertical, const int32_t horizontal)
{
    if (vertical == 0 && horizontal == 0) {
        return;
    }

    std::lock_guard<std::mutex> lock(pointer_mutex);
    if (vertical != 0) emit(fd, EV_REL, REL_WHEEL, vertical);
    if (horizontal != 0) emit(fd, EV_REL, REL_HWHEEL, horizontal);
    emit(fd, EV_SYN, SYN_REPORT, 0);
}
