/* device_locator.cpp
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

#include "device_locator.h"
#include "piper_error.h"
#include "log.hpp"
#include <libudev.h>
#include <sys/stat.h>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <memory>
#include <vector>

namespace fs = std::filesystem;

namespace {

struct udev_deleter {
    void operator()(udev * ptr) const { udev_unref(ptr); }
    void operator()(udev_device * ptr) const { udev_device_unref(ptr); }
    void operator()(udev_enumerate * ptr) const { udev_enumerate_unref(ptr); }
};

using udev_ptr = std::unique_ptr<udev, udev_deleter>;
using udev_device_ptr = std::unique_ptr<udev_device, udev_deleter>;
using udev_enumerate_ptr = std::unique_ptr<udev_enumerate, udev_deleter>;

bool is_event_node(const std::string & devnode)
{
    return devnode.starts_with("/dev/input/event");
}

std::string from_path(udev * context, const std::string & device)
{
    std::error_code ec;
    const auto canonical = fs::canonical(device, ec);
    if (ec) {
        throw piper::device_unavailable(device + ": " + ec.message());
    }

    struct stat st {};
    if (stat(canonical.c_str(), &st) != 0) {
        throw piper::device_unavailable(canonical.string() + ": " + std::strerror(errno));
    }

    if (!S_ISCHR(st.st_mode)) {
        throw piper::device_unavailable(canonical.string() + " is not a character device");
    }

    const udev_device_ptr dev(udev_device_new_from_devnum(context, 'c', st.st_rdev));
    const char * subsystem = dev ? udev_device_get_subsystem(dev.get()) : nullptr;
    if (subsystem == nullptr || std::strcmp(subsystem, "input") != 0 || !is_event_node(canonical.string())) {
        throw piper::device_unavailable(canonical.string() + " is not an evdev input node");
    }

    return canonical.string();
}

std::string from_name(udev * context, const std::string & device)
{
    const udev_enumerate_ptr enumerate(udev_enumerate_new(context));
    assert_throw(enumerate != nullptr);
    assert_throw(udev_enumerate_add_match_subsystem(enumerate.get(), "input") == 0);
    assert_throw(udev_enumerate_add_match_sysname(enumerate.get(), "event*") == 0);
    assert_throw(udev_enumerate_scan_devices(enumerate.get()) == 0);

    std::vector<std::string> mice, others;
    udev_list_entry * entry;
    udev_list_entry_foreach(entry, udev_enumerate_get_list_entry(enumerate.get()))
    {
        const udev_device_ptr dev(udev_device_new_from_syspath(context, udev_list_entry_get_name(entry)));
        if (!dev) {
            continue;
        }

        const char * devnode = udev_device_get_devnode(dev.get());
        // the name lives on the parent "inputN" device
        udev_device * parent = udev_device_get_parent(dev.get());
        const char * name = parent ? udev_device_get_sysattr_value(parent, "name") : nullptr;
        if (devnode == nullptr || name == nullptr || device != name) {
            continue;
        }

        const char * is_mouse = udev_device_get_property_value(dev.get(), "ID_INPUT_MOUSE");
        print_log(DEBUG_LOG, "Device \"", name, "\" at ", devnode, is_mouse ? " (mouse)" : "", "\n");
        (is_mouse && std::strcmp(is_mouse, "1") == 0 ? mice : others).emplace_back(devnode);
    }

    // several nodes share a name when a mouse also exposes keyboard or consumer interfaces
    if (!mice.empty()) return mice.front();
    if (!others.empty()) return others.front();
    throw piper::device_unavailable("No input device named \"" + device + "\"");
}

}

std::string piper::resolve_device_node(const std::string & device)
{
    const udev_ptr context(udev_new());
    if (!context) {
        throw device_unavailable("Failed to create udev context");
    }

    const auto node = device.starts_with("/") ? from_path(context.get(), device) : from_name(context.get(), device);
    print_log(DEBUG_LOG, "Device ", device, " resolved to ", node, "\n");
    return node;
}
