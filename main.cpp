/* main.cpp
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

#include "log.hpp"
#include "color.h"
#include "config_reader.h"
#include "device_locator.h"
#include "device_reader.h"
#include "mapping_table.h"
#include "piper_error.h"
#include "service_loop.h"
#include "virtual_device.h"
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <unistd.h>

#ifndef PIPER_VERSION
# define PIPER_VERSION "0.0.0"
#endif
#ifndef PIPER_BUILD_ID
# define PIPER_BUILD_ID "unknown"
#endif
#ifndef PIPER_BUILD_TIME
# define PIPER_BUILD_TIME "unknown"
#endif

namespace fs = std::filesystem;

namespace {

const fs::path LockFilePath = "/tmp/.MicePiper.lock";

int check_config(const piper::service_config_t & config)
{
    const auto table = piper::mapping_table::build(config.mapping);
    print_log(INFO_LOG, "Configuration OK: device \"", config.settings.device, "\", ",
        config.settings.grab == piper::grab_mode_t::exclusive ? "exclusive" : "shared", " grab, ",
        table.size(), " mapping(s)\n");
    for (const auto & [chord, action] : table.entries()) {
        print_log(INFO_LOG, "    ", piper::describe_chord(chord), " -> ", piper::describe_action(action), "\n");
    }

    return EXIT_SUCCESS;
}

void remove_lock_file()
{
    print_log(INFO_LOG, "Removing lock file...");
    std::error_code ec;
    if (!fs::remove(LockFilePath, ec)) {
        print_log(WARNING_LOG, "\n[WARNING] Lock file cannot be removed or doesn't exist, ignored\n");
        return;
    }
    print_log(INFO_LOG, "done.\n");
}

}

int main(int argc, char** argv)
{
    bool lock_created = false;
    try
    {
        // journald does not render escape sequences
        if (std::getenv("JOURNAL_STREAM") != nullptr) {
            color::g_no_color = true;
        }

        print_log(INFO_LOG, "Mice Piper mouse chord service [BuildID=", PIPER_BUILD_ID, ", BuildTime=", PIPER_BUILD_TIME,
            "] version " PIPER_VERSION "\n");

        const bool check_only = argc == 3 && std::string(argv[2]) == "--check";
        if (argc != 2 && !check_only)
        {
            std::cerr << "Usage: " << argv[0] << " <config_file> [--check]" << std::endl;
            return EXIT_FAILURE;
        }

        const std::string config_path = argv[1];
        print_log(INFO_LOG, "Loading configuration ", config_path, "\n");
        auto config = piper::load_service_config(config_path);

        if (check_only) {
            return check_config(config);
        }

        print_log(INFO_LOG, "Creating lock file...");
        if (fs::exists(LockFilePath)) {
            print_log(ERROR_LOG, "\n[ERROR] Lock file exists. If you believe this is an error, remove the file ",
                LockFilePath.string(), "\n");
            throw std::runtime_error("Lock file exists");
        }
        else
        {
            std::ofstream ofs(LockFilePath);
            if (!ofs) {
                print_log(ERROR_LOG, "Failed to create lock file\n");
                throw std::runtime_error("Failed to create lock file");
            }
            ofs << getpid() << std::endl;
            lock_created = true;
            print_log(INFO_LOG, "done.\n");
        }

        std::signal(SIGINT, piper::signal_registration::deliver);
        std::signal(SIGTERM, piper::signal_registration::deliver);
        std::signal(SIGHUP, piper::signal_registration::deliver);
        std::signal(SIGPIPE, SIG_IGN);

        print_log(INFO_LOG, "Initializing Linux input interface for virtual keyboard...");
        piper::virtual_keyboard keyboard("Mice Piper Virtual Keyboard");
        print_log(INFO_LOG, "done.\n");

        std::unique_ptr<piper::virtual_pointer> pointer;
        if (config.settings.grab == piper::grab_mode_t::exclusive)
        {
            print_log(INFO_LOG, "Initializing Linux input interface for virtual mouse...");
            pointer = std::make_unique<piper::virtual_pointer>("Mice Piper Virtual Pointer");
            print_log(INFO_LOG, "done.\n");
        }

        const auto device = config.settings.device;
        const auto grab = config.settings.grab;
        auto open_device = [device, grab, sink = pointer.get()](const int wake_fd)->std::unique_ptr<piper::event_source>
        {
            return std::make_unique<piper::device_reader>(piper::resolve_device_node(device), grab, sink, wake_fd);
        };

        {
            piper::service_loop loop(std::move(config), keyboard, pointer.get(), open_device, config_path);
            piper::signal_registration registration(loop);
            loop.run();
        }

        remove_lock_file();
        return EXIT_SUCCESS;
    }
    catch (const std::exception &e)
    {
        print_log(ERROR_LOG, e.what(), '\n');
        if (lock_created) {
            remove_lock_file();
        }
        return EXIT_FAILURE;
    }
}
