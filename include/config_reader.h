/* config_reader.h
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

#ifndef CONFIG_READER_H
#define CONFIG_READER_H

#include <chrono>
#include <istream>
#include <string>
#include "chord_normalizer.h"
#include "dispatcher.h"
#include "mapping_table.h"

namespace piper {

enum class grab_mode_t { exclusive, shared };

/// Everything except the mapping. Changing any of it needs a restart.
struct service_settings_t {
    std::string device;
    grab_mode_t grab = grab_mode_t::exclusive;
    normalizer_settings_t normalizer;
    dispatcher_settings_t dispatcher;
    unsigned int workers = 3;
    std::size_t queue_limit = 32;
    std::chrono::milliseconds shutdown_grace{1000};
    unsigned int reconnect_attempts = 5;
    std::chrono::milliseconds reconnect_backoff{200};

    bool operator==(const service_settings_t & other) const;
};

struct service_config_t {
    service_settings_t settings;
    mapping_config_t mapping;
};

/// Throws invalid_mapping carrying "origin:line" on the first bad line
service_config_t read_service_config(std::istream & stream, const std::string & origin);

/// Opens and reads `path`; a file that cannot be opened is an invalid_mapping as well
service_config_t load_service_config(const std::string & path);

}

#endif //CONFIG_READER_H
