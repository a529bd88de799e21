/* log.cpp
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
#include <regex>
#include <ranges>
#include <algorithm>
#include <cstdlib>

std::mutex debug::log_mutex;
std::atomic_uint debug::filter_level = !PIPER_DEBUG;
unsigned int debug::log_level = 1;
bool debug::endl_found_in_last_log = true;
std::ostream * debug::output = &std::cerr;

std::string debug::strip_func_name(const std::string & name)
{
    // "void piper::service_loop::run()" -> "piper::service_loop::run"
    const std::regex pattern(R"([\w:<>,\s\*&]+? ([\w:~<>]+)\(.*\).*)");
    if (std::smatch matches; std::regex_match(name, matches, pattern) && matches.size() > 1) {
        return matches[1];
    }
    return name;
}

namespace {
class init_instance_t
{
public:
    init_instance_t()
    {
        if (const auto log_level_env = std::getenv("LOG_LEVEL"); log_level_env != nullptr)
        {
            char * end = nullptr;
            const auto level = std::strtoul(log_level_env, &end, 10);
            if (end == log_level_env || *end != '\0') {
                debug::filter_level = !PIPER_DEBUG;
            } else {
                debug::filter_level = static_cast<unsigned>(std::min<unsigned long>(level, 3));
            }
        }

        // a service writes its journal to stderr unless told otherwise
        debug::output = &std::cerr;
        if (const auto log_output_env = std::getenv("LOG_OUTPUT"); log_output_env != nullptr)
        {
            std::string log_output = log_output_env;
            std::ranges::transform(log_output, log_output.begin(), ::tolower);
            if (log_output == "stdout")
            {
                debug::output = &std::cout;
            }
        }
    }
} log_init_instance;
}
