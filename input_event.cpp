/* input_event.cpp
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

#include "input_event.h"
#include "key_names.h"
#include <algorithm>
#include <time.h>

piper::chord_key_t piper::canonicalize(std::vector<button_code_t> buttons)
{
    std::ranges::sort(buttons);
    const auto [first, last] = std::ranges::unique(buttons);
    buttons.erase(first, last);
    return buttons;
}

std::string piper::describe_chord(const chord_key_t & buttons)
{
    std::string ret;
    for (const auto button : buttons)
    {
        if (!ret.empty()) {
            ret += "+";
        }
        ret += key_name(button);
    }

    return ret.empty() ? "<empty>" : ret;
}

piper::timestamp_us_t piper::monotonic_now_us()
{
    timespec ts{};
    clock_gettime(CLOCK_MONOTONIC, &ts);
    return static_cast<timestamp_us_t>(ts.tv_sec) * 1000000 + static_cast<timestamp_us_t>(ts.tv_nsec) / 1000;
}
