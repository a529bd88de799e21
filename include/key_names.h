/* key_names.h
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

#ifndef KEY_NAMES_H
#define KEY_NAMES_H

#include <linux/input-event-codes.h>
#include <optional>
#include <string>
#include <string_view>

namespace piper {

/// Kernel name of a key or button code ("KEY_LEFTCTRL", "BTN_SIDE"), or the decimal code if unnamed
std::string key_name(unsigned int code);

/// Accepts a kernel name (case-insensitive, "KEY_"/"BTN_" prefix required) or a decimal code
std::optional<unsigned int> key_code(std::string_view name);

}

#endif //KEY_NAMES_H
