/* device_locator.h
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

#ifndef DEVICE_LOCATOR_H
#define DEVICE_LOCATOR_H

#include <string>

namespace piper {

/// Resolve the "device" setting to an /dev/input/event* node.
/// A path (by-id symlinks included) is canonicalized and checked against udev;
/// anything else is matched against the names of input devices, mice first.
/// Throws device_unavailable when nothing matches.
std::string resolve_device_node(const std::string & device);

}

#endif //DEVICE_LOCATOR_H
