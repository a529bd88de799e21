/* input_event.h
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

#ifndef INPUT_EVENT_H
#define INPUT_EVENT_H

#include <cstdint>
#include <string>
#include <vector>

namespace piper {

using button_code_t = uint16_t;
using timestamp_us_t = uint64_t; // CLOCK_MONOTONIC, microseconds

enum class button_direction_t { pressed, released };

/// One physical button transition as delivered by the kernel
struct raw_event_t {
    std::string device_id;
    button_code_t button_code{};
    button_direction_t direction = button_direction_t::pressed;
    timestamp_us_t timestamp{};
};

/// Sorted, duplicate free set of button codes. This is the identity of a chord.
using chord_key_t = std::vector<button_code_t>;

chord_key_t canonicalize(std::vector<button_code_t> buttons);

struct chord_t {
    chord_key_t buttons;
    timestamp_us_t completed_at{};
    bool repeat = false; // re-emitted by the long-press policy

    // chords are the same chord when their button sets are
    bool operator==(const chord_t & other) const { return buttons == other.buttons; }
};

/// "BTN_SIDE+BTN_EXTRA"
std::string describe_chord(const chord_key_t & buttons);

timestamp_us_t monotonic_now_us();

}

#endif //INPUT_EVENT_H
