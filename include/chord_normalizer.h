/* chord_normalizer.h
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

#ifndef CHORD_NORMALIZER_H
#define CHORD_NORMALIZER_H

#include <chrono>
#include <map>
#include <optional>
#include <set>
#include <vector>
#include "input_event.h"

namespace piper {

struct normalizer_settings_t {
    std::chrono::milliseconds window{50};           // coincidence window, anchored at the first press
    std::chrono::milliseconds debounce{5};          // a re-press closer than this to its release is a bounce
    bool repeat_enabled = false;                    // long-press policy knob, off unless configured
    std::chrono::milliseconds long_press{500};
    std::chrono::milliseconds repeat_interval{100};
};

/*
 * Turns raw press/release transitions into chords.
 *
 *   idle --press--> collecting --window expires--> held --all released--> idle
 *
 * While collecting, every press joins the chord. When the window expires the
 * chord is emitted once and nothing new can start until each of its buttons is
 * released. Presses seen while held are ignored along with their releases, and
 * so are releases of buttons that never joined a chord.
 *
 * Time only moves through event timestamps and advance(), so the class never
 * reads a clock and can be driven by synthetic sequences.
 */
class chord_normalizer
{
public:
    explicit chord_normalizer(normalizer_settings_t settings = {});

    std::vector<chord_t> feed(const raw_event_t & event);
    std::vector<chord_t> advance(timestamp_us_t now);

    /// When advance() next has something to do, if anything
    [[nodiscard]] std::optional<timestamp_us_t> next_deadline() const;
    [[nodiscard]] bool idle() const { return phase == phase_t::idle; }
    [[nodiscard]] const normalizer_settings_t & settings() const { return config; }

    /// Forget every pending press, e.g. after the device went away
    void reset();

private:
    enum class phase_t { idle, collecting, held };

    void on_press(button_code_t button, timestamp_us_t when, std::vector<chord_t> & out);
    void on_release(button_code_t button, timestamp_us_t when);
    chord_t make_chord(timestamp_us_t when, bool repeat) const;

    normalizer_settings_t config;
    phase_t phase = phase_t::idle;
    std::set<button_code_t> members;    // buttons of the chord being collected or held
    std::set<button_code_t> pressed;    // members still physically down
    std::set<button_code_t> ignored;    // down, but their press was dropped
    std::map<button_code_t, timestamp_us_t> last_release;
    timestamp_us_t window_deadline = 0;
    std::optional<timestamp_us_t> next_repeat;
};

}

#endif //CHORD_NORMALIZER_H
