/* chord_normalizer.cpp
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

#include "chord_normalizer.h"
#include "log.hpp"
#include <algorithm>

namespace {
piper::timestamp_us_t to_us(const std::chrono::milliseconds ms)
{
    return static_cast<piper::timestamp_us_t>(std::chrono::duration_cast<std::chrono::microseconds>(ms).count());
}
}

piper::chord_normalizer::chord_normalizer(normalizer_settings_t settings)
    : config(settings)
{
    if (config.window.count() < 0 || config.debounce.count() < 0
        || config.long_press.count() < 0 || config.repeat_interval.count() <= 0)
    {
        throw std::invalid_argument("Normalizer intervals must not be negative and the repeat interval must be positive");
    }
}

std::vector<piper::chord_t> piper::chord_normalizer::feed(const raw_event_t & event)
{
    // anything that expired before this transition happened goes out first
    auto out = advance(event.timestamp);

    if (event.direction == button_direction_t::pressed) {
        on_press(event.button_code, event.timestamp, out);
    } else {
        on_release(event.button_code, event.timestamp);
    }

    return out;
}

std::vector<piper::chord_t> piper::chord_normalizer::advance(const timestamp_us_t now)
{
    std::vector<chord_t> out;

    if (phase == phase_t::collecting && now >= window_deadline)
    {
        out.push_back(make_chord(window_deadline, false));
        print_log(DEBUG_LOG, "Chord ", describe_chord(out.back().buttons), " completed\n");

        if (pressed.empty())
        {
            // every member was a short click inside the window
            phase = phase_t::idle;
            members.clear();
        }
        else
        {
            phase = phase_t::held;
            if (config.repeat_enabled) {
                next_repeat = window_deadline + to_us(config.long_press);
            }
        }
    }

    if (phase == phase_t::held && next_repeat && now >= *next_repeat)
    {
        out.push_back(make_chord(*next_repeat, true));
        print_log(DEBUG_LOG, "Chord ", describe_chord(out.back().buttons), " repeated\n");

        auto next = *next_repeat + to_us(config.repeat_interval);
        if (next <= now) { // late caller, do not burst
            next = now + to_us(config.repeat_interval);
        }
        next_repeat = next;
    }

    return out;
}

std::optional<piper::timestamp_us_t> piper::chord_normalizer::next_deadline() const
{
    switch (phase)
    {
    case phase_t::collecting:
        return window_deadline;
    case phase_t::held:
        return next_repeat;
    case phase_t::idle:
    default:
        return std::nullopt;
    }
}

void piper::chord_normalizer::reset()
{
    phase = phase_t::idle;
    members.clear();
    pressed.clear();
    ignored.clear();
    last_release.clear();
    window_deadline = 0;
    next_repeat.reset();
}

void piper::chord_normalizer::on_press(const button_code_t button, const timestamp_us_t when, std::vector<chord_t> & out)
{
    if (pressed.contains(button) || ignored.contains(button)) {
        return; // already down, nothing transitioned
    }

    if (const auto it = last_release.find(button);
        it != last_release.end() && when >= it->second && when - it->second < to_us(config.debounce))
    {
        print_log(DEBUG_LOG, "Bounce on ", describe_chord({button}), " ignored\n");
        ignored.insert(button);
        return;
    }

    switch (phase)
    {
    case phase_t::idle:
        members = { button };
        pressed = { button };
        if (config.window.count() == 0)
        {
            out.push_back(make_chord(when, false));
            print_log(DEBUG_LOG, "Chord ", describe_chord(out.back().buttons), " completed\n");
            phase = phase_t::held;
            if (config.repeat_enabled) {
                next_repeat = when + to_us(config.long_press);
            }
        }
        else
        {
            phase = phase_t::collecting;
            window_deadline = when + to_us(config.window);
        }
        break;

    case phase_t::collecting:
        members.insert(button);
        pressed.insert(button);
        break;

    case phase_t::held:
        print_log(DEBUG_LOG, "Press of ", describe_chord({button}), " while chord ",
            describe_chord(make_chord(when, false).buttons), " is held, ignored\n");
        ignored.insert(button);
        break;
    }
}

void piper::chord_normalizer::on_release(const button_code_t button, const timestamp_us_t when)
{
    if (ignored.erase(button))
    {
        last_release[button] = when;
        return;
    }

    if (!pressed.erase(button)) {
        return; // never part of a chord
    }

    last_release[button] = when;
    if (phase == phase_t::held)
    {
        next_repeat.reset();
        if (pressed.empty())
        {
            phase = phase_t::idle;
            members.clear();
        }
    }
}

piper::chord_t piper::chord_normalizer::make_chord(const timestamp_us_t when, const bool repeat) const
{
    return chord_t {
        .buttons = chord_key_t(members.begin(), members.end()),
        .completed_at = when,
        .repeat = repeat,
    };
}
