/* builtin_functions.cpp
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

#include "builtin_functions.h"
#include "virtual_device.h"
#include "log.hpp"
#include <linux/input-event-codes.h>
#include <cctype>
#include <charconv>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <ranges>

namespace {

struct text_key_t {
    uint16_t code;
    bool shift;
};

// US layout, the characters a mouse macro realistically types
const std::map < char, text_key_t > symbol_keys = {
    { ' ',  { KEY_SPACE, false } },       { '\n', { KEY_ENTER, false } },
    { '\t', { KEY_TAB, false } },         { '.',  { KEY_DOT, false } },
    { ',',  { KEY_COMMA, false } },       { ';',  { KEY_SEMICOLON, false } },
    { ':',  { KEY_SEMICOLON, true } },    { '\'', { KEY_APOSTROPHE, false } },
    { '"',  { KEY_APOSTROPHE, true } },   { '-',  { KEY_MINUS, false } },
    { '_',  { KEY_MINUS, true } },        { '=',  { KEY_EQUAL, false } },
    { '+',  { KEY_EQUAL, true } },        { '/',  { KEY_SLASH, false } },
    { '?',  { KEY_SLASH, true } },        { '\\', { KEY_BACKSLASH, false } },
    { '|',  { KEY_BACKSLASH, true } },    { '[',  { KEY_LEFTBRACE, false } },
    { '{',  { KEY_LEFTBRACE, true } },    { ']',  { KEY_RIGHTBRACE, false } },
    { '}',  { KEY_RIGHTBRACE, true } },   { '`',  { KEY_GRAVE, false } },
    { '~',  { KEY_GRAVE, true } },        { '<',  { KEY_COMMA, true } },
    { '>',  { KEY_DOT, true } },          { '!',  { KEY_1, true } },
    { '@',  { KEY_2, true } },            { '#',  { KEY_3, true } },
    { '$',  { KEY_4, true } },            { '%',  { KEY_5, true } },
    { '^',  { KEY_6, true } },            { '&',  { KEY_7, true } },
    { '*',  { KEY_8, true } },            { '(',  { KEY_9, true } },
    { ')',  { KEY_0, true } },
};

// KEY_A..KEY_Z and KEY_1..KEY_0 are not contiguous in alphabet order
constexpr uint16_t letter_keys[] = {
    KEY_A, KEY_B, KEY_C, KEY_D, KEY_E, KEY_F, KEY_G, KEY_H, KEY_I, KEY_J, KEY_K, KEY_L, KEY_M,
    KEY_N, KEY_O, KEY_P, KEY_Q, KEY_R, KEY_S, KEY_T, KEY_U, KEY_V, KEY_W, KEY_X, KEY_Y, KEY_Z,
};

constexpr uint16_t digit_keys[] = {
    KEY_0, KEY_1, KEY_2, KEY_3, KEY_4, KEY_5, KEY_6, KEY_7, KEY_8, KEY_9,
};

std::optional<text_key_t> char_to_key(const char ch)
{
    const auto uch = static_cast<unsigned char>(ch);
    if (std::isalpha(uch)) {
        return text_key_t { letter_keys[std::tolower(uch) - 'a'], std::isupper(uch) != 0 };
    }

    if (std::isdigit(uch)) {
        return text_key_t { digit_keys[uch - '0'], false };
    }

    if (const auto it = symbol_keys.find(ch); it != symbol_keys.end()) {
        return it->second;
    }

    return std::nullopt;
}

constexpr unsigned long max_sleep_ms = 60000;

unsigned long parse_sleep(const std::string & parameters)
{
    unsigned long ms{};
    const auto [ptr, ec] = std::from_chars(parameters.data(), parameters.data() + parameters.size(), ms);
    if (parameters.empty() || ec != std::errc() || ptr != parameters.data() + parameters.size() || ms > max_sleep_ms) {
        throw std::invalid_argument("sleep_ms expects a duration in milliseconds up to " + std::to_string(max_sleep_ms));
    }

    return ms;
}

piper::builtin_registry make_defaults()
{
    using piper::key_sink;
    piper::builtin_registry registry;

    auto combo = [&](const std::string & name, std::initializer_list<uint16_t> keys)->void
    {
        const std::vector<uint16_t> held(keys);
        registry.add(name, [held](key_sink & keyboard, const std::string &)->void
        {
            std::vector<piper::key_step_t> steps;
            for (const auto key : held) {
                steps.push_back({ .code = key, .press = true });
            }
            for (const auto key : held | std::views::reverse) {
                steps.push_back({ .code = key, .press = false });
            }
            keyboard.send(steps);
        });
    };

    // editing
    combo("copy",           { KEY_LEFTCTRL, KEY_C });
    combo("paste",          { KEY_LEFTCTRL, KEY_V });
    combo("cut",            { KEY_LEFTCTRL, KEY_X });
    combo("select_all",     { KEY_LEFTCTRL, KEY_A });
    combo("save",           { KEY_LEFTCTRL, KEY_S });
    combo("undo",           { KEY_LEFTCTRL, KEY_Z });
    combo("redo",           { KEY_LEFTCTRL, KEY_LEFTSHIFT, KEY_Z });
    combo("delete",         { KEY_DELETE });

    // desktop
    combo("new_tab",        { KEY_LEFTCTRL, KEY_T });
    combo("close_tab",      { KEY_LEFTCTRL, KEY_W });
    combo("close_window",   { KEY_LEFTALT, KEY_F4 });
    combo("minimise_all",   { KEY_LEFTMETA, KEY_D });
    combo("new_terminal",   { KEY_LEFTCTRL, KEY_LEFTALT, KEY_T });
    combo("switch_window",  { KEY_LEFTALT, KEY_TAB });

    // Alt stays down, so pressing it again walks on through the window list
    registry.add("window_menu",
        [](key_sink & keyboard, const std::string &)->void
        {
            keyboard.send_holding(KEY_LEFTALT, { { .code = KEY_TAB, .press = true }, { .code = KEY_TAB, .press = false } });
        },
        {}, true);

    // media and brightness, handled by the desktop like the keyboard's own keys
    combo("volume_up",       { KEY_VOLUMEUP });
    combo("volume_down",     { KEY_VOLUMEDOWN });
    combo("mute",            { KEY_MUTE });
    combo("play_pause",      { KEY_PLAYPAUSE });
    combo("next_track",      { KEY_NEXTSONG });
    combo("previous_track",  { KEY_PREVIOUSSONG });
    combo("brightness_up",   { KEY_BRIGHTNESSUP });
    combo("brightness_down", { KEY_BRIGHTNESSDOWN });

    registry.add("type_text",
        [](key_sink & keyboard, const std::string & parameters)->void
        {
            std::string unsupported;
            const auto steps = piper::text_to_key_steps(parameters, &unsupported);
            if (!unsupported.empty()) {
                print_log(WARNING_LOG, "Characters without a key skipped: \"", unsupported, "\"\n");
            }
            keyboard.send(steps);
        },
        [](const std::string & parameters)->void
        {
            if (parameters.empty()) {
                throw std::invalid_argument("type_text needs the text to type");
            }
        });

    registry.add("sleep_ms",
        [](key_sink &, const std::string & parameters)->void
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(parse_sleep(parameters)));
        },
        [](const std::string & parameters)->void { (void)parse_sleep(parameters); });

    return registry;
}

}

const piper::builtin_registry & piper::builtin_registry::defaults()
{
    static const builtin_registry registry = make_defaults();
    return registry;
}

void piper::builtin_registry::add(const std::string & name, handler_t handler, validator_t validator, const bool holds_keys)
{
    handlers[name] = entry_t { .handler = std::move(handler), .validator = std::move(validator), .holds_keys = holds_keys };
}

void piper::builtin_registry::validate(const std::string & name, const std::string & parameters) const
{
    const auto it = handlers.find(name);
    if (it == handlers.end()) {
        throw std::invalid_argument("unknown builtin \"" + name + "\"");
    }

    if (it->second.validator) {
        it->second.validator(parameters);
    }
}

const piper::builtin_registry::handler_t * piper::builtin_registry::find(const std::string & name) const
{
    const auto it = handlers.find(name);
    return it == handlers.end() ? nullptr : &it->second.handler;
}

bool piper::builtin_registry::holds_keys(const std::string & name) const
{
    const auto it = handlers.find(name);
    return it != handlers.end() && it->second.holds_keys;
}

std::vector<std::string> piper::builtin_registry::names() const
{
    std::vector<std::string> ret;
    ret.reserve(handlers.size());
    for (const auto & name : handlers | std::views::keys) {
        ret.push_back(name);
    }

    return ret;
}

std::vector<piper::key_step_t> piper::text_to_key_steps(const std::string_view text, std::string * unsupported)
{
    std::vector<key_step_t> steps;
    for (const auto ch : text)
    {
        const auto key = char_to_key(ch);
        if (!key)
        {
            if (unsupported != nullptr) {
                unsupported->push_back(ch);
            }
            continue;
        }

        if (key->shift) steps.push_back({ .code = KEY_LEFTSHIFT, .press = true });
        steps.push_back({ .code = key->code, .press = true });
        steps.push_back({ .code = key->code, .press = false });
        if (key->shift) steps.push_back({ .code = KEY_LEFTSHIFT, .press = false });
    }

    return steps;
}
