/* key_names.cpp
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

#include "key_names.h"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <map>
#include <ranges>

#define KEY_ENTRY(code) { code, #code }

namespace {

const std::map < unsigned int, std::string_view > key_id_to_str_translation_table = {
    // mouse and generic buttons
    KEY_ENTRY(BTN_LEFT), KEY_ENTRY(BTN_RIGHT), KEY_ENTRY(BTN_MIDDLE),
    KEY_ENTRY(BTN_SIDE), KEY_ENTRY(BTN_EXTRA), KEY_ENTRY(BTN_FORWARD),
    KEY_ENTRY(BTN_BACK), KEY_ENTRY(BTN_TASK),
    KEY_ENTRY(BTN_0), KEY_ENTRY(BTN_1), KEY_ENTRY(BTN_2), KEY_ENTRY(BTN_3), KEY_ENTRY(BTN_4),
    KEY_ENTRY(BTN_5), KEY_ENTRY(BTN_6), KEY_ENTRY(BTN_7), KEY_ENTRY(BTN_8), KEY_ENTRY(BTN_9),
    KEY_ENTRY(BTN_TRIGGER_HAPPY1), KEY_ENTRY(BTN_TRIGGER_HAPPY2), KEY_ENTRY(BTN_TRIGGER_HAPPY3),
    KEY_ENTRY(BTN_TRIGGER_HAPPY4), KEY_ENTRY(BTN_TRIGGER_HAPPY5), KEY_ENTRY(BTN_TRIGGER_HAPPY6),
    KEY_ENTRY(BTN_TRIGGER_HAPPY7), KEY_ENTRY(BTN_TRIGGER_HAPPY8),

    // modifiers
    KEY_ENTRY(KEY_LEFTCTRL), KEY_ENTRY(KEY_RIGHTCTRL), KEY_ENTRY(KEY_LEFTSHIFT), KEY_ENTRY(KEY_RIGHTSHIFT),
    KEY_ENTRY(KEY_LEFTALT), KEY_ENTRY(KEY_RIGHTALT), KEY_ENTRY(KEY_LEFTMETA), KEY_ENTRY(KEY_RIGHTMETA),
    KEY_ENTRY(KEY_CAPSLOCK), KEY_ENTRY(KEY_NUMLOCK), KEY_ENTRY(KEY_SCROLLLOCK), KEY_ENTRY(KEY_FN),

    // letters
    KEY_ENTRY(KEY_A), KEY_ENTRY(KEY_B), KEY_ENTRY(KEY_C), KEY_ENTRY(KEY_D), KEY_ENTRY(KEY_E),
    KEY_ENTRY(KEY_F), KEY_ENTRY(KEY_G), KEY_ENTRY(KEY_H), KEY_ENTRY(KEY_I), KEY_ENTRY(KEY_J),
    KEY_ENTRY(KEY_K), KEY_ENTRY(KEY_L), KEY_ENTRY(KEY_M), KEY_ENTRY(KEY_N), KEY_ENTRY(KEY_O),
    KEY_ENTRY(KEY_P), KEY_ENTRY(KEY_Q), KEY_ENTRY(KEY_R), KEY_ENTRY(KEY_S), KEY_ENTRY(KEY_T),
    KEY_ENTRY(KEY_U), KEY_ENTRY(KEY_V), KEY_ENTRY(KEY_W), KEY_ENTRY(KEY_X), KEY_ENTRY(KEY_Y),
    KEY_ENTRY(KEY_Z),

    // digits
    KEY_ENTRY(KEY_1), KEY_ENTRY(KEY_2), KEY_ENTRY(KEY_3), KEY_ENTRY(KEY_4), KEY_ENTRY(KEY_5),
    KEY_ENTRY(KEY_6), KEY_ENTRY(KEY_7), KEY_ENTRY(KEY_8), KEY_ENTRY(KEY_9), KEY_ENTRY(KEY_0),

    // punctuation and whitespace
    KEY_ENTRY(KEY_ESC), KEY_ENTRY(KEY_TAB), KEY_ENTRY(KEY_ENTER), KEY_ENTRY(KEY_SPACE),
    KEY_ENTRY(KEY_BACKSPACE), KEY_ENTRY(KEY_MINUS), KEY_ENTRY(KEY_EQUAL), KEY_ENTRY(KEY_LEFTBRACE),
    KEY_ENTRY(KEY_RIGHTBRACE), KEY_ENTRY(KEY_BACKSLASH), KEY_ENTRY(KEY_SEMICOLON),
    KEY_ENTRY(KEY_APOSTROPHE), KEY_ENTRY(KEY_GRAVE), KEY_ENTRY(KEY_COMMA), KEY_ENTRY(KEY_DOT),
    KEY_ENTRY(KEY_SLASH), KEY_ENTRY(KEY_102ND),

    // function row
    KEY_ENTRY(KEY_F1), KEY_ENTRY(KEY_F2), KEY_ENTRY(KEY_F3), KEY_ENTRY(KEY_F4), KEY_ENTRY(KEY_F5),
    KEY_ENTRY(KEY_F6), KEY_ENTRY(KEY_F7), KEY_ENTRY(KEY_F8), KEY_ENTRY(KEY_F9), KEY_ENTRY(KEY_F10),
    KEY_ENTRY(KEY_F11), KEY_ENTRY(KEY_F12), KEY_ENTRY(KEY_F13), KEY_ENTRY(KEY_F14), KEY_ENTRY(KEY_F15),
    KEY_ENTRY(KEY_F16), KEY_ENTRY(KEY_F17), KEY_ENTRY(KEY_F18), KEY_ENTRY(KEY_F19), KEY_ENTRY(KEY_F20),
    KEY_ENTRY(KEY_F21), KEY_ENTRY(KEY_F22), KEY_ENTRY(KEY_F23), KEY_ENTRY(KEY_F24),

    // navigation
    KEY_ENTRY(KEY_INSERT), KEY_ENTRY(KEY_DELETE), KEY_ENTRY(KEY_HOME), KEY_ENTRY(KEY_END),
    KEY_ENTRY(KEY_PAGEUP), KEY_ENTRY(KEY_PAGEDOWN), KEY_ENTRY(KEY_UP), KEY_ENTRY(KEY_DOWN),
    KEY_ENTRY(KEY_LEFT), KEY_ENTRY(KEY_RIGHT), KEY_ENTRY(KEY_SYSRQ), KEY_ENTRY(KEY_PAUSE),
    KEY_ENTRY(KEY_COMPOSE), KEY_ENTRY(KEY_MENU),

    // keypad
    KEY_ENTRY(KEY_KP0), KEY_ENTRY(KEY_KP1), KEY_ENTRY(KEY_KP2), KEY_ENTRY(KEY_KP3), KEY_ENTRY(KEY_KP4),
    KEY_ENTRY(KEY_KP5), KEY_ENTRY(KEY_KP6), KEY_ENTRY(KEY_KP7), KEY_ENTRY(KEY_KP8), KEY_ENTRY(KEY_KP9),
    KEY_ENTRY(KEY_KPMINUS), KEY_ENTRY(KEY_KPPLUS), KEY_ENTRY(KEY_KPASTERISK), KEY_ENTRY(KEY_KPSLASH),
    KEY_ENTRY(KEY_KPDOT), KEY_ENTRY(KEY_KPENTER),

    // media and system
    KEY_ENTRY(KEY_MUTE), KEY_ENTRY(KEY_VOLUMEDOWN), KEY_ENTRY(KEY_VOLUMEUP), KEY_ENTRY(KEY_MICMUTE),
    KEY_ENTRY(KEY_PLAYPAUSE), KEY_ENTRY(KEY_NEXTSONG), KEY_ENTRY(KEY_PREVIOUSSONG),
    KEY_ENTRY(KEY_STOPCD), KEY_ENTRY(KEY_BRIGHTNESSDOWN), KEY_ENTRY(KEY_BRIGHTNESSUP),
    KEY_ENTRY(KEY_PRINT), KEY_ENTRY(KEY_SEARCH), KEY_ENTRY(KEY_CALC), KEY_ENTRY(KEY_WWW),
    KEY_ENTRY(KEY_MAIL), KEY_ENTRY(KEY_BACK), KEY_ENTRY(KEY_FORWARD), KEY_ENTRY(KEY_REFRESH),
    KEY_ENTRY(KEY_COPY), KEY_ENTRY(KEY_PASTE), KEY_ENTRY(KEY_CUT), KEY_ENTRY(KEY_UNDO),
    KEY_ENTRY(KEY_SLEEP), KEY_ENTRY(KEY_SCREENLOCK),
};

std::string upper(std::string_view str)
{
    std::string ret(str);
    std::ranges::transform(ret, ret.begin(), [](const unsigned char ch) { return static_cast<char>(std::toupper(ch)); });
    return ret;
}

}

std::string piper::key_name(const unsigned int code)
{
    const auto it = key_id_to_str_translation_table.find(code);
    if (it == key_id_to_str_translation_table.end()) {
        return std::to_string(code);
    }

    return std::string(it->second);
}

std::optional<unsigned int> piper::key_code(const std::string_view name)
{
    if (name.empty()) {
        return std::nullopt;
    }

    unsigned int code{};
    if (const auto [ptr, ec] = std::from_chars(name.data(), name.data() + name.size(), code);
        ec == std::errc() && ptr == name.data() + name.size())
    {
        if (code == 0 || code > KEY_MAX) {
            return std::nullopt;
        }
        return code;
    }

    const auto wanted = upper(name);
    const auto it = std::ranges::find_if(key_id_to_str_translation_table,
        [&](const auto & pair)->bool { return pair.second == wanted; });
    if (it == key_id_to_str_translation_table.end()) {
        return std::nullopt;
    }

    return it->first;
}
