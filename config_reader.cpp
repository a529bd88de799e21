/* config_reader.cpp
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

#include "config_reader.h"
#include "key_names.h"
#include "piper_error.h"
#include "log.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <fstream>
#include <functional>
#include <map>
#include <sstream>
#include <vector>

namespace {

class line_error : public std::runtime_error
{
public:
    explicit line_error(const std::string & what) : std::runtime_error(what) { }
};

std::string trim(const std::string & str)
{
    auto is_space = [](const unsigned char c) { return std::isspace(c) != 0; };
    const auto begin = std::ranges::find_if_not(str, is_space);
    const auto end = std::find_if_not(str.rbegin(), str.rend(), is_space).base();
    return begin < end ? std::string(begin, end) : std::string();
}

std::vector<std::string> split(const std::string & str, const char delimiter)
{
    std::vector<std::string> ret;
    std::stringstream ss(str);
    std::string item;
    while (std::getline(ss, item, delimiter)) {
        ret.push_back(item);
    }
    if (!str.empty() && str.back() == delimiter) {
        ret.emplace_back(); // "BTN_SIDE+" has an empty last name
    }
    return ret;
}

/// Whatever follows the tokens already consumed from `ss`
std::string rest_of_line(std::istringstream & ss)
{
    std::string rest;
    std::getline(ss, rest);
    return trim(rest);
}

std::string next_token(std::istringstream & ss, const std::string & what)
{
    std::string token;
    if (!(ss >> token)) {
        throw line_error("missing " + what);
    }
    return token;
}

void expect_end(std::istringstream & ss)
{
    if (std::string extra; ss >> extra) {
        throw line_error("unexpected \"" + extra + "\"");
    }
}

unsigned long parse_number(std::istringstream & ss, const std::string & directive,
    const unsigned long min, const unsigned long max)
{
    const auto token = next_token(ss, "value for " + directive);
    expect_end(ss);

    unsigned long value{};
    const auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), value);
    if (ec != std::errc() || ptr != token.data() + token.size() || value < min || value > max) {
        throw line_error(directive + " expects a number in " + std::to_string(min) + ".." + std::to_string(max)
            + ", got \"" + token + "\"");
    }

    return value;
}

piper::button_code_t parse_code(const std::string & name)
{
    const auto code = piper::key_code(name);
    if (!code) {
        throw line_error("unknown key or button \"" + name + "\"");
    }
    return static_cast<piper::button_code_t>(*code);
}

piper::chord_key_t parse_chord(const std::string & token)
{
    std::vector<piper::button_code_t> buttons;
    for (const auto & name : split(token, '+')) {
        buttons.push_back(parse_code(name));
    }

    return piper::canonicalize(std::move(buttons));
}

// "KEY_LEFTCTRL+KEY_C" presses in order and releases in reverse, "KEY_X:down" is one edge
void append_key_step(const std::string & token, std::vector<piper::key_step_t> & steps)
{
    if (const auto colon = token.find(':'); colon != std::string::npos)
    {
        const auto code = parse_code(token.substr(0, colon));
        const auto edge = token.substr(colon + 1);
        if (edge == "down") {
            steps.push_back({ .code = code, .press = true });
        } else if (edge == "up") {
            steps.push_back({ .code = code, .press = false });
        } else {
            throw line_error("key edge must be \":down\" or \":up\", got \"" + token + "\"");
        }
        return;
    }

    std::vector<piper::button_code_t> held;
    for (const auto & name : split(token, '+')) {
        held.push_back(parse_code(name));
    }

    for (const auto code : held) {
        steps.push_back({ .code = code, .press = true });
    }
    for (auto it = held.rbegin(); it != held.rend(); ++it) {
        steps.push_back({ .code = *it, .press = false });
    }
}

piper::action_descriptor_t parse_action(std::istringstream & ss)
{
    const auto kind = next_token(ss, "action kind (keys, command or builtin)");
    if (kind == "keys")
    {
        piper::emit_key_sequence_t sequence;
        std::string token;
        while (ss >> token) {
            append_key_step(token, sequence.steps);
        }
        if (sequence.steps.empty()) {
            throw line_error("keys needs at least one key");
        }
        return sequence;
    }

    if (kind == "command")
    {
        auto line = rest_of_line(ss);
        if (line.empty()) {
            throw line_error("command needs a command line");
        }
        return piper::run_command_t { .command_line = std::move(line) };
    }

    if (kind == "builtin")
    {
        auto name = next_token(ss, "builtin name");
        return piper::builtin_function_t { .name = std::move(name), .parameters = rest_of_line(ss) };
    }

    throw line_error("unknown action kind \"" + kind + "\"");
}

bool parse_switch(std::istringstream & ss, const std::string & directive, const std::string & on, const std::string & off)
{
    const auto token = next_token(ss, "value for " + directive);
    expect_end(ss);
    if (token == on) return true;
    if (token == off) return false;
    throw line_error(directive + " expects " + on + " or " + off + ", got \"" + token + "\"");
}

}

bool piper::service_settings_t::operator==(const service_settings_t & other) const
{
    const auto & a = normalizer;
    const auto & b = other.normalizer;
    return device == other.device
        && grab == other.grab
        && a.window == b.window
        && a.debounce == b.debounce
        && a.repeat_enabled == b.repeat_enabled
        && a.long_press == b.long_press
        && a.repeat_interval == b.repeat_interval
        && dispatcher.builtin_timeout == other.dispatcher.builtin_timeout
        && dispatcher.command_timeout == other.dispatcher.command_timeout
        && dispatcher.builtin_threads == other.dispatcher.builtin_threads
        && workers == other.workers
        && queue_limit == other.queue_limit
        && shutdown_grace == other.shutdown_grace
        && reconnect_attempts == other.reconnect_attempts
        && reconnect_backoff == other.reconnect_backoff;
}

piper::service_config_t piper::read_service_config(std::istream & stream, const std::string & origin)
{
    using std::chrono::milliseconds;
    constexpr unsigned long max_ms = 3600 * 1000;

    service_config_t config;
    auto & settings = config.settings;

    using directive_handler_t = std::function<void(std::istringstream &)>;
    const std::map < std::string, directive_handler_t > directives = {
        { "device", [&](std::istringstream & ss) {
            settings.device = rest_of_line(ss);
            if (settings.device.empty()) throw line_error("device needs a path or a name");
        } },
        { "grab", [&](std::istringstream & ss) {
            settings.grab = parse_switch(ss, "grab", "exclusive", "shared") ? grab_mode_t::exclusive : grab_mode_t::shared;
        } },
        { "passthrough", [&](std::istringstream & ss) {
            std::string token;
            bool any = false;
            while (ss >> token) {
                config.mapping.passthrough.insert(parse_code(token));
                any = true;
            }
            if (!any) throw line_error("passthrough needs at least one button");
        } },
        { "window_ms", [&](std::istringstream & ss) {
            settings.normalizer.window = milliseconds(parse_number(ss, "window_ms", 0, max_ms));
        } },
        { "debounce_ms", [&](std::istringstream & ss) {
            settings.normalizer.debounce = milliseconds(parse_number(ss, "debounce_ms", 0, max_ms));
        } },
        { "repeat", [&](std::istringstream & ss) {
            settings.normalizer.repeat_enabled = parse_switch(ss, "repeat", "on", "off");
        } },
        { "long_press_ms", [&](std::istringstream & ss) {
            settings.normalizer.long_press = milliseconds(parse_number(ss, "long_press_ms", 0, max_ms));
        } },
        { "repeat_interval_ms", [&](std::istringstream & ss) {
            settings.normalizer.repeat_interval = milliseconds(parse_number(ss, "repeat_interval_ms", 1, max_ms));
        } },
        { "workers", [&](std::istringstream & ss) {
            settings.workers = static_cast<unsigned int>(parse_number(ss, "workers", 1, 16));
        } },
        { "queue_limit", [&](std::istringstream & ss) {
            settings.queue_limit = parse_number(ss, "queue_limit", 1, 4096);
        } },
        { "builtin_timeout_ms", [&](std::istringstream & ss) {
            settings.dispatcher.builtin_timeout = milliseconds(parse_number(ss, "builtin_timeout_ms", 1, max_ms));
        } },
        { "builtin_threads", [&](std::istringstream & ss) {
            settings.dispatcher.builtin_threads = static_cast<unsigned int>(parse_number(ss, "builtin_threads", 1, 16));
        } },
        { "command_timeout_ms", [&](std::istringstream & ss) {
            settings.dispatcher.command_timeout = milliseconds(parse_number(ss, "command_timeout_ms", 0, max_ms));
        } },
        { "shutdown_grace_ms", [&](std::istringstream & ss) {
            settings.shutdown_grace = milliseconds(parse_number(ss, "shutdown_grace_ms", 0, max_ms));
        } },
        { "reconnect_attempts", [&](std::istringstream & ss) {
            settings.reconnect_attempts = static_cast<unsigned int>(parse_number(ss, "reconnect_attempts", 0, 100));
        } },
        { "reconnect_backoff_ms", [&](std::istringstream & ss) {
            settings.reconnect_backoff = milliseconds(parse_number(ss, "reconnect_backoff_ms", 1, max_ms));
        } },
    };

    std::string line;
    unsigned int line_no = 0;
    while (std::getline(stream, line))
    {
        line_no++;
        const auto where = origin + ":" + std::to_string(line_no);
        const auto stripped = trim(line);
        if (stripped.empty() || stripped[0] == '#') {
            continue;
        }

        std::istringstream ss(stripped);
        std::string directive;
        ss >> directive;

        try
        {
            if (directive == "map")
            {
                auto chord = parse_chord(next_token(ss, "chord"));
                auto action = parse_action(ss);
                config.mapping.entries.push_back({ .chord = std::move(chord), .action = std::move(action), .origin = where });
                continue;
            }

            const auto it = directives.find(directive);
            if (it == directives.end()) {
                throw line_error("unknown directive \"" + directive + "\"");
            }
            it->second(ss);
        }
        catch (const line_error & e)
        {
            throw invalid_mapping(where + ": " + e.what());
        }
    }

    if (stream.bad()) {
        throw invalid_mapping(origin + ": read error");
    }

    if (settings.device.empty()) {
        throw invalid_mapping(origin + ": no device directive");
    }

    print_log(DEBUG_LOG, "Read ", config.mapping.entries.size(), " mapping(s) and ",
        config.mapping.passthrough.size(), " pass-through button(s) from ", origin, "\n");
    return config;
}

piper::service_config_t piper::load_service_config(const std::string & path)
{
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        throw invalid_mapping("Unable to open file " + path);
    }

    return read_service_config(ifs, path);
}
