/* mapping_table.h
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

#ifndef MAPPING_TABLE_H
#define MAPPING_TABLE_H

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>
#include "input_event.h"

namespace piper {

struct key_step_t {
    uint16_t code{};
    bool press = true;
    bool operator==(const key_step_t &) const = default;
};

struct emit_key_sequence_t {
    std::vector<key_step_t> steps;
    bool operator==(const emit_key_sequence_t &) const = default;
};

struct run_command_t {
    std::string command_line;
    bool operator==(const run_command_t &) const = default;
};

struct builtin_function_t {
    std::string name;
    std::string parameters;
    bool operator==(const builtin_function_t &) const = default;
};

using action_descriptor_t = std::variant<emit_key_sequence_t, run_command_t, builtin_function_t>;

template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };

std::string describe_action(const action_descriptor_t & action);

struct mapping_entry_t {
    chord_key_t chord;
    action_descriptor_t action;
    std::string origin; // "file:line", for diagnostics
};

/// What the external configuration hands over
struct mapping_config_t {
    std::vector<mapping_entry_t> entries;
    std::set<button_code_t> passthrough; // still delivered to the OS under an exclusive grab
};

struct mapping_match_t {
    chord_key_t chord; // the mapped set that matched
    action_descriptor_t action;
};

class mapping_table
{
public:
    mapping_table() = default;

    /// Throws invalid_mapping; nothing is returned unless every entry is valid
    static mapping_table build(const mapping_config_t & config);

    /// Exact set first, otherwise the largest mapped subset of the chord
    [[nodiscard]] std::optional<mapping_match_t> lookup(const chord_key_t & chord) const;

    /// Whether an exclusive grab keeps this button away from the OS
    [[nodiscard]] bool consumes(button_code_t button) const;

    /// Whether the button appears in any mapped chord, pass-through or not
    [[nodiscard]] bool in_any_chord(button_code_t button) const { return chord_buttons.contains(button); }

    [[nodiscard]] std::size_t size() const { return table.size(); }
    [[nodiscard]] const std::map<chord_key_t, action_descriptor_t> & entries() const { return table; }

private:
    std::map<chord_key_t, action_descriptor_t> table;
    std::set<button_code_t> consumed;
    std::set<button_code_t> chord_buttons;
};

}

#endif //MAPPING_TABLE_H
