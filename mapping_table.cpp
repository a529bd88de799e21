/* mapping_table.cpp
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

#include "mapping_table.h"
#include "builtin_functions.h"
#include "key_names.h"
#include "piper_error.h"
#include "log.hpp"
#include <algorithm>
#include <cctype>
#include <ranges>

namespace {

std::string where(const piper::mapping_entry_t & entry)
{
    return entry.origin.empty() ? std::string("<config>") : entry.origin;
}

void validate_key_sequence(const piper::mapping_entry_t & entry, const piper::emit_key_sequence_t & sequence)
{
    if (sequence.steps.empty()) {
        throw piper::invalid_mapping(where(entry) + ": empty key sequence");
    }

    std::set<uint16_t> down;
    for (const auto & [code, press] : sequence.steps)
    {
        if (code == 0 || code > KEY_MAX) {
            throw piper::invalid_mapping(where(entry) + ": key code " + std::to_string(code) + " out of range");
        }

        if (press)
        {
            if (!down.insert(code).second) {
                throw piper::invalid_mapping(where(entry) + ": " + piper::key_name(code) + " pressed twice without a release");
            }
        }
        else if (!down.erase(code))
        {
            throw piper::invalid_mapping(where(entry) + ": " + piper::key_name(code) + " released before it was pressed");
        }
    }

    if (!down.empty()) {
        throw piper::invalid_mapping(where(entry) + ": " + piper::key_name(*down.begin()) + " is never released");
    }
}

void validate_action(const piper::mapping_entry_t & entry)
{
    std::visit(piper::overloaded {
        [&](const piper::emit_key_sequence_t & sequence) {
            validate_key_sequence(entry, sequence);
        },
        [&](const piper::run_command_t & command) {
            if (std::ranges::all_of(command.command_line,
                    [](const unsigned char c)->bool { return std::isspace(c) != 0; })) {
                throw piper::invalid_mapping(where(entry) + ": empty command");
            }
        },
        [&](const piper::builtin_function_t & builtin) {
            try {
                piper::builtin_registry::defaults().validate(builtin.name, builtin.parameters);
            } catch (const std::invalid_argument & e) {
                throw piper::invalid_mapping(where(entry) + ": " + e.what());
            }
        },
    }, entry.action);
}

}

std::string piper::describe_action(const action_descriptor_t & action)
{
    return std::visit(piper::overloaded {
        [](const emit_key_sequence_t & sequence)->std::string
        {
            std::string ret = "keys";
            for (const auto & [code, press] : sequence.steps) {
                ret += " " + key_name(code) + (press ? ":down" : ":up");
            }
            return ret;
        },
        [](const run_command_t & command)->std::string
        {
            return "command " + command.command_line;
        },
        [](const builtin_function_t & builtin)->std::string
        {
            return "builtin " + builtin.name + (builtin.parameters.empty() ? "" : " " + builtin.parameters);
        },
    }, action);
}

piper::mapping_table piper::mapping_table::build(const mapping_config_t & config)
{
    mapping_table result;
    std::map<chord_key_t, std::string> defined_at;

    for (const auto & entry : config.entries)
    {
        const auto chord = canonicalize(entry.chord);
        if (chord.empty()) {
            throw invalid_mapping(where(entry) + ": mapping without buttons");
        }

        validate_action(entry);

        if (const auto it = result.table.find(chord); it != result.table.end())
        {
            if (it->second == entry.action) {
                print_log(DEBUG_LOG, "Duplicate mapping for ", describe_chord(chord), " at ", where(entry), " ignored\n");
                continue;
            }

            throw invalid_mapping(where(entry) + ": chord " + describe_chord(chord)
                + " is already mapped to a different action at " + defined_at.at(chord));
        }

        result.table.emplace(chord, entry.action);
        defined_at.emplace(chord, where(entry));
        result.chord_buttons.insert(chord.begin(), chord.end());
    }

    result.consumed = result.chord_buttons;

    for (const auto button : config.passthrough) {
        result.consumed.erase(button);
    }

    return result;
}

std::optional<piper::mapping_match_t> piper::mapping_table::lookup(const chord_key_t & chord) const
{
    if (const auto it = table.find(chord); it != table.end()) {
        return mapping_match_t { .chord = it->first, .action = it->second };
    }

    // longest mapped subset; map order makes equal lengths resolve to the smallest set
    const std::pair<const chord_key_t, action_descriptor_t> * best = nullptr;
    for (const auto & pair : table)
    {
        if (pair.first.size() >= chord.size()) {
            continue;
        }

        if ((best == nullptr || pair.first.size() > best->first.size())
            && std::ranges::includes(chord, pair.first))
        {
            best = &pair;
        }
    }

    if (best == nullptr) {
        return std::nullopt;
    }

    return mapping_match_t { .chord = best->first, .action = best->second };
}

bool piper::mapping_table::consumes(const button_code_t button) const
{
    return consumed.contains(button);
}
