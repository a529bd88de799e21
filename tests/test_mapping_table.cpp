/* test_mapping_table.cpp
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

#include <gtest/gtest.h>
#include "mapping_table.h"
#include "piper_error.h"
#include "test_helpers.h"

using namespace piper;

namespace {

mapping_entry_t entry(chord_key_t chord, action_descriptor_t action, std::string origin = "test")
{
    return { .chord = std::move(chord), .action = std::move(action), .origin = std::move(origin) };
}

action_descriptor_t command(const std::string & line)
{
    return run_command_t { .command_line = line };
}

}

TEST(MappingTable, ExactMatch)
{
    const auto table = mapping_table::build({ .entries = {
        entry({ BTN_SIDE }, command("true")),
        entry({ BTN_EXTRA, BTN_SIDE }, command("echo both")),
    } });

    const auto match = table.lookup({ BTN_SIDE, BTN_EXTRA });
    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(match->action, command("echo both"));
    EXPECT_EQ(match->chord, (chord_key_t{ BTN_SIDE, BTN_EXTRA }));
    EXPECT_EQ(table.size(), 2u);
}

TEST(MappingTable, LongestMatchingSetWins)
{
    const auto table = mapping_table::build({ .entries = {
        entry({ BTN_SIDE, BTN_EXTRA }, command("ab")),
        entry({ BTN_SIDE, BTN_EXTRA, BTN_FORWARD }, command("abc")),
    } });

    EXPECT_EQ(table.lookup({ BTN_SIDE, BTN_EXTRA, BTN_FORWARD })->action, command("abc"));

    // no exact entry, the largest mapped subset answers
    const auto match = table.lookup({ BTN_SIDE, BTN_EXTRA, BTN_BACK });
    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(match->action, command("ab"));
}

TEST(MappingTable, EqualSizedSubsetsResolveToSmallestSet)
{
    const auto table = mapping_table::build({ .entries = {
        entry({ BTN_EXTRA }, command("extra")),
        entry({ BTN_SIDE }, command("side")),
    } });

    // BTN_SIDE < BTN_EXTRA
    EXPECT_EQ(table.lookup({ BTN_SIDE, BTN_EXTRA })->action, command("side"));
}

TEST(MappingTable, UnmappedChordHasNoMatch)
{
    const auto table = mapping_table::build({ .entries = { entry({ BTN_SIDE, BTN_EXTRA }, command("x")) } });
    EXPECT_FALSE(table.lookup({ BTN_SIDE }).has_value());
    EXPECT_FALSE(table.lookup({ BTN_FORWARD }).has_value());
}

TEST(MappingTable, ConflictingDuplicateIsRejected)
{
    const mapping_config_t config = { .entries = {
        entry({ BTN_SIDE, BTN_EXTRA }, command("one"), "a.conf:1"),
        entry({ BTN_EXTRA, BTN_SIDE }, command("two"), "a.conf:2"),
    } };

    try {
        (void)mapping_table::build(config);
        FAIL() << "ambiguous chord accepted";
    } catch (const invalid_mapping & e) {
        const std::string what = e.what();
        EXPECT_NE(what.find("a.conf:2"), std::string::npos) << what;
        EXPECT_NE(what.find("a.conf:1"), std::string::npos) << what;
    }
}

TEST(MappingTable, IdenticalDuplicateIsAcceptedOnce)
{
    const auto table = mapping_table::build({ .entries = {
        entry({ BTN_SIDE }, command("same")),
        entry({ BTN_SIDE }, command("same")),
    } });
    EXPECT_EQ(table.size(), 1u);
}

TEST(MappingTable, RebuildFromSameConfigIsEquivalent)
{
    const mapping_config_t config = { .entries = {
        entry({ BTN_SIDE }, builtin_function_t { .name = "copy" }),
        entry({ BTN_SIDE, BTN_EXTRA }, emit_key_sequence_t { .steps = test::tap({ KEY_LEFTCTRL, KEY_V }) }),
    }, .passthrough = { BTN_EXTRA } };

    const auto first = mapping_table::build(config);
    const auto second = mapping_table::build(config);
    EXPECT_TRUE(first.entries() == second.entries());
    for (const auto button : { BTN_SIDE, BTN_EXTRA, BTN_LEFT }) {
        EXPECT_EQ(first.consumes(button), second.consumes(button));
    }
}

TEST(MappingTable, MappedButtonsAreConsumedUnlessPassedThrough)
{
    const auto table = mapping_table::build({
        .entries = { entry({ BTN_SIDE, BTN_EXTRA }, command("x")) },
        .passthrough = { BTN_EXTRA },
    });

    EXPECT_TRUE(table.consumes(BTN_SIDE));
    EXPECT_FALSE(table.consumes(BTN_EXTRA));
    EXPECT_FALSE(table.consumes(BTN_LEFT));
}

TEST(MappingTable, RejectsEmptyChord)
{
    EXPECT_THROW((void)mapping_table::build({ .entries = { entry({}, command("x")) } }), invalid_mapping);
}

TEST(MappingTable, RejectsUnbalancedKeySequences)
{
    const std::vector<std::vector<key_step_t>> bad = {
        {},
        { { .code = KEY_A, .press = true } },
        { { .code = KEY_A, .press = false } },
        { { .code = KEY_A, .press = true }, { .code = KEY_A, .press = true }, { .code = KEY_A, .press = false } },
    };

    for (const auto & steps : bad) {
        EXPECT_THROW((void)mapping_table::build({ .entries = {
            entry({ BTN_SIDE }, emit_key_sequence_t { .steps = steps }) } }), invalid_mapping);
    }
}

TEST(MappingTable, RejectsEmptyCommandAndUnknownBuiltin)
{
    EXPECT_THROW((void)mapping_table::build({ .entries = { entry({ BTN_SIDE }, command("   ")) } }), invalid_mapping);
    EXPECT_THROW((void)mapping_table::build({ .entries = {
        entry({ BTN_SIDE }, builtin_function_t { .name = "self_destruct" }) } }), invalid_mapping);
    EXPECT_THROW((void)mapping_table::build({ .entries = {
        entry({ BTN_SIDE }, builtin_function_t { .name = "type_text" }) } }), invalid_mapping);
}

TEST(MappingTable, FailedBuildLeavesNothingBehind)
{
    auto table = mapping_table::build({ .entries = { entry({ BTN_SIDE }, command("old")) } });
    EXPECT_THROW(table = mapping_table::build({ .entries = {
        entry({ BTN_EXTRA }, command("new")),
        entry({ BTN_EXTRA }, command("newer")),
    } }), invalid_mapping);

    EXPECT_EQ(table.size(), 1u);
    EXPECT_EQ(table.lookup({ BTN_SIDE })->action, command("old"));
}

TEST(MappingTable, DescribeAction)
{
    EXPECT_EQ(describe_action(command("notify-send hi")), "command notify-send hi");
    EXPECT_EQ(describe_action(builtin_function_t { .name = "type_text", .parameters = "hello" }), "builtin type_text hello");
    EXPECT_EQ(describe_action(emit_key_sequence_t { .steps = test::tap({ KEY_LEFTCTRL, KEY_C }) }),
        "keys KEY_LEFTCTRL:down KEY_C:down KEY_C:up KEY_LEFTCTRL:up");
}
