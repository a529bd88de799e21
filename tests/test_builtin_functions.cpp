/* test_builtin_functions.cpp
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
#include <algorithm>
#include "builtin_functions.h"
#include "test_helpers.h"

using namespace piper;

TEST(Builtins, DefaultsCoverEditingDesktopAndMedia)
{
    const auto names = builtin_registry::defaults().names();
    for (const auto * expected : { "copy", "paste", "select_all", "save", "delete", "type_text",
        "switch_window", "window_menu", "close_window", "minimise_all", "new_terminal", "volume_up", "play_pause", "sleep_ms" })
    {
        EXPECT_NE(std::ranges::find(names, expected), names.end()) << expected;
    }
}

TEST(Builtins, CopyPressesCtrlCAndReleasesInReverse)
{
    test::recording_key_sink keyboard;
    const auto * copy = builtin_registry::defaults().find("copy");
    ASSERT_NE(copy, nullptr);

    (*copy)(keyboard, "");
    EXPECT_EQ(keyboard.steps(), test::tap({ KEY_LEFTCTRL, KEY_C }));
    EXPECT_EQ(keyboard.syncs(), 4u);
}

TEST(Builtins, WindowMenuLeavesAltDownAcrossCalls)
{
    test::recording_key_sink keyboard;
    const auto & registry = builtin_registry::defaults();
    const auto * menu = registry.find("window_menu");
    ASSERT_NE(menu, nullptr);
    EXPECT_TRUE(registry.holds_keys("window_menu"));
    EXPECT_FALSE(registry.holds_keys("copy"));
    EXPECT_FALSE(registry.holds_keys("teleport"));

    (*menu)(keyboard, "");
    (*menu)(keyboard, "");
    EXPECT_TRUE(keyboard.holding());
    keyboard.release_held();
    keyboard.release_held();

    const std::vector<key_step_t> expected = {
        { .code = KEY_LEFTALT, .press = true },
        { .code = KEY_TAB, .press = true }, { .code = KEY_TAB, .press = false },
        { .code = KEY_TAB, .press = true }, { .code = KEY_TAB, .press = false },
        { .code = KEY_LEFTALT, .press = false },
    };
    EXPECT_EQ(keyboard.steps(), expected);
    EXPECT_FALSE(keyboard.holding());
}

TEST(Builtins, TypeTextUsesShiftForUpperCaseAndSymbols)
{
    const auto steps = text_to_key_steps("a!B");
    const std::vector<key_step_t> expected = {
        { .code = KEY_A, .press = true }, { .code = KEY_A, .press = false },
        { .code = KEY_LEFTSHIFT, .press = true },
        { .code = KEY_1, .press = true }, { .code = KEY_1, .press = false },
        { .code = KEY_LEFTSHIFT, .press = false },
        { .code = KEY_LEFTSHIFT, .press = true },
        { .code = KEY_B, .press = true }, { .code = KEY_B, .press = false },
        { .code = KEY_LEFTSHIFT, .press = false },
    };
    EXPECT_EQ(steps, expected);
}

TEST(Builtins, TypeTextSkipsCharactersWithoutKeys)
{
    std::string unsupported;
    const auto steps = text_to_key_steps("h\xc3\xa9y", &unsupported);
    EXPECT_EQ(steps, (std::vector<key_step_t>{
        { .code = KEY_H, .press = true }, { .code = KEY_H, .press = false },
        { .code = KEY_Y, .press = true }, { .code = KEY_Y, .press = false },
    }));
    EXPECT_EQ(unsupported, "\xc3\xa9");
}

TEST(Builtins, ValidateRejectsUnknownNamesAndBadParameters)
{
    const auto & registry = builtin_registry::defaults();
    EXPECT_NO_THROW(registry.validate("paste", ""));
    EXPECT_NO_THROW(registry.validate("sleep_ms", "250"));
    EXPECT_THROW(registry.validate("teleport", ""), std::invalid_argument);
    EXPECT_THROW(registry.validate("type_text", ""), std::invalid_argument);
    EXPECT_THROW(registry.validate("sleep_ms", "soon"), std::invalid_argument);
    EXPECT_THROW(registry.validate("sleep_ms", "999999"), std::invalid_argument);
    EXPECT_EQ(registry.find("teleport"), nullptr);
}

TEST(Builtins, CustomRegistry)
{
    builtin_registry registry;
    int calls = 0;
    registry.add("count", [&](key_sink &, const std::string & parameters) { calls += std::stoi(parameters); });

    test::recording_key_sink keyboard;
    (*registry.find("count"))(keyboard, "3");
    EXPECT_EQ(calls, 3);
    EXPECT_EQ(registry.names(), std::vector<std::string>{ "count" });
}
