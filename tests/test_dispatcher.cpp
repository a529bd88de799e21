/* test_dispatcher.cpp
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
#include <filesystem>
#include <iterator>
#include <thread>
#include "builtin_functions.h"
#include "dispatcher.h"
#include "worker_pool.h"
#include "test_helpers.h"

using namespace piper;
using namespace std::chrono_literals;

namespace {

mapping_entry_t entry(chord_key_t chord, action_descriptor_t action)
{
    return { .chord = std::move(chord), .action = std::move(action), .origin = "test" };
}

chord_t chord(chord_key_t buttons)
{
    return { .buttons = std::move(buttons), .completed_at = 0, .repeat = false };
}

std::size_t live_threads()
{
    return static_cast<std::size_t>(std::distance(std::filesystem::directory_iterator("/proc/self/task"),
        std::filesystem::directory_iterator{}));
}

bool wait_until(const std::function<bool()> & condition, const std::chrono::milliseconds limit)
{
    const auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline)
    {
        if (condition()) return true;
        std::this_thread::sleep_for(5ms);
    }
    return condition();
}

class DispatcherTest : public ::testing::Test
{
protected:
    test::recording_key_sink keyboard;
    worker_pool pool { 2, 8 };
};

}

TEST_F(DispatcherTest, KeySequenceIsEmittedInOrder)
{
    const std::vector<key_step_t> steps = {
        { .code = KEY_LEFTSHIFT, .press = true },
        { .code = KEY_H, .press = true }, { .code = KEY_H, .press = false },
        { .code = KEY_LEFTSHIFT, .press = false },
        { .code = KEY_I, .press = true }, { .code = KEY_I, .press = false },
    };
    const auto table = mapping_table::build({ .entries = { entry({ BTN_SIDE }, emit_key_sequence_t { .steps = steps }) } });

    dispatcher actions(keyboard, pool, builtin_registry::defaults());
    actions.dispatch(chord({ BTN_SIDE }), table);

    EXPECT_EQ(keyboard.steps(), steps);
    EXPECT_EQ(keyboard.syncs(), steps.size());
    EXPECT_EQ(actions.dispatched(), 1u);
    EXPECT_EQ(actions.failed(), 0u);
}

TEST_F(DispatcherTest, UnmappedChordIsNoOp)
{
    const auto table = mapping_table::build({ .entries = { entry({ BTN_SIDE }, builtin_function_t { .name = "copy" }) } });

    dispatcher actions(keyboard, pool, builtin_registry::defaults());
    EXPECT_NO_THROW(actions.dispatch(chord({ BTN_EXTRA }), table));
    pool.wait_idle();

    EXPECT_TRUE(keyboard.steps().empty());
    EXPECT_EQ(actions.unmapped(), 1u);
    EXPECT_EQ(actions.dispatched(), 0u);
    EXPECT_EQ(actions.failed(), 0u);
}

TEST_F(DispatcherTest, LongestMappedSetIsDispatched)
{
    const auto table = mapping_table::build({ .entries = {
        entry({ BTN_SIDE, BTN_EXTRA }, emit_key_sequence_t { .steps = test::tap({ KEY_A }) }),
        entry({ BTN_SIDE, BTN_EXTRA, BTN_FORWARD }, emit_key_sequence_t { .steps = test::tap({ KEY_B }) }),
    } });

    dispatcher actions(keyboard, pool, builtin_registry::defaults());
    actions.dispatch(chord({ BTN_SIDE, BTN_EXTRA, BTN_FORWARD }), table);
    EXPECT_EQ(keyboard.steps(), test::tap({ KEY_B }));
}

TEST_F(DispatcherTest, FailingCommandIsCountedAndNextChordStillDispatches)
{
    const auto table = mapping_table::build({ .entries = {
        entry({ BTN_SIDE }, run_command_t { .command_line = "/nonexistent/launcher --now" }),
        entry({ BTN_EXTRA }, emit_key_sequence_t { .steps = test::tap({ KEY_LEFTCTRL, KEY_V }) }),
    } });

    dispatcher actions(keyboard, pool, builtin_registry::defaults());
    EXPECT_NO_THROW(actions.dispatch(chord({ BTN_SIDE }), table));
    EXPECT_TRUE(wait_until([&] { return actions.failed() == 1; }, 2000ms));

    actions.dispatch(chord({ BTN_EXTRA }), table);
    EXPECT_EQ(keyboard.steps(), test::tap({ KEY_LEFTCTRL, KEY_V }));
    EXPECT_EQ(actions.dispatched(), 2u);
    EXPECT_EQ(actions.failed(), 1u);
}

TEST_F(DispatcherTest, SuccessfulCommandIsNotAFailure)
{
    const auto table = mapping_table::build({ .entries = { entry({ BTN_SIDE }, run_command_t { .command_line = "exit 0" }) } });

    dispatcher actions(keyboard, pool, builtin_registry::defaults());
    actions.dispatch(chord({ BTN_SIDE }), table);
    pool.wait_idle();
    EXPECT_TRUE(wait_until([&] { return actions.running_commands() == 0; }, 2000ms));
    EXPECT_EQ(actions.failed(), 0u);
}

TEST_F(DispatcherTest, CommandTimeoutIsAFailure)
{
    const auto table = mapping_table::build({ .entries = { entry({ BTN_SIDE }, run_command_t { .command_line = "sleep 10" }) } });

    dispatcher actions(keyboard, pool, builtin_registry::defaults(), { .builtin_timeout = 2000ms, .command_timeout = 100ms });
    actions.dispatch(chord({ BTN_SIDE }), table);
    EXPECT_TRUE(wait_until([&] { return actions.failed() == 1; }, 2000ms));
    EXPECT_EQ(actions.running_commands(), 0u);
}

TEST_F(DispatcherTest, BuiltinRunsOnWorker)
{
    const auto table = mapping_table::build({ .entries = { entry({ BTN_SIDE }, builtin_function_t { .name = "paste" }) } });

    dispatcher actions(keyboard, pool, builtin_registry::defaults());
    actions.dispatch(chord({ BTN_SIDE }), table);
    pool.wait_idle();
    EXPECT_EQ(keyboard.steps(), test::tap({ KEY_LEFTCTRL, KEY_V }));
    EXPECT_EQ(actions.failed(), 0u);
}

TEST_F(DispatcherTest, BuiltinOverrunningTimeoutIsAFailure)
{
    const auto table = mapping_table::build({ .entries = {
        entry({ BTN_SIDE }, builtin_function_t { .name = "sleep_ms", .parameters = "500" }) } });

    dispatcher actions(keyboard, pool, builtin_registry::defaults(), { .builtin_timeout = 50ms, .command_timeout = 0ms });
    const auto started = std::chrono::steady_clock::now();
    actions.dispatch(chord({ BTN_SIDE }), table);
    pool.wait_idle();

    // the worker is released long before the handler finishes
    EXPECT_LT(std::chrono::steady_clock::now() - started, 400ms);
    EXPECT_EQ(actions.failed(), 1u);
}

TEST_F(DispatcherTest, ThrowingBuiltinIsAFailure)
{
    builtin_registry registry;
    registry.add("copy", [](key_sink &, const std::string &) { throw std::runtime_error("clipboard gone"); });
    const auto table = mapping_table::build({ .entries = { entry({ BTN_SIDE }, builtin_function_t { .name = "copy" }) } });

    dispatcher actions(keyboard, pool, registry);
    actions.dispatch(chord({ BTN_SIDE }), table);
    pool.wait_idle();
    EXPECT_EQ(actions.failed(), 1u);
}

TEST_F(DispatcherTest, FullQueueDropsAction)
{
    worker_pool small(1, 1);
    const auto table = mapping_table::build({ .entries = {
        entry({ BTN_SIDE }, builtin_function_t { .name = "sleep_ms", .parameters = "300" }) } });

    dispatcher actions(keyboard, small, builtin_registry::defaults());
    actions.dispatch(chord({ BTN_SIDE }), table);
    std::this_thread::sleep_for(50ms); // the worker picks up the first one
    actions.dispatch(chord({ BTN_SIDE }), table);
    actions.dispatch(chord({ BTN_SIDE }), table);

    EXPECT_EQ(actions.failed(), 1u);
    small.wait_idle();
    EXPECT_EQ(actions.dispatched(), 3u);
    EXPECT_EQ(actions.failed(), 1u);
}

TEST_F(DispatcherTest, RunningCommandsDoNotHoldWorkers)
{
    const auto table = mapping_table::build({ .entries = {
        entry({ BTN_SIDE }, run_command_t { .command_line = "sleep 30" }),
        entry({ BTN_EXTRA }, builtin_function_t { .name = "volume_up" }),
    } });

    dispatcher actions(keyboard, pool, builtin_registry::defaults());
    for (int i = 0; i < 3; i++) {
        actions.dispatch(chord({ BTN_SIDE }), table);
    }
    actions.dispatch(chord({ BTN_EXTRA }), table);

    EXPECT_TRUE(wait_until([&] { return keyboard.steps() == test::tap({ KEY_VOLUMEUP }); }, 1000ms));
    EXPECT_EQ(actions.failed(), 0u);
}

TEST_F(DispatcherTest, OverrunningBuiltinsDoNotAddThreads)
{
    const auto table = mapping_table::build({ .entries = {
        entry({ BTN_SIDE }, builtin_function_t { .name = "sleep_ms", .parameters = "300" }) } });

    dispatcher actions(keyboard, pool, builtin_registry::defaults(),
        { .builtin_timeout = 20ms, .command_timeout = 0ms, .builtin_threads = 2 });
    const auto before = live_threads();
    for (int i = 0; i < 6; i++) {
        actions.dispatch(chord({ BTN_SIDE }), table);
    }
    pool.wait_idle();

    EXPECT_EQ(actions.failed(), 6u);
    EXPECT_LE(live_threads(), before);
}

TEST_F(DispatcherTest, NothingReachesKeySinkAfterShutdown)
{
    builtin_registry registry;
    registry.add("slow_tap", [](key_sink & sink, const std::string &) {
        std::this_thread::sleep_for(200ms);
        sink.send(test::tap({ KEY_A }));
    });
    const auto table = mapping_table::build({ .entries = { entry({ BTN_SIDE }, builtin_function_t { .name = "slow_tap" }) } });

    dispatcher actions(keyboard, pool, registry, { .builtin_timeout = 50ms, .command_timeout = 0ms, .builtin_threads = 1 });
    actions.dispatch(chord({ BTN_SIDE }), table);
    pool.wait_idle();
    EXPECT_EQ(actions.failed(), 1u);

    // the overrunning handler is waited for, not left behind
    actions.shutdown(0ms);
    EXPECT_EQ(keyboard.steps(), test::tap({ KEY_A }));

    actions.dispatch(chord({ BTN_SIDE }), table);
    pool.wait_idle();
    std::this_thread::sleep_for(300ms);
    EXPECT_EQ(keyboard.steps(), test::tap({ KEY_A }));
    EXPECT_EQ(actions.failed(), 2u);
}

TEST_F(DispatcherTest, WindowMenuHoldsAltUntilAnotherChord)
{
    const auto table = mapping_table::build({ .entries = {
        entry({ BTN_SIDE }, builtin_function_t { .name = "window_menu" }),
        entry({ BTN_EXTRA }, emit_key_sequence_t { .steps = test::tap({ KEY_ENTER }) }),
    } });

    dispatcher actions(keyboard, pool, builtin_registry::defaults());
    actions.dispatch(chord({ BTN_SIDE }), table);
    pool.wait_idle();
    actions.dispatch(chord({ BTN_SIDE }), table);
    pool.wait_idle();
    EXPECT_TRUE(keyboard.holding());

    actions.dispatch(chord({ BTN_EXTRA }), table);
    EXPECT_FALSE(keyboard.holding());

    const std::vector<key_step_t> expected = {
        { .code = KEY_LEFTALT, .press = true },
        { .code = KEY_TAB, .press = true }, { .code = KEY_TAB, .press = false },
        { .code = KEY_TAB, .press = true }, { .code = KEY_TAB, .press = false },
        { .code = KEY_LEFTALT, .press = false },
        { .code = KEY_ENTER, .press = true }, { .code = KEY_ENTER, .press = false },
    };
    EXPECT_EQ(keyboard.steps(), expected);
}

TEST_F(DispatcherTest, UnmappedChordReleasesHeldKeys)
{
    const auto table = mapping_table::build({ .entries = { entry({ BTN_SIDE }, builtin_function_t { .name = "window_menu" }) } });

    dispatcher actions(keyboard, pool, builtin_registry::defaults());
    actions.dispatch(chord({ BTN_SIDE }), table);
    pool.wait_idle();
    actions.dispatch(chord({ BTN_FORWARD }), table);

    EXPECT_FALSE(keyboard.holding());
    ASSERT_FALSE(keyboard.steps().empty());
    EXPECT_EQ(keyboard.steps().back(), (key_step_t { .code = KEY_LEFTALT, .press = false }));
}
