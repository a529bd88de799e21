/* virtual_device.h
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

#ifndef VIRTUAL_DEVICE_H
#define VIRTUAL_DEVICE_H

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>
#include "mapping_table.h"

namespace piper {

void emit(int fd, uint16_t type, uint16_t code, int32_t value);

/// Where synthesized key strokes go
class key_sink
{
public:
    virtual ~key_sink() = default;

    /// The whole sequence is written under one lock with a SYN_REPORT after every step,
    /// so sequences from different threads never interleave and nothing is coalesced
    void send(const std::vector<key_step_t> & steps);

    /// Presses `modifier` unless an earlier call left it down, then sends `steps`.
    /// The modifier stays down until release_held().
    void send_holding(uint16_t modifier, const std::vector<key_step_t> & steps);

    /// Releases what send_holding() left down, latest first
    void release_held();

    [[nodiscard]] bool holding() const;

protected:
    virtual void write_event(uint16_t type, uint16_t code, int32_t value) = 0;

private:
    void write_step(uint16_t code, bool press);

    mutable std::mutex sequence_mutex;
    std::vector<uint16_t> held;
};

/// Where grabbed input that no mapping consumes is re-emitted
class passthrough_sink
{
public:
    virtual ~passthrough_sink() = default;
    virtual void button(uint16_t code, bool pressed) = 0;
    virtual void motion(int32_t dx, int32_t dy) = 0;
    virtual void scroll(int32_t vertical, int32_t horizontal) = 0;
};

class virtual_keyboard : public key_sink
{
public:
    explicit virtual_keyboard(const std::string & name);
    ~virtual_keyboard() override;
    virtual_keyboard(const virtual_keyboard &) = delete;
    virtual_keyboard & operator=(const virtual_keyboard &) = delete;

protected:
    void write_event(uint16_t type, uint16_t code, int32_t value) override;

private:
    int fd = -1;
};

class virtual_pointer : public passthrough_sink
{
public:
    explicit virtual_pointer(const std::string & name);
    ~virtual_pointer() override;
    virtual_pointer(const virtual_pointer &) = delete;
    virtual_pointer & operator=(const virtual_pointer &) = delete;

    void button(uint16_t code, bool pressed) override;
    void motion(int32_t dx, int32_t dy) override;
    void scroll(int32_t vertical, int32_t horizontal) override;

private:
    int fd = -1;
    std::mutex pointer_mutex;
};

}

#endif //VIRTUAL_DEVICE_H
