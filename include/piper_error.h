/* piper_error.h
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

#ifndef PIPER_ERROR_H
#define PIPER_ERROR_H

#include <stdexcept>
#include <string>

#define STRINGIZE_DETAIL(x) #x
#define STRINGIZE(x) STRINGIZE_DETAIL(x)
#define LINE_STR STRINGIZE(__LINE__)
#define assert_throw(statement) if (!(statement)) { throw std::runtime_error(__FILE__ ":" LINE_STR ":\n    " #statement ); }

namespace piper {

/// The device node is missing, not an input device, or cannot be opened (or grabbed).
class device_unavailable : public std::runtime_error
{
public:
    explicit device_unavailable(const std::string & what) : std::runtime_error(what) { }
};

/// The device went away while it was being read.
class device_disconnected : public std::runtime_error
{
public:
    explicit device_disconnected(const std::string & what) : std::runtime_error(what) { }
};

/// The mapping configuration is malformed or ambiguous.
class invalid_mapping : public std::runtime_error
{
public:
    explicit invalid_mapping(const std::string & what) : std::runtime_error(what) { }
};

class action_execution_failure : public std::runtime_error
{
public:
    explicit action_execution_failure(const std::string & what) : std::runtime_error(what) { }
};

class action_timeout : public action_execution_failure
{
public:
    explicit action_timeout(const std::string & what) : action_execution_failure(what) { }
};

}

#endif //PIPER_ERROR_H
