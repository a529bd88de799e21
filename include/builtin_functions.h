/* builtin_functions.h
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

#ifndef BUILTIN_FUNCTIONS_H
#define BUILTIN_FUNCTIONS_H

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>
#include "mapping_table.h"

namespace piper {

class key_sink;

/// Named internal handlers a mapping can bind with "builtin <name> [params]"
class builtin_registry
{
public:
    using handler_t = std::function<void(key_sink & keyboard, const std::string & parameters)>;
    using validator_t = std::function<void(const std::string & parameters)>;

    /// Clipboard, window, media and text typing handlers
    static const builtin_registry & defaults();

    /// A handler that `holds_keys` may leave keys down through key_sink::send_holding();
    /// they are released by the next chord bound to anything else
    void add(const std::string & name, handler_t handler, validator_t validator = {}, bool holds_keys = false);

    /// Throws std::invalid_argument for an unknown name or bad parameters
    void validate(const std::string & name, const std::string & parameters) const;

    [[nodiscard]] const handler_t * find(const std::string & name) const;
    [[nodiscard]] bool holds_keys(const std::string & name) const;
    [[nodiscard]] std::vector<std::string> names() const;

private:
    struct entry_t {
        handler_t handler;
        validator_t validator;
        bool holds_keys = false;
    };

    std::map<std::string, entry_t> handlers;
};

/// US layout; characters without a key are skipped and reported through `unsupported`
std::vector<key_step_t> text_to_key_steps(std::string_view text, std::string * unsupported = nullptr);

}

#endif //BUILTIN_FUNCTIONS_H
