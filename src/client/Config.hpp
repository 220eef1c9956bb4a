// SPDX-License-Identifier: AGPL-3.0-or-later
/*
 * ZLease a distributed lease lock on top of a strongly-consistent store.
 * Copyright (C) 2025 Ahmed Refaat Gadalla Mohamed
 *
 * This program is free software: you can redistribute it and/or modify it under the terms of the GNU Affero General Public License as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License along with this program. If not, see <https://www.gnu.org/licenses/>.
 */
#ifndef CONFIG_H
#define CONFIG_H

#include <string>
#include <optional>
#include "common/RetryPolicy.hpp"
#include "common/Types.hpp"

namespace zlease {

class Config {
public:
    Config(const std::string& address, const RetryPolicy policy, std::optional<ConsistencyLevel> consistency = std::nullopt);
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;
    const std::string address;
    const RetryPolicy policy;
    // Level the client asks for; the account default applies when unset.
    const std::optional<ConsistencyLevel> consistencyLevel;
};

} // namespace zlease

#endif // CONFIG_H
