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
#include "client/Config.hpp"
#include <string>
#include <optional>
#include <stdexcept>
#include <algorithm>
#include <cctype>
#include "common/RetryPolicy.hpp"

namespace zlease {

Config::Config(const std::string& a, const RetryPolicy p, std::optional<ConsistencyLevel> consistency)
    : address{a},
      policy{p},
      consistencyLevel{consistency} {
    if (std::all_of(address.begin(), address.end(), [](unsigned char c) { return std::isspace(c); })) {
        throw std::invalid_argument("Config: No address provided");
    }
}

} // namespace zlease
