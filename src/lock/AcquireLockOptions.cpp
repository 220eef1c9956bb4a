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
#include "lock/AcquireLockOptions.hpp"
#include <string>
#include <chrono>
#include <algorithm>
#include <cctype>
#include <expected>
#include <variant>
#include "common/Error.hpp"

namespace zlease {

namespace {

bool blank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
}

std::unexpected<Error> invalid(const std::string& field, const std::string& reason) {
    return std::unexpected {Error {ErrorCode::InvalidArg, field + " " + reason}};
}

} // namespace

std::expected<std::monostate, Error> AcquireLockOptions::validate() const {
    if (blank(shardKey)) {
        return invalid("shardKey", "must not be empty or whitespace");
    }
    if (blank(name)) {
        return invalid("name", "must not be empty or whitespace");
    }
    if (leaseDuration <= std::chrono::seconds::zero()) {
        return invalid("leaseDuration", "must be greater than zero");
    }
    if (timeout < std::chrono::milliseconds::zero()) {
        return invalid("timeout", "must not be negative");
    }
    if (retryWait < std::chrono::milliseconds::zero()) {
        return invalid("retryWait", "must not be negative");
    }
    return {};
}

} // namespace zlease
