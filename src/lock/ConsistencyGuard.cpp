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
#include "lock/ConsistencyGuard.hpp"
#include <expected>
#include <variant>
#include <spdlog/spdlog.h>
#include "common/Error.hpp"
#include "common/Types.hpp"

namespace zlease {

std::expected<std::monostate, Error> checkConsistency(const LeaseStore& store) {
    auto account = store.consistencyLevel();
    if (!account.has_value()) {
        if (account.error().code == ErrorCode::ConsistencyUnsupported) {
            return std::unexpected {Error {ErrorCode::ConsistencyViolation, account.error().what, "", account.error()}};
        }
        return std::unexpected {account.error()};
    }
    const auto effective = store.clientConsistencyLevel().value_or(account.value());
    if (effective != ConsistencyLevel::Strong) {
        return std::unexpected {Error {ErrorCode::ConsistencyViolation,
            "Consistency level must be Strong, got " + toString(effective)}};
    }
    spdlog::debug("ConsistencyGuard: effective level {}", toString(effective));
    return {};
}

} // namespace zlease
