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
#ifndef ACQUIRE_LOCK_OPTIONS_H
#define ACQUIRE_LOCK_OPTIONS_H

#include <string>
#include <chrono>
#include <expected>
#include <variant>
#include "common/Error.hpp"

namespace zlease {

struct AcquireLockOptions {
    std::string shardKey;
    std::string name;
    // Stored as the item TTL.
    std::chrono::seconds leaseDuration {60L};
    // Zero tries exactly once.
    std::chrono::milliseconds timeout {0L};
    std::chrono::milliseconds retryWait {1000L};
    bool autoRenew {false};

    // InvalidArg naming the first offending field.
    std::expected<std::monostate, Error> validate() const;
};

} // namespace zlease

#endif // ACQUIRE_LOCK_OPTIONS_H
