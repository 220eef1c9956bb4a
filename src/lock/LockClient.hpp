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
#ifndef LOCK_CLIENT_H
#define LOCK_CLIENT_H

#include <memory>
#include <expected>
#include <variant>
#include "common/Error.hpp"
#include "lock/AcquireLockOptions.hpp"
#include "lock/Lock.hpp"
#include "storage/LeaseStore.hpp"

namespace zlease {

// Lease protocol over a LeaseStore. The store must outlive the client and every lock
// the client hands out.
class LockClient {
public:
    // Throws std::runtime_error when the store is not strongly consistent.
    explicit LockClient(LeaseStore& s);
    LockClient(const LockClient&) = delete;
    LockClient& operator=(const LockClient&) = delete;

    // Retries while another holder owns the lock and options.timeout has not passed,
    // then fails with LockUnavailable. Other store errors are returned as they are.
    std::expected<std::unique_ptr<Lock>, Error> acquire(const AcquireLockOptions& options);
    // LockReleased when the lease expired or was taken over.
    std::expected<std::monostate, Error> renew(Lock& lock);
    // Stops auto renewal, then deletes the item. A lease that is already gone counts as released.
    std::expected<std::monostate, Error> release(Lock& lock);
private:
    LeaseStore& store;
};

} // namespace zlease

#endif // LOCK_CLIENT_H
