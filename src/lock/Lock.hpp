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
#ifndef LOCK_H
#define LOCK_H

#include <string>
#include <chrono>
#include <mutex>
#include <atomic>
#include <memory>
#include "common/Types.hpp"

namespace zlease {

class LockClient;
class AutoRenewer;

// A lease held (or formerly held) by this client. Handed out by LockClient::acquire and
// mutated only through it. The store is the authority; isAcquired is a local estimate.
class Lock {
public:
    ~Lock();
    Lock(const Lock&) = delete;
    Lock& operator=(const Lock&) = delete;
    Lock(Lock&&) = delete;
    Lock& operator=(Lock&&) = delete;

    const std::string& shardKey() const;
    const std::string& name() const;
    std::chrono::seconds leaseDuration() const;
    VersionToken versionToken() const;
    std::chrono::system_clock::time_point timeAcquired() const;
    // False once released, or once leaseDuration has passed since the last acquire or renew.
    // Never turns true again.
    bool isAcquired() const;
    bool autoRenewing() const;
private:
    friend class LockClient;
    Lock(const Key& k, std::chrono::seconds duration, VersionToken version, std::chrono::system_clock::time_point at);
    // Applies a successful renew. Refused once the lease has lapsed or been released.
    [[nodiscard]] bool refresh(VersionToken version, std::chrono::system_clock::time_point at);
    void markReleased();
    void stopAutoRenew();
    LeaseItem item() const;

    const Key key;
    const std::chrono::seconds duration;
    mutable std::mutex m;
    VersionToken token;
    std::chrono::system_clock::time_point acquiredAt;
    std::atomic<bool> released;
    std::unique_ptr<AutoRenewer> renewer;
};

} // namespace zlease

#endif // LOCK_H
