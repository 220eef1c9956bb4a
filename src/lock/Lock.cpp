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
#include "lock/Lock.hpp"
#include <string>
#include <chrono>
#include <mutex>
#include <utility>
#include "lock/AutoRenewer.hpp"
#include "common/Types.hpp"

namespace zlease {

Lock::Lock(const Key& k, std::chrono::seconds d, VersionToken version, std::chrono::system_clock::time_point at)
    : key {k}, duration {d}, m {}, token {std::move(version)}, acquiredAt {at}, released {false}, renewer {} {}

// The item is left to expire in the store.
Lock::~Lock() {
    stopAutoRenew();
}

const std::string& Lock::shardKey() const {
    return key.shardKey;
}

const std::string& Lock::name() const {
    return key.name;
}

std::chrono::seconds Lock::leaseDuration() const {
    return duration;
}

VersionToken Lock::versionToken() const {
    const std::lock_guard lock {m};
    return token;
}

std::chrono::system_clock::time_point Lock::timeAcquired() const {
    const std::lock_guard lock {m};
    return acquiredAt;
}

bool Lock::isAcquired() const {
    if (released) {
        return false;
    }
    return std::chrono::system_clock::now() - timeAcquired() < duration;
}

bool Lock::autoRenewing() const {
    return renewer && renewer->state() == AutoRenewer::State::Running;
}

bool Lock::refresh(VersionToken version, std::chrono::system_clock::time_point at) {
    const std::lock_guard lock {m};
    if (released || std::chrono::system_clock::now() - acquiredAt >= duration) {
        return false;
    }
    token = std::move(version);
    acquiredAt = at;
    return true;
}

void Lock::markReleased() {
    released = true;
}

void Lock::stopAutoRenew() {
    if (renewer) {
        renewer->stop();
        renewer.reset();
    }
}

LeaseItem Lock::item() const {
    return LeaseItem {key.shardKey, key.name, duration};
}

} // namespace zlease
