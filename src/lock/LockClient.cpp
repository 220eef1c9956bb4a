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
#include "lock/LockClient.hpp"
#include <memory>
#include <chrono>
#include <thread>
#include <stdexcept>
#include <expected>
#include <variant>
#include <spdlog/spdlog.h>
#include "common/Error.hpp"
#include "common/Types.hpp"
#include "lock/AutoRenewer.hpp"
#include "lock/ConsistencyGuard.hpp"

namespace zlease {

LockClient::LockClient(LeaseStore& s)
    : store {s} {
    if (auto c = checkConsistency(store); !c.has_value()) {
        spdlog::error("LockClient: {}", c.error().what);
        throw std::runtime_error("LockClient: " + toString(c.error().code) + ": " + c.error().what);
    }
}

std::expected<std::unique_ptr<Lock>, Error> LockClient::acquire(const AcquireLockOptions& options) {
    if (auto v = options.validate(); !v.has_value()) {
        return std::unexpected {v.error()};
    }
    const Key key {options.shardKey, options.name};
    const LeaseItem item {options.shardKey, options.name, options.leaseDuration};
    const auto begin = std::chrono::system_clock::now();
    int attempts = 0;
    while (true) {
        ++attempts;
        const auto at = std::chrono::system_clock::now();
        auto v = store.create(key, item);
        if (v.has_value()) {
            std::unique_ptr<Lock> lock {new Lock {key, options.leaseDuration, v.value(), at}};
            if (options.autoRenew) {
                lock->renewer = std::make_unique<AutoRenewer>(*this, *lock);
                lock->renewer->start();
            }
            spdlog::info("LockClient: acquired {} after {} attempt(s)", key.toString(), attempts);
            return lock;
        }
        if (v.error().code != ErrorCode::AlreadyExists) {
            return std::unexpected {v.error()};
        }
        if (std::chrono::system_clock::now() - begin >= options.timeout) {
            spdlog::info("LockClient: {} unavailable after {} attempt(s)", key.toString(), attempts);
            return std::unexpected {Error {ErrorCode::LockUnavailable, "Lock is held by another client", key.toString(), v.error()}};
        }
        spdlog::debug("LockClient: {} is held, retrying in {}ms", key.toString(), options.retryWait.count());
        std::this_thread::sleep_for(options.retryWait);
    }
}

std::expected<std::monostate, Error> LockClient::renew(Lock& lock) {
    // The store item may outlive the local estimate by the create round trip.
    if (!lock.isAcquired()) {
        return std::unexpected {Error {ErrorCode::LockReleased, "Lock is no longer acquired", lock.key.toString(), lock.versionToken()}};
    }
    const auto at = std::chrono::system_clock::now();
    auto v = store.replace(lock.key, lock.item(), lock.versionToken());
    if (v.has_value()) {
        if (!lock.refresh(v.value(), at)) {
            spdlog::debug("LockClient: {} lapsed while renewing", lock.key.toString());
            return std::unexpected {Error {ErrorCode::LockReleased, "Lease lapsed while renewing", lock.key.toString(), v.value()}};
        }
        return {};
    }
    const auto code = v.error().code;
    if (code == ErrorCode::KeyNotFound || code == ErrorCode::VersionMismatch) {
        return std::unexpected {Error {ErrorCode::LockReleased, "Lock was released or expired", lock.key.toString(), v.error()}};
    }
    return std::unexpected {v.error()};
}

std::expected<std::monostate, Error> LockClient::release(Lock& lock) {
    lock.stopAutoRenew();
    auto v = store.erase(lock.key, lock.versionToken());
    if (!v.has_value()) {
        const auto code = v.error().code;
        if (code != ErrorCode::KeyNotFound && code != ErrorCode::VersionMismatch) {
            return std::unexpected {v.error()};
        }
        spdlog::debug("LockClient: {} was already gone: {}", lock.key.toString(), v.error().what);
    }
    lock.markReleased();
    spdlog::info("LockClient: released {}", lock.key.toString());
    return {};
}

} // namespace zlease
