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
#include "storage/InMemoryLeaseStore.hpp"
#include <expected>
#include <string>
#include <shared_mutex>
#include <mutex>
#include <cstddef>
#include <chrono>
#include <optional>
#include <variant>
#include <algorithm>
#include "common/Error.hpp"
#include "common/Types.hpp"
#include "common/Util.hpp"

namespace zlease {

bool InMemoryLeaseStore::Record::expired(std::chrono::steady_clock::time_point now) const {
    return now - written >= item.leaseDuration;
}

InMemoryLeaseStore::InMemoryLeaseStore(ConsistencyLevel account, std::optional<ConsistencyLevel> client)
    : store{}, accountLevel{account}, clientLevel{client}, m{} {}

// Caller holds the unique lock.
InMemoryLeaseStore::map::iterator InMemoryLeaseStore::findLive(const Key& key) {
    auto i = store.find(key);
    if (i != store.end() && i->second.expired(std::chrono::steady_clock::now())) {
        store.erase(i);
        return store.end();
    }
    return i;
}

std::expected<VersionToken, Error> InMemoryLeaseStore::create(const Key& key, const LeaseItem& item) {
    if (item.leaseDuration <= std::chrono::seconds::zero()) {
        return std::unexpected {Error {ErrorCode::InvalidArg, "TTL must be positive", key.toString(), ""}};
    }
    const std::unique_lock lock {m};
    auto i = findLive(key);
    if (i != store.end()) {
        return std::unexpected {Error {ErrorCode::AlreadyExists, "Item already exists", key.toString(), i->second.version}};
    }
    auto version = uuid_v7_to_hex(generate_uuid_v7());
    store.emplace(key, Record {item, version, std::chrono::steady_clock::now()});
    return version;
}

std::expected<VersionToken, Error> InMemoryLeaseStore::replace(const Key& key, const LeaseItem& item, const VersionToken& expected) {
    if (item.leaseDuration <= std::chrono::seconds::zero()) {
        return std::unexpected {Error {ErrorCode::InvalidArg, "TTL must be positive", key.toString(), ""}};
    }
    const std::unique_lock lock {m};
    auto i = findLive(key);
    if (i == store.end()) {
        return std::unexpected {Error {ErrorCode::KeyNotFound, "Item not found", key.toString(), ""}};
    }
    if (i->second.version != expected) {
        return std::unexpected {Error {ErrorCode::VersionMismatch, "Version mismatch: expected " + i->second.version + " but got " + expected, key.toString(), i->second.version}};
    }
    auto version = uuid_v7_to_hex(generate_uuid_v7());
    i->second = Record {item, version, std::chrono::steady_clock::now()};
    return version;
}

std::expected<std::monostate, Error> InMemoryLeaseStore::erase(const Key& key, const VersionToken& expected) {
    const std::unique_lock lock {m};
    auto i = findLive(key);
    if (i == store.end()) {
        return std::unexpected {Error {ErrorCode::KeyNotFound, "Item not found", key.toString(), ""}};
    }
    if (i->second.version != expected) {
        return std::unexpected {Error {ErrorCode::VersionMismatch, "Version mismatch: expected " + i->second.version + " but got " + expected, key.toString(), i->second.version}};
    }
    store.erase(i);
    return {};
}

std::expected<ConsistencyLevel, Error> InMemoryLeaseStore::consistencyLevel() const {
    if (clientLevel.has_value() && strongerThan(clientLevel.value(), accountLevel)) {
        return std::unexpected {Error {ErrorCode::ConsistencyUnsupported,
            "Client consistency level " + toString(clientLevel.value()) + " exceeds account level " + toString(accountLevel)}};
    }
    return accountLevel;
}

std::optional<ConsistencyLevel> InMemoryLeaseStore::clientConsistencyLevel() const {
    return clientLevel;
}

size_t InMemoryLeaseStore::size() const {
    const std::shared_lock lock {m};
    auto now = std::chrono::steady_clock::now();
    return static_cast<size_t>(std::count_if(store.begin(), store.end(), [now](const auto& e) {
        return !e.second.expired(now);
    }));
}

size_t InMemoryLeaseStore::purgeExpired() {
    const std::unique_lock lock {m};
    return std::erase_if(store, [now = std::chrono::steady_clock::now()](const auto& e) {
        return e.second.expired(now);
    });
}

} // namespace zlease
