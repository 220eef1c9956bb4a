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
#ifndef IN_MEMORY_LEASE_STORE_H
#define IN_MEMORY_LEASE_STORE_H

#include <string>
#include <chrono>
#include <unordered_map>
#include <shared_mutex>
#include <mutex>
#include <expected>
#include <optional>
#include "common/Error.hpp"
#include "common/Types.hpp"
#include "storage/LeaseStore.hpp"

namespace zlease {

class InMemoryLeaseStore : public LeaseStore {
public:
    explicit InMemoryLeaseStore(ConsistencyLevel account = ConsistencyLevel::Strong, std::optional<ConsistencyLevel> client = std::nullopt);
    std::expected<VersionToken, Error> create(const Key& key, const LeaseItem& item) override;
    std::expected<VersionToken, Error> replace(const Key& key, const LeaseItem& item, const VersionToken& expected) override;
    std::expected<std::monostate, Error> erase(const Key& key, const VersionToken& expected) override;
    std::expected<ConsistencyLevel, Error> consistencyLevel() const override;
    std::optional<ConsistencyLevel> clientConsistencyLevel() const override;
    size_t size() const;
    size_t purgeExpired();
private:
    struct Record {
        LeaseItem item;
        VersionToken version;
        std::chrono::steady_clock::time_point written;

        [[nodiscard]] bool expired(std::chrono::steady_clock::time_point now) const;
    };
    using map = std::unordered_map<Key, Record, KeyHash>;
    map::iterator findLive(const Key& key);
    std::unordered_map<Key, Record, KeyHash> store;
    const ConsistencyLevel accountLevel;
    const std::optional<ConsistencyLevel> clientLevel;
    mutable std::shared_mutex m;
};

} // namespace zlease

#endif // IN_MEMORY_LEASE_STORE_H
