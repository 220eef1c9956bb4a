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
#ifndef LEASE_STORE_HPP
#define LEASE_STORE_HPP

#include "common/Types.hpp"
#include "common/Error.hpp"
#include <expected>
#include <optional>
#include <variant>

namespace zlease {

// Keyed item store with conditional writes and per-item TTL.
//
// create fails with AlreadyExists while an unexpired item holds the key. replace and
// erase fail with KeyNotFound when no live item exists and VersionMismatch when the
// stored token differs from the expected one. A successful create or replace restarts
// the TTL countdown of item.leaseDuration. Other codes are transport or store failures.
class LeaseStore {
public:
    virtual ~LeaseStore() = default;

    virtual std::expected<VersionToken, Error> create(const Key& key, const LeaseItem& item) = 0;
    virtual std::expected<VersionToken, Error> replace(const Key& key, const LeaseItem& item, const VersionToken& expected) = 0;
    virtual std::expected<std::monostate, Error> erase(const Key& key, const VersionToken& expected) = 0;

    // The account default level. Fails with ConsistencyUnsupported when the client
    // override asks for more than the account offers.
    virtual std::expected<ConsistencyLevel, Error> consistencyLevel() const = 0;
    virtual std::optional<ConsistencyLevel> clientConsistencyLevel() const = 0;
};

} // namespace zlease

#endif // LEASE_STORE_HPP
