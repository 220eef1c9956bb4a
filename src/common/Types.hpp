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
#ifndef TYPES_HPP
#define TYPES_HPP

#include <string>
#include <chrono>
#include <cstdint>
#include <optional>
#include <functional>
#include "proto/types.pb.h"

namespace zlease {

// Opaque token minted by the store on every successful write.
using VersionToken = std::string;

struct Key {
    std::string shardKey;
    std::string name;

    Key(const std::string& s, const std::string& n) : shardKey(s), name(n) {}

    Key(const proto::Key& protoKey);

    void toProto(proto::Key* protoKey) const;

    std::string toString() const;

    bool operator==(const Key& other) const {
        return shardKey == other.shardKey && name == other.name;
    }
};

struct KeyHash {
    std::size_t operator()(const Key& key) const {
        auto h = std::hash<std::string>()(key.shardKey);
        return h ^ (std::hash<std::string>()(key.name) + 0x9e3779b9 + (h << 6) + (h >> 2));
    }
};

// The document a lock is persisted as. leaseDuration doubles as the item TTL.
struct LeaseItem {
    std::string shardKey;
    std::string name;
    std::chrono::seconds leaseDuration;

    LeaseItem(const std::string& s, const std::string& n, std::chrono::seconds d)
        : shardKey(s), name(n), leaseDuration(d) {}

    LeaseItem(const proto::LeaseItem& protoItem);

    void toProto(proto::LeaseItem* protoItem) const;

    bool operator==(const LeaseItem& other) const {
        return shardKey == other.shardKey && name == other.name && leaseDuration == other.leaseDuration;
    }
};

// Ordered strongest first.
enum class ConsistencyLevel : char {
    Strong = 0,
    BoundedStaleness = 1,
    Session = 2,
    ConsistentPrefix = 3,
    Eventual = 4
};

std::string toString(const ConsistencyLevel& level);
std::optional<ConsistencyLevel> parseConsistencyLevel(const std::string& s);
bool strongerThan(const ConsistencyLevel& a, const ConsistencyLevel& b);

ConsistencyLevel fromProto(proto::ConsistencyLevel level);
proto::ConsistencyLevel toProto(const ConsistencyLevel& level);

} // namespace zlease

#endif // TYPES_HPP
