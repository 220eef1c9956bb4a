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
#include "common/Types.hpp"
#include "proto/types.pb.h"
#include <string>
#include <optional>
#include <utility>
#include <chrono>
#include <algorithm>
#include <cctype>

namespace zlease {

Key::Key(const proto::Key& protoKey)
    : shardKey(protoKey.shard_key()), name(protoKey.name()) {
}

void Key::toProto(proto::Key* protoKey) const {
    protoKey->set_shard_key(shardKey);
    protoKey->set_name(name);
}

std::string Key::toString() const {
    return shardKey + "/" + name;
}

LeaseItem::LeaseItem(const proto::LeaseItem& protoItem)
    : shardKey(protoItem.shard_key()),
      name(protoItem.name()),
      leaseDuration(std::chrono::seconds{protoItem.lease_duration()}) {
}

void LeaseItem::toProto(proto::LeaseItem* protoItem) const {
    protoItem->set_shard_key(shardKey);
    protoItem->set_name(name);
    protoItem->set_lease_duration(leaseDuration.count());
}

std::string toString(const ConsistencyLevel& level) {
    switch (level) {
        case ConsistencyLevel::Strong: return "Strong";
        case ConsistencyLevel::BoundedStaleness: return "BoundedStaleness";
        case ConsistencyLevel::Session: return "Session";
        case ConsistencyLevel::ConsistentPrefix: return "ConsistentPrefix";
        case ConsistencyLevel::Eventual: return "Eventual";
    }
    std::unreachable();
}

std::optional<ConsistencyLevel> parseConsistencyLevel(const std::string& s) {
    std::string lower(s.size(), '\0');
    std::transform(s.begin(), s.end(), lower.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "strong") {
        return ConsistencyLevel::Strong;
    } else if (lower == "boundedstaleness") {
        return ConsistencyLevel::BoundedStaleness;
    } else if (lower == "session") {
        return ConsistencyLevel::Session;
    } else if (lower == "consistentprefix") {
        return ConsistencyLevel::ConsistentPrefix;
    } else if (lower == "eventual") {
        return ConsistencyLevel::Eventual;
    }
    return std::nullopt;
}

bool strongerThan(const ConsistencyLevel& a, const ConsistencyLevel& b) {
    return static_cast<char>(a) < static_cast<char>(b);
}

ConsistencyLevel fromProto(proto::ConsistencyLevel level) {
    switch (level) {
        case proto::STRONG: return ConsistencyLevel::Strong;
        case proto::BOUNDED_STALENESS: return ConsistencyLevel::BoundedStaleness;
        case proto::SESSION: return ConsistencyLevel::Session;
        case proto::CONSISTENT_PREFIX: return ConsistencyLevel::ConsistentPrefix;
        default: return ConsistencyLevel::Eventual;
    }
}

proto::ConsistencyLevel toProto(const ConsistencyLevel& level) {
    switch (level) {
        case ConsistencyLevel::Strong: return proto::STRONG;
        case ConsistencyLevel::BoundedStaleness: return proto::BOUNDED_STALENESS;
        case ConsistencyLevel::Session: return proto::SESSION;
        case ConsistencyLevel::ConsistentPrefix: return proto::CONSISTENT_PREFIX;
        case ConsistencyLevel::Eventual: return proto::EVENTUAL;
    }
    std::unreachable();
}

} // namespace zlease
