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
#include "client/RemoteLeaseStore.hpp"
#include <spdlog/spdlog.h>
#include <string>
#include <chrono>
#include <expected>
#include <variant>
#include "client/Config.hpp"
#include "common/Error.hpp"
#include "common/ErrorConverter.hpp"
#include "common/Repeater.hpp"
#include "common/Types.hpp"
#include "proto/leaseStore.pb.h"
#include "proto/leaseStore.grpc.pb.h"

namespace zlease {

RemoteLeaseStore::RemoteLeaseStore(Config& c)
    : config{c},
      channel{grpc::CreateChannel(c.address, grpc::InsecureChannelCredentials())},
      stub{leaseStore::LeaseStoreService::NewStub(channel)} {
    if (channel->WaitForConnected(std::chrono::system_clock::now() + config.policy.channelTimeout)) {
        spdlog::info("Connected to lease store @ {}", config.address);
    } else {
        // The channel keeps reconnecting in the background; calls fail with ServiceTemporarilyUnavailable meanwhile.
        spdlog::warn("Could not connect to lease store @ {}", config.address);
    }
}

std::expected<std::monostate, Error> RemoteLeaseStore::call(
    const std::string& op,
    const std::function<grpc::Status(Stub*, grpc::ClientContext*)>& rpc) const {
    Repeater repeater {config.policy};
    auto statuses = repeater.attempt(op, [this, &rpc]() {
        grpc::ClientContext c {};
        c.set_deadline(std::chrono::system_clock::now() + config.policy.rpcTimeout);
        return rpc(stub.get(), &c);
    });
    auto result = toExpected(statuses.back());
    if (!result.has_value()) {
        spdlog::debug("RemoteLeaseStore: {} failed after {} attempt(s): {} {}",
            op, statuses.size(), toString(result.error().code), result.error().what);
    }
    return result;
}

std::expected<VersionToken, Error> RemoteLeaseStore::create(const Key& key, const LeaseItem& item) {
    leaseStore::CreateRequest request;
    key.toProto(request.mutable_key());
    item.toProto(request.mutable_item());
    leaseStore::CreateReply reply;
    auto t = call("create", [&request, &reply](Stub* s, grpc::ClientContext* c) {
        return s->create(c, request, &reply);
    });
    if (!t.has_value()) {
        return std::unexpected {t.error()};
    }
    return reply.version();
}

std::expected<VersionToken, Error> RemoteLeaseStore::replace(const Key& key, const LeaseItem& item, const VersionToken& expected) {
    leaseStore::ReplaceRequest request;
    key.toProto(request.mutable_key());
    item.toProto(request.mutable_item());
    request.set_expected_version(expected);
    leaseStore::ReplaceReply reply;
    auto t = call("replace", [&request, &reply](Stub* s, grpc::ClientContext* c) {
        return s->replace(c, request, &reply);
    });
    if (!t.has_value()) {
        return std::unexpected {t.error()};
    }
    return reply.version();
}

std::expected<std::monostate, Error> RemoteLeaseStore::erase(const Key& key, const VersionToken& expected) {
    leaseStore::EraseRequest request;
    key.toProto(request.mutable_key());
    request.set_expected_version(expected);
    leaseStore::EraseReply reply;
    return call("erase", [&request, &reply](Stub* s, grpc::ClientContext* c) {
        return s->erase(c, request, &reply);
    });
}

std::expected<ConsistencyLevel, Error> RemoteLeaseStore::consistencyLevel() const {
    leaseStore::DescribeRequest request;
    leaseStore::DescribeReply reply;
    auto t = call("describe", [&request, &reply](Stub* s, grpc::ClientContext* c) {
        return s->describe(c, request, &reply);
    });
    if (!t.has_value()) {
        return std::unexpected {t.error()};
    }
    auto account = fromProto(reply.consistency_level());
    if (config.consistencyLevel.has_value() && strongerThan(config.consistencyLevel.value(), account)) {
        return std::unexpected {Error {ErrorCode::ConsistencyUnsupported,
            "Client consistency level " + toString(config.consistencyLevel.value()) + " exceeds account level " + toString(account)}};
    }
    return account;
}

std::optional<ConsistencyLevel> RemoteLeaseStore::clientConsistencyLevel() const {
    return config.consistencyLevel;
}

bool RemoteLeaseStore::connected() const {
    return channel && channel->GetState(false) == grpc_connectivity_state::GRPC_CHANNEL_READY;
}

std::string RemoteLeaseStore::address() const {
    return config.address;
}

} // namespace zlease
