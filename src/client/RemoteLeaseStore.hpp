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
#ifndef REMOTE_LEASE_STORE_H
#define REMOTE_LEASE_STORE_H

#include <expected>
#include <optional>
#include <string>
#include <memory>
#include <functional>
#include <variant>
#include <grpcpp/grpcpp.h>
#include "client/Config.hpp"
#include "common/Error.hpp"
#include "common/Types.hpp"
#include "storage/LeaseStore.hpp"
#include "proto/leaseStore.grpc.pb.h"

namespace zlease {

// LeaseStore backed by a LeaseStoreService reachable over gRPC. Every failure is
// translated into an Error before it leaves this class.
class RemoteLeaseStore : public LeaseStore {
public:
    using Stub = leaseStore::LeaseStoreService::Stub;
    explicit RemoteLeaseStore(Config& c);
    RemoteLeaseStore(const RemoteLeaseStore&) = delete;
    RemoteLeaseStore& operator=(const RemoteLeaseStore&) = delete;
    std::expected<VersionToken, Error> create(const Key& key, const LeaseItem& item) override;
    std::expected<VersionToken, Error> replace(const Key& key, const LeaseItem& item, const VersionToken& expected) override;
    std::expected<std::monostate, Error> erase(const Key& key, const VersionToken& expected) override;
    std::expected<ConsistencyLevel, Error> consistencyLevel() const override;
    std::optional<ConsistencyLevel> clientConsistencyLevel() const override;
    [[nodiscard]] bool connected() const;
    [[nodiscard]] std::string address() const;
private:
    std::expected<std::monostate, Error> call(
        const std::string& op,
        const std::function<grpc::Status(Stub*, grpc::ClientContext*)>& rpc) const;
    Config& config;
    std::shared_ptr<grpc::Channel> channel;
    std::unique_ptr<Stub> stub;
};

} // namespace zlease

#endif // REMOTE_LEASE_STORE_H
