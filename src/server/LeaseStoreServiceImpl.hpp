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
#ifndef SRC_SERVER_LEASESTORESERVICEIMPL_HPP
#define SRC_SERVER_LEASESTORESERVICEIMPL_HPP

#include <grpcpp/grpcpp.h>
#include "proto/leaseStore.grpc.pb.h"
#include "server/RPCServer.hpp"
#include "storage/LeaseStore.hpp"

namespace zlease {

class LeaseStoreServiceImpl final : public leaseStore::LeaseStoreService::Service {
public:
    explicit LeaseStoreServiceImpl(LeaseStore& s);
    grpc::Status create(
        grpc::ServerContext* context,
        const leaseStore::CreateRequest* request,
        leaseStore::CreateReply* reply) override;
    grpc::Status replace(
        grpc::ServerContext* context,
        const leaseStore::ReplaceRequest* request,
        leaseStore::ReplaceReply* reply) override;
    grpc::Status erase(
        grpc::ServerContext* context,
        const leaseStore::EraseRequest* request,
        leaseStore::EraseReply* reply) override;
    grpc::Status describe(
        grpc::ServerContext* context,
        const leaseStore::DescribeRequest* request,
        leaseStore::DescribeReply* reply) override;
private:
    LeaseStore& store;
};

using LeaseStoreServer = RPCServer<LeaseStoreServiceImpl>;

} // namespace zlease

#endif // SRC_SERVER_LEASESTORESERVICEIMPL_HPP
