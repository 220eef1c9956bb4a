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
#include "server/LeaseStoreServiceImpl.hpp"
#include "common/ErrorConverter.hpp"
#include "common/Error.hpp"
#include "common/Types.hpp"
#include <grpcpp/support/status.h>
#include <spdlog/spdlog.h>
#include <tuple>
#include "proto/leaseStore.pb.h"

namespace zlease {

namespace {

// Items are addressed by their key; a body that names another lock is rejected.
bool matches(const Key& key, const LeaseItem& item) {
    return key.shardKey == item.shardKey && key.name == item.name;
}

Error mismatch(const Key& key) {
    return Error {ErrorCode::InvalidArg, "Item does not match its key", key.toString(), ""};
}

} // namespace

LeaseStoreServiceImpl::LeaseStoreServiceImpl(LeaseStore& s)
    : store {s} {}

grpc::Status LeaseStoreServiceImpl::create(
    grpc::ServerContext* context,
    const leaseStore::CreateRequest* request,
    leaseStore::CreateReply* reply) {
    std::ignore = context;
    const Key key {request->key()};
    const LeaseItem item {request->item()};
    if (!matches(key, item)) {
        return toGrpcStatus(mismatch(key));
    }
    auto v = store.create(key, item);
    if (!v.has_value()) {
        spdlog::debug("LeaseStoreService: create {} failed: {}", key.toString(), v.error().what);
        return toGrpcStatus(v.error());
    }
    reply->set_version(v.value());
    return grpc::Status::OK;
}

grpc::Status LeaseStoreServiceImpl::replace(
    grpc::ServerContext* context,
    const leaseStore::ReplaceRequest* request,
    leaseStore::ReplaceReply* reply) {
    std::ignore = context;
    const Key key {request->key()};
    const LeaseItem item {request->item()};
    if (!matches(key, item)) {
        return toGrpcStatus(mismatch(key));
    }
    auto v = store.replace(key, item, request->expected_version());
    if (!v.has_value()) {
        spdlog::debug("LeaseStoreService: replace {} failed: {}", key.toString(), v.error().what);
        return toGrpcStatus(v.error());
    }
    reply->set_version(v.value());
    return grpc::Status::OK;
}

grpc::Status LeaseStoreServiceImpl::erase(
    grpc::ServerContext* context,
    const leaseStore::EraseRequest* request,
    leaseStore::EraseReply* reply) {
    std::ignore = context;
    std::ignore = reply;
    const Key key {request->key()};
    return toGrpcStatus(store.erase(key, request->expected_version()));
}

grpc::Status LeaseStoreServiceImpl::describe(
    grpc::ServerContext* context,
    const leaseStore::DescribeRequest* request,
    leaseStore::DescribeReply* reply) {
    std::ignore = context;
    std::ignore = request;
    auto level = store.consistencyLevel();
    if (!level.has_value()) {
        return toGrpcStatus(level.error());
    }
    reply->set_consistency_level(toProto(level.value()));
    return grpc::Status::OK;
}

} // namespace zlease
