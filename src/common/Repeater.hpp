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
#ifndef REPEATER_H
#define REPEATER_H

#include <functional>
#include "common/RetryPolicy.hpp"
#include "common/ExponentialBackoff.hpp"
#include <grpcpp/support/status.h>
#include <vector>
#include <string>

namespace zlease {

// Runs one rpc until it succeeds, fails with a code that is not retriable for op, or
// the policy runs out of attempts. Returns every status observed, last one decisive.
// Not thread-safe; use one instance per call.
class Repeater {
public:
    explicit Repeater(const RetryPolicy p);
    std::vector<grpc::Status> attempt(const std::string& op, const std::function<grpc::Status()>& rpc);
private:
    ExponentialBackoff backoff;
};

} // namespace zlease

#endif // REPEATER_H
