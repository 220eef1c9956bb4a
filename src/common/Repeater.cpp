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
#include "common/Repeater.hpp"
#include "common/Error.hpp"
#include "common/ErrorConverter.hpp"
#include "common/RetryPolicy.hpp"
#include <functional>
#include <chrono>
#include <thread>
#include <grpcpp/support/status.h>
#include <spdlog/spdlog.h>
#include <vector>
#include <string>

namespace zlease {

Repeater::Repeater(const RetryPolicy p)
    : backoff {p} {}

std::vector<grpc::Status> Repeater::attempt(const std::string& op, const std::function<grpc::Status()>& rpc) {
    std::vector<grpc::Status> statuses;
    while (true) {
        auto status = rpc();
        statuses.push_back(status);
        if (status.ok()) {
            backoff.reset();
            return statuses;
        }
        if (!isRetriable(op, toError(status).code)) {
            backoff.reset();
            return statuses;
        }
        auto delay = backoff.nextDelay();
        if (!delay.has_value()) {
            return statuses;
        }
        spdlog::debug("Repeater: {} failed with {}, retry {} in {}us",
            op, status.error_message(), backoff.attempts(), delay.value().count());
        std::this_thread::sleep_for(delay.value());
    }
}

} // namespace zlease
