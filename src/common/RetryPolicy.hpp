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
#ifndef RETRY_POLICY_H
#define RETRY_POLICY_H

#include <chrono>

namespace zlease {

// Transport level retries of a single store call. Lock acquisition has its own
// retry loop driven by AcquireLockOptions.
struct RetryPolicy {
    RetryPolicy(
        std::chrono::microseconds base,
        std::chrono::microseconds max,
        int threshold,
        std::chrono::milliseconds rpc,
        std::chrono::milliseconds channel
    );
    std::chrono::microseconds baseDelay;
    std::chrono::microseconds maxDelay;
    int failureThreshold;
    std::chrono::milliseconds rpcTimeout;
    std::chrono::milliseconds channelTimeout;
    // Longest sleep allowed before retry number n + 1: baseDelay doubled n times,
    // never above maxDelay and never above one rpcTimeout.
    [[nodiscard]] std::chrono::microseconds ceiling(int n) const;
};

} // namespace zlease

#endif // RETRY_POLICY_H
