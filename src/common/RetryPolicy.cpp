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
#include "common/RetryPolicy.hpp"
#include <stdexcept>
#include <chrono>
#include <algorithm>
#include <cstdint>

namespace zlease {

RetryPolicy::RetryPolicy(
    std::chrono::microseconds base,
    std::chrono::microseconds max,
    int threshold,
    std::chrono::milliseconds rpc,
    std::chrono::milliseconds channel)
    : baseDelay(base),
      maxDelay(max),
      failureThreshold(threshold),
      rpcTimeout(rpc),
      channelTimeout(channel) {
    if (threshold < 0) {
        throw std::invalid_argument("Failure threshold must be >= zero.");
    }
    if (base < std::chrono::microseconds::zero()) {
        throw std::invalid_argument("Base delay must be >= zero.");
    }
    if (max < std::chrono::microseconds::zero()) {
        throw std::invalid_argument("Max delay must be >= zero.");
    }
    if (rpc <= std::chrono::milliseconds::zero()) {
        throw std::invalid_argument("RPC timeout must be > zero.");
    }
    if (channel < std::chrono::milliseconds::zero()) {
        throw std::invalid_argument("Channel timeout must be >= zero.");
    }
    if (max < base) {
        throw std::invalid_argument("Max delay must be >= base delay.");
    }
}

std::chrono::microseconds RetryPolicy::ceiling(int n) const {
    const auto cap = std::min(maxDelay, std::chrono::duration_cast<std::chrono::microseconds>(rpcTimeout));
    const auto base = static_cast<uint64_t>(baseDelay.count());
    const auto limit = static_cast<uint64_t>(cap.count());
    const auto shift = static_cast<unsigned int>(std::clamp(n, 0, 62));
    if (base == 0) {
        return std::chrono::microseconds::zero();
    }
    if ((limit >> shift) < base) {
        return cap;
    }
    return std::chrono::microseconds(static_cast<std::chrono::microseconds::rep>(base << shift));
}

} // namespace zlease
