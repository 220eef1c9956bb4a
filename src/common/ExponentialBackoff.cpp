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
#include "common/ExponentialBackoff.hpp"
#include "common/RetryPolicy.hpp"
#include "common/Util.hpp"

#include <optional>
#include <chrono>
#include <random>
#include <spdlog/spdlog.h>

namespace zlease {

ExponentialBackoff::ExponentialBackoff(const RetryPolicy p)
    : policy {p},
      rng {random_generator()} {}

std::optional<std::chrono::microseconds> ExponentialBackoff::nextDelay() {
    if (attempt >= policy.failureThreshold - 1) {
        return std::nullopt;
    }
    const auto ceiling = policy.ceiling(attempt);
    std::uniform_int_distribution<std::chrono::microseconds::rep> dist(0, ceiling.count());
    const auto delay = std::chrono::microseconds(dist(rng));
    attempt++;
    spdlog::debug("ExponentialBackoff: Attempt {}, delay: {}us of at most {}us", attempt, delay.count(), ceiling.count());
    return delay;
}

void ExponentialBackoff::reset() {
    attempt = 0;
}

int ExponentialBackoff::attempts() const {
    return attempt;
}

} // namespace zlease
