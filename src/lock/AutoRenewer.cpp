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
#include "lock/AutoRenewer.hpp"
#include <thread>
#include <chrono>
#include <mutex>
#include <algorithm>
#include <spdlog/spdlog.h>
#include "lock/Lock.hpp"
#include "lock/LockClient.hpp"
#include "common/Error.hpp"

namespace zlease {

AutoRenewer::AutoRenewer(LockClient& c, Lock& l)
    : client {c}, lock {l}, current {State::Stopped}, stopRequested {false}, worker {}, mtx {}, cv {} {}

std::chrono::microseconds AutoRenewer::period() const {
    return std::chrono::duration_cast<std::chrono::microseconds>(lock.leaseDuration()) / 3;
}

void AutoRenewer::start() {
    {
        std::lock_guard<std::mutex> l(mtx);
        if (current == State::Running || stopRequested) {
            return;
        }
        current = State::Running;
    }
    worker = std::thread([this]() { run(); });
}

void AutoRenewer::run() {
    auto interval = period();
    while (true) {
        {
            std::unique_lock<std::mutex> l(mtx);
            if (cv.wait_for(l, interval, [this]{ return stopRequested; })) {
                break;
            }
        }
        if (!lock.isAcquired()) {
            spdlog::info("AutoRenewer: {}/{} is no longer acquired, stopping", lock.shardKey(), lock.name());
            break;
        }
        const auto begin = std::chrono::system_clock::now();
        auto r = client.renew(lock);
        const auto took = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::system_clock::now() - begin);
        if (r.has_value()) {
            spdlog::debug("AutoRenewer: renewed {}/{} in {}us", lock.shardKey(), lock.name(), took.count());
        } else {
            spdlog::warn("AutoRenewer: renewing {}/{} failed: {} {}", lock.shardKey(), lock.name(), toString(r.error().code), r.error().what);
        }
        interval = std::max(minInterval, period() - took);
    }
    current = State::Stopped;
}

void AutoRenewer::stop() {
    {
        std::lock_guard<std::mutex> l(mtx);
        stopRequested = true;
    }
    cv.notify_all();
    if (worker.joinable() && worker.get_id() != std::this_thread::get_id()) {
        worker.join();
    }
    current = State::Stopped;
}

AutoRenewer::State AutoRenewer::state() const {
    return current;
}

AutoRenewer::~AutoRenewer() {
    stop();
}

} // namespace zlease
