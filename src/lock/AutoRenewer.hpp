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
#ifndef AUTO_RENEWER_H
#define AUTO_RENEWER_H

#include <mutex>
#include <thread>
#include <atomic>
#include <chrono>
#include <condition_variable>

namespace zlease {

class LockClient;
class Lock;

// Keeps one lock alive by renewing it every third of its lease. Each tick first checks
// Lock::isAcquired and stops for good once it is false; renewal failures are only logged,
// so a lost lease is noticed on the tick after local TTL math runs out.
class AutoRenewer {
public:
    enum class State {
        Running,
        Stopped
    };
    AutoRenewer(LockClient& c, Lock& l);
    ~AutoRenewer();
    AutoRenewer(const AutoRenewer&) = delete;
    AutoRenewer& operator=(const AutoRenewer&) = delete;
    AutoRenewer(AutoRenewer&&) = delete;
    AutoRenewer& operator=(AutoRenewer&&) = delete;
    void start();
    // Blocks until a tick in progress finishes.
    void stop();
    State state() const;
    std::chrono::microseconds period() const;
    static constexpr std::chrono::microseconds minInterval {100L};
private:
    void run();
    LockClient& client;
    Lock& lock;
    std::atomic<State> current;
    bool stopRequested;
    std::thread worker;
    std::mutex mtx;
    std::condition_variable cv;
};

} // namespace zlease

#endif // AUTO_RENEWER_H
