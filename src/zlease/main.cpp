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
#include <csignal>
#include <ctime>
#include <cerrno>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <signal.h>
#include <pthread.h>
#include <spdlog/spdlog.h>
#include <spdlog/async.h>
#include <spdlog/async_logger.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include "common/Types.hpp"
#include "storage/InMemoryLeaseStore.hpp"
#include "server/LeaseStoreServiceImpl.hpp"

using zlease::ConsistencyLevel;
using zlease::InMemoryLeaseStore;
using zlease::LeaseStoreServiceImpl;
using zlease::LeaseStoreServer;
using zlease::parseConsistencyLevel;

int main(int argc, char** argv) {
    if (argc > 3) {
        std::cerr << "Usage: " << argv[0] << " [address] [consistency]" << std::endl;
        return 1;
    }
    const std::string listenAddress {argc > 1 ? argv[1] : "localhost:50051"};
    const auto level = argc > 2 ? parseConsistencyLevel(argv[2]) : std::optional<ConsistencyLevel> {ConsistencyLevel::Strong};
    if (!level.has_value()) {
        std::cerr << "Unknown consistency level: " << argv[2] << std::endl;
        return 1;
    }

    spdlog::init_thread_pool(8192, 1);
    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        "logs/zlease.txt", 1024 * 1024 * 5, 3);
    std::vector<spdlog::sink_ptr> sinks {consoleSink, fileSink};
    const auto asyncLogger = std::make_shared<spdlog::async_logger>(
        "gAsync", sinks.begin(), sinks.end(),
        spdlog::thread_pool(), spdlog::async_overflow_policy::overrun_oldest);
    spdlog::register_logger(asyncLogger);
    spdlog::set_default_logger(asyncLogger);

    // Blocked before any gRPC thread exists so only sigtimedwait below sees them.
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    spdlog::info("ZLease store starting, account consistency {}", zlease::toString(level.value()));
    InMemoryLeaseStore store {level.value()};
    LeaseStoreServiceImpl service {store};
    LeaseStoreServer server {listenAddress, service};

    const timespec tick {1, 0};
    while (true) {
        const int sig = sigtimedwait(&signals, nullptr, &tick);
        if (sig == SIGINT || sig == SIGTERM) {
            spdlog::info("Received signal {}, shutting down", sig);
            break;
        }
        if (sig < 0 && errno != EAGAIN && errno != EINTR) {
            spdlog::error("sigtimedwait failed: {}", errno);
            break;
        }
        if (auto purged = store.purgeExpired(); purged > 0) {
            spdlog::debug("Purged {} expired item(s), {} live", purged, store.size());
        }
    }
    server.shutdown();
    spdlog::shutdown();
    return 0;
}
