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
#ifndef RPC_SERVER_H
#define RPC_SERVER_H

#include <memory>
#include <string>
#include <grpcpp/grpcpp.h>
#include <spdlog/spdlog.h>
#include <thread>
#include <stdexcept>
#include <chrono>

namespace zlease {

// Hosts one gRPC service on a background thread for as long as the object lives.
template<typename Service>
class RPCServer {
public:
    RPCServer(const std::string& address, Service& s);
    ~RPCServer();
    RPCServer(const RPCServer&) = delete;
    RPCServer& operator=(const RPCServer&) = delete;
    RPCServer(RPCServer&&) = delete;
    RPCServer& operator=(RPCServer&&) = delete;
    void shutdown();
    [[nodiscard]] const std::string& address() const { return addr; }
private:
    std::string addr;
    Service& service;
    std::unique_ptr<grpc::Server> server;
    std::thread serverThread;
};

template<typename Service>
RPCServer<Service>::RPCServer(const std::string& address, Service& s)
    : addr{address}, service {s} {
    grpc::ServerBuilder sb{};
    sb.AddListeningPort(addr, grpc::InsecureServerCredentials());
    sb.RegisterService(&service);
    server = sb.BuildAndStart();
    if (!server) {
        throw std::runtime_error("Failed to start gRPC server on address: " + address);
    }
    spdlog::info("RPCServer: listening @ {}", addr);
    serverThread = std::thread([this]() { server->Wait(); });
}

// In-flight calls get a short grace period before they are cancelled.
template<typename Service>
void RPCServer<Service>::shutdown() {
    if (server) {
        server->Shutdown(std::chrono::system_clock::now() + std::chrono::milliseconds{10L});
        spdlog::info("RPCServer: stopped @ {}", addr);
    }
    if (serverThread.joinable()) {
        serverThread.join();
    }
    server.reset();
}

template<typename Service>
RPCServer<Service>::~RPCServer() {
    shutdown();
}

} // namespace zlease

#endif // RPC_SERVER_H
