// Copyright © 2025 Robert Smallshire <robert@smallshire.org.uk>
//
// This file is part of Micron.
//
// Micron is free software: you can redistribute it and/or modify it under the terms of the
// GNU General Public License as published by the Free Software Foundation, either version 3 of the
// License, or (at your option) any later version. Micron is distributed in the hope that it will
// be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
// FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.
// You should have received a copy of the GNU General Public License along with Micron.
// If not, see <https://www.gnu.org/licenses/>.

#include "micron/service/Server.hpp"
#include "micron/service/AddressSpaceService.hpp"

#include <grpcpp/grpcpp.h>
#include <atomic>
#include <sstream>
#include <stdexcept>

namespace micron::service {

struct Server::Impl {
    Machine& machine;
    std::string address;
    uint16_t port;

    std::unique_ptr<AddressSpaceServiceImpl> address_space_service;
    std::unique_ptr<grpc::Server> grpc_server;

    std::atomic<bool> running{false};

    Impl(Machine& m, const std::string& addr, uint16_t p)
        : machine(m), address(addr), port(p) {}
};

Server::Server(Machine& machine, const std::string& address, uint16_t port)
    : impl_(std::make_unique<Impl>(machine, address, port)) {
}

Server::~Server() {
    stop();
}

void Server::start() {
    if (impl_->running) {
        return;
    }

    // Create services
    impl_->address_space_service = std::make_unique<AddressSpaceServiceImpl>(impl_->machine);

    // Build server address
    std::ostringstream addr_stream;
    addr_stream << impl_->address << ":" << impl_->port;
    std::string server_address = addr_stream.str();

    // Create and start gRPC server
    grpc::ServerBuilder builder;
    builder.AddListeningPort(server_address, grpc::InsecureServerCredentials());
    builder.RegisterService(impl_->address_space_service.get());

    impl_->grpc_server = builder.BuildAndStart();
    if (!impl_->grpc_server) {
        impl_->address_space_service.reset();
        throw std::runtime_error("Cannot start gRPC server on " + server_address);
    }
    impl_->running = true;
}

void Server::stop() {
    if (!impl_->running) {
        return;
    }

    impl_->running = false;

    if (impl_->grpc_server) {
        impl_->grpc_server->Shutdown();
        impl_->grpc_server.reset();
    }

    impl_->address_space_service.reset();
}

bool Server::is_running() const {
    return impl_->running;
}

std::string Server::address() const {
    return impl_->address;
}

uint16_t Server::port() const {
    return impl_->port;
}

} // namespace micron::service
