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

#ifndef MICRON_SERVICE_ADDRESS_SPACE_SERVICE_HPP
#define MICRON_SERVICE_ADDRESS_SPACE_SERVICE_HPP

#include "address_space.grpc.pb.h"
#include "micron/Machine.hpp"
#include <grpcpp/grpcpp.h>
#include <mutex>

namespace micron::service {

/// Map a core access error onto its wire representation
AccessStatus to_access_status(MemoryError error);

/// gRPC service implementation for AddressSpace.
///
/// The core memory map is not synchronized; every handler holds mutex_ for
/// the whole request so multi-byte reads, writes and image loads are atomic
/// with respect to each other.
class AddressSpaceServiceImpl final : public AddressSpace::Service {
public:
    explicit AddressSpaceServiceImpl(Machine& machine);
    ~AddressSpaceServiceImpl() override;

    // Non-copyable
    AddressSpaceServiceImpl(const AddressSpaceServiceImpl&) = delete;
    AddressSpaceServiceImpl& operator=(const AddressSpaceServiceImpl&) = delete;

    grpc::Status GetMemoryRegions(
        grpc::ServerContext* context,
        const Empty* request,
        GetMemoryRegionsResponse* response) override;

    grpc::Status GetMemoryMap(
        grpc::ServerContext* context,
        const Empty* request,
        GetMemoryMapResponse* response) override;

    grpc::Status ReadMemory(
        grpc::ServerContext* context,
        const ReadMemoryRequest* request,
        ReadMemoryResponse* response) override;

    grpc::Status WriteMemory(
        grpc::ServerContext* context,
        const WriteMemoryRequest* request,
        WriteMemoryResponse* response) override;

    grpc::Status LoadImage(
        grpc::ServerContext* context,
        const LoadImageRequest* request,
        LoadImageResponse* response) override;

    grpc::Status Reset(
        grpc::ServerContext* context,
        const ResetRequest* request,
        ResetResponse* response) override;

private:
    Machine& machine_;
    std::mutex mutex_;
};

} // namespace micron::service

#endif // MICRON_SERVICE_ADDRESS_SPACE_SERVICE_HPP
