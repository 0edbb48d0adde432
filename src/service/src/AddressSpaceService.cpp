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

#include "micron/service/AddressSpaceService.hpp"

#include <algorithm>
#include <span>
#include <sstream>
#include <string>

namespace micron::service {

namespace {

RegionKind to_region_kind(DeviceKind kind) {
    switch (kind) {
        case DeviceKind::Ram:  return REGION_KIND_RAM;
        case DeviceKind::Rom:  return REGION_KIND_ROM;
        case DeviceKind::Mmio: return REGION_KIND_MMIO;
    }
    return REGION_KIND_RAM;
}

} // anonymous namespace

AccessStatus to_access_status(MemoryError error) {
    switch (error) {
        case MemoryError::None:        return ACCESS_STATUS_OK;
        case MemoryError::OutOfBounds: return ACCESS_STATUS_OUT_OF_BOUNDS;
        case MemoryError::Overlap:     return ACCESS_STATUS_OVERLAP;
        case MemoryError::ReadOnly:    return ACCESS_STATUS_READ_ONLY;
        case MemoryError::WriteOnly:   return ACCESS_STATUS_WRITE_ONLY;
        case MemoryError::Unmapped:    return ACCESS_STATUS_UNMAPPED;
    }
    return ACCESS_STATUS_UNMAPPED;
}

AddressSpaceServiceImpl::AddressSpaceServiceImpl(Machine& machine)
    : machine_(machine) {
}

AddressSpaceServiceImpl::~AddressSpaceServiceImpl() = default;

grpc::Status AddressSpaceServiceImpl::GetMemoryRegions(
    grpc::ServerContext* /*context*/,
    const Empty* /*request*/,
    GetMemoryRegionsResponse* response) {

    std::lock_guard<std::mutex> lock(mutex_);

    for (const auto& region : machine_.memory().regions()) {
        auto* pb_region = response->add_regions();
        pb_region->set_name(region.name);
        pb_region->set_kind(to_region_kind(region.kind));
        pb_region->set_base_address(region.base_address);
        pb_region->set_size(region.size);
        pb_region->set_readable(has_flag(region.flags, RegionFlags::Readable));
        pb_region->set_writable(has_flag(region.flags, RegionFlags::Writable));
        pb_region->set_has_side_effects(has_flag(region.flags, RegionFlags::HasSideEffects));
    }

    return grpc::Status::OK;
}

grpc::Status AddressSpaceServiceImpl::GetMemoryMap(
    grpc::ServerContext* /*context*/,
    const Empty* /*request*/,
    GetMemoryMapResponse* response) {

    std::lock_guard<std::mutex> lock(mutex_);

    std::ostringstream table;
    machine_.memory().print_table(table);
    response->set_table(table.str());
    return grpc::Status::OK;
}

grpc::Status AddressSpaceServiceImpl::ReadMemory(
    grpc::ServerContext* /*context*/,
    const ReadMemoryRequest* request,
    ReadMemoryResponse* response) {

    uint32_t address = request->address();
    if (address > 0xFFFF) {
        return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "address outside 16-bit address space");
    }

    // Never read past the top of the address space
    uint32_t length = std::min(request->length(), kAddressSpaceSize - address);

    std::lock_guard<std::mutex> lock(mutex_);

    std::string data;
    data.reserve(length);

    for (uint32_t i = 0; i < length; ++i) {
        uint16_t addr = static_cast<uint16_t>(address + i);
        ReadResult result = machine_.read(addr);
        if (!result.ok()) {
            response->set_status(to_access_status(result.error));
            response->set_error_address(addr);
            break;
        }
        data.push_back(static_cast<char>(result.value));
    }

    response->set_data(std::move(data));
    return grpc::Status::OK;
}

grpc::Status AddressSpaceServiceImpl::WriteMemory(
    grpc::ServerContext* /*context*/,
    const WriteMemoryRequest* request,
    WriteMemoryResponse* response) {

    uint32_t address = request->address();
    const std::string& data = request->data();
    if (address > 0xFFFF || data.size() > kAddressSpaceSize - address) {
        return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "write extends past 16-bit address space");
    }

    std::lock_guard<std::mutex> lock(mutex_);

    uint32_t written = 0;
    for (size_t i = 0; i < data.size(); ++i) {
        uint16_t addr = static_cast<uint16_t>(address + i);
        MemoryError error = machine_.write(addr, static_cast<uint8_t>(data[i]));
        if (error != MemoryError::None) {
            response->set_status(to_access_status(error));
            response->set_error_address(addr);
            break;
        }
        ++written;
    }

    response->set_bytes_written(written);
    response->set_success(written == data.size());
    return grpc::Status::OK;
}

grpc::Status AddressSpaceServiceImpl::LoadImage(
    grpc::ServerContext* /*context*/,
    const LoadImageRequest* request,
    LoadImageResponse* response) {

    std::lock_guard<std::mutex> lock(mutex_);

    const std::string& data = request->data();
    std::span<const uint8_t> image(reinterpret_cast<const uint8_t*>(data.data()), data.size());

    MemoryError error = machine_.memory().load(request->region_name(), image);
    if (error == MemoryError::Unmapped) {
        return grpc::Status(grpc::StatusCode::NOT_FOUND, "no region named " + request->region_name());
    }

    response->set_status(to_access_status(error));
    response->set_success(error == MemoryError::None);
    return grpc::Status::OK;
}

grpc::Status AddressSpaceServiceImpl::Reset(
    grpc::ServerContext* /*context*/,
    const ResetRequest* request,
    ResetResponse* response) {

    std::lock_guard<std::mutex> lock(mutex_);

    if (request->cold()) {
        machine_.cold_reset();
    } else {
        machine_.warm_reset();
    }

    response->set_success(true);
    return grpc::Status::OK;
}

} // namespace micron::service
