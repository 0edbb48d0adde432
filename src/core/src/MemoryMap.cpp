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

#include "micron/MemoryMap.hpp"

#include <iomanip>
#include <ostream>
#include <sstream>
#include <utility>
#include <variant>

namespace micron {

namespace {

// Format as 0x-prefixed, four hex digits (e.g., 0x8000)
std::string format_address(uint32_t address) {
    std::ostringstream oss;
    oss << "0x" << std::hex << std::setw(4) << std::setfill('0') << address;
    return oss.str();
}

} // anonymous namespace

ReadResult MemoryMap::read(uint16_t address) const {
    for (const auto& entry : entries_) {
        if (entry.contains(address)) {
            return read_device(entry.device, address);
        }
    }
    return ReadResult::failure(MemoryError::Unmapped);
}

MemoryError MemoryMap::write(uint16_t address, uint8_t value) {
    for (auto& entry : entries_) {
        if (entry.contains(address)) {
            return write_device(entry.device, address, value);
        }
    }
    return MemoryError::Unmapped;
}

MemoryMapError MemoryMap::create(std::string name, DeviceKind kind,
                                 uint32_t size, uint32_t base_offset) {
    return insert(std::move(name), make_device(kind, size, base_offset), size, base_offset);
}

MemoryMapError MemoryMap::attach(std::string name, Device device) {
    const uint32_t size = size_of(device);
    const uint32_t base_offset = base_offset_of(device);
    return insert(std::move(name), std::move(device), size, base_offset);
}

MemoryMapError MemoryMap::insert(std::string name, Device device,
                                 uint32_t size, uint32_t base_offset) {
    // 64-bit end so that ranges near the top of a u32 cannot wrap
    const uint64_t start = base_offset;
    const uint64_t end = start + size;

    if (size == 0 || end > kAddressSpaceSize) {
        return MemoryMapError::OutOfBounds;
    }

    // Half-open ranges [start, end) intersect unless one ends before the other starts
    for (const auto& entry : entries_) {
        const uint64_t entry_start = entry.base_offset;
        const uint64_t entry_end = entry_start + entry.size;
        if (start < entry_end && entry_start < end) {
            return MemoryMapError::Overlap;
        }
    }

    entries_.push_back(Entry{std::move(name), std::move(device), size, base_offset});
    return MemoryMapError::None;
}

const Device* MemoryMap::find(std::string_view name) const {
    for (const auto& entry : entries_) {
        if (entry.name == name) {
            return &entry.device;
        }
    }
    return nullptr;
}

MemoryError MemoryMap::load(std::string_view name, std::span<const uint8_t> image) {
    for (auto& entry : entries_) {
        if (entry.name == name) {
            return load_device(entry.device, image);
        }
    }
    return MemoryError::Unmapped;
}

void MemoryMap::clear_writable() {
    for (auto& entry : entries_) {
        if (auto* ram = std::get_if<Ram>(&entry.device)) {
            ram->clear();
        } else if (auto* mmio = std::get_if<Mmio>(&entry.device)) {
            mmio->clear();
        }
    }
}

std::vector<MemoryRegionDescriptor> MemoryMap::regions() const {
    std::vector<MemoryRegionDescriptor> result;
    result.reserve(entries_.size());
    for (const auto& entry : entries_) {
        const DeviceKind kind = kind_of(entry.device);
        result.push_back({entry.name, kind, entry.base_offset, entry.size, flags_for(kind)});
    }
    return result;
}

void MemoryMap::Entry::print_row(std::ostream& os) const {
    os << std::left
       << std::setw(12) << name << " | "
       << std::setw(11) << to_string(kind_of(device)) << " | "
       << std::setw(13) << format_address(base_offset) << " | "
       << format_address(base_offset + size - 1) << "\n"
       << std::right;
}

void MemoryMap::print_table(std::ostream& os) const {
    os << std::left
       << std::setw(12) << "Device Name" << " | "
       << std::setw(11) << "Device Type" << " | "
       << std::setw(13) << "Start Address" << " | "
       << "End Address" << "\n"
       << std::right
       << std::string(12, '-') << "-+-"
       << std::string(11, '-') << "-+-"
       << std::string(13, '-') << "-+-"
       << std::string(12, '-') << "\n";
    for (const auto& entry : entries_) {
        entry.print_row(os);
    }
}

} // namespace micron
