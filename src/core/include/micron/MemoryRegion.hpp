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

#pragma once

#include "Types.hpp"

#include <cstdint>
#include <string>

namespace micron {

// Flags describing memory region capabilities.
// These are used by inspection clients to discover what operations are available.
enum class RegionFlags : uint8_t {
    None           = 0,
    Readable       = 1 << 0,  // Region can be read
    Writable       = 1 << 1,  // Writes change stored bytes
    HasSideEffects = 1 << 2,  // Access may affect more than the stored byte
};

inline RegionFlags operator|(RegionFlags a, RegionFlags b) {
    return static_cast<RegionFlags>(static_cast<uint8_t>(a) | static_cast<uint8_t>(b));
}

inline RegionFlags operator&(RegionFlags a, RegionFlags b) {
    return static_cast<RegionFlags>(static_cast<uint8_t>(a) & static_cast<uint8_t>(b));
}

inline bool has_flag(RegionFlags flags, RegionFlags flag) {
    return (static_cast<uint8_t>(flags) & static_cast<uint8_t>(flag)) != 0;
}

inline RegionFlags flags_for(DeviceKind kind) {
    switch (kind) {
        case DeviceKind::Ram:
            return RegionFlags::Readable | RegionFlags::Writable;
        case DeviceKind::Rom:
            return RegionFlags::Readable;
        case DeviceKind::Mmio:
            return RegionFlags::Readable | RegionFlags::Writable | RegionFlags::HasSideEffects;
    }
    return RegionFlags::None;
}

// Information about one registered entry of a MemoryMap.
// Named "Descriptor" to avoid collision with protobuf-generated MemoryRegion.
struct MemoryRegionDescriptor {
    std::string name;       // Entry label (e.g., "RAM", "IO")
    DeviceKind kind;
    uint32_t base_address;  // Base address in CPU address space
    uint32_t size;          // Size in bytes
    RegionFlags flags;      // Capability flags
};

} // namespace micron
