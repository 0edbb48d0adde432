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

#ifndef MICRON_MEMORY_MAP_HPP
#define MICRON_MEMORY_MAP_HPP

#include "MemoryError.hpp"
#include "MemoryRegion.hpp"
#include "Types.hpp"
#include "devices/Device.hpp"

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace micron {

// MemoryMap: routes 16-bit addresses to the devices registered with it.
//
// Entries are kept in insertion order and never reordered. Registration
// rejects any range intersecting an existing entry, so at most one entry
// claims a given address and the linear scan in read()/write() is a plain
// lookup rather than a priority rule.
//
// Usage:
//   MemoryMap map;
//   map.create("RAM", DeviceKind::Ram, 0x4000, 0x0000);
//   map.create("ROM", DeviceKind::Rom, 0x8000, 0x8000);
//
//   map.write(0x0000, 0x12);        // MemoryError::None
//   map.read(0x0000).value;         // 0x12
//   map.write(0x8000, 0x34);        // MemoryError::None, ignored by ROM
//   map.write(0x4000, 0x01);        // MemoryError::Unmapped
//
// Not internally synchronized. Concurrent users must guard the whole map
// with one external lock.
class MemoryMap {
public:
    MemoryMap() = default;

    // Dispatch to the owning device; Unmapped when no entry claims address
    [[nodiscard]] ReadResult read(uint16_t address) const;
    [[nodiscard]] MemoryError write(uint16_t address, uint8_t value);

    // Construct a zero-filled device of the given kind and register it
    [[nodiscard]] MemoryMapError create(std::string name, DeviceKind kind,
                                        uint32_t size, uint32_t base_offset);

    // Register a pre-built device (e.g., a ROM constructed from an image)
    // at the range the device itself answers to
    [[nodiscard]] MemoryMapError attach(std::string name, Device device);

    size_t count() const noexcept { return entries_.size(); }

    // Look up a registered device by name (first match); nullptr if absent.
    // Read-only: an entry's range is fixed at registration.
    const Device* find(std::string_view name) const;

    // Replace the contents of the named device (first match).
    // Unmapped if no device has that name.
    [[nodiscard]] MemoryError load(std::string_view name, std::span<const uint8_t> image);

    // Zero every RAM and MMIO device. ROM contents survive.
    void clear_writable();

    std::vector<MemoryRegionDescriptor> regions() const;

    // Print a formatted table of the memory map in the following format:
    // Device Name | Device Type | Start Address | End Address
    void print_table(std::ostream& os) const;

private:
    struct Entry {
        std::string name;
        Device device;
        uint32_t size;
        uint32_t base_offset;

        bool contains(uint16_t address) const noexcept {
            const uint32_t addr = address;
            return addr >= base_offset && addr - base_offset < size;
        }

        void print_row(std::ostream& os) const;
    };

    [[nodiscard]] MemoryMapError insert(std::string name, Device device,
                                        uint32_t size, uint32_t base_offset);

    std::vector<Entry> entries_;
};

} // namespace micron

#endif // MICRON_MEMORY_MAP_HPP
