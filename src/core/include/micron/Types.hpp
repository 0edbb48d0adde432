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

#ifndef MICRON_TYPES_HPP
#define MICRON_TYPES_HPP

#include <cstdint>
#include <cstddef>
#include <string_view>

namespace micron {

// Address space size (one past the last 16-bit address)
constexpr uint32_t kAddressSpaceSize = 0x10000;  // 64KB

// Default machine memory map
constexpr uint32_t kRamStart = 0x0000;
constexpr uint32_t kRamSize = 0x4000;        // 16KB RAM

constexpr uint32_t kIoStart = 0x4000;
constexpr uint32_t kIoSize = 0x4000;         // 16KB memory-mapped I/O window

constexpr uint32_t kRomStart = 0x8000;
constexpr uint32_t kRomSize = 0x8000;        // 32KB ROM

// Device names used by the default memory map
constexpr std::string_view kRamName = "RAM";
constexpr std::string_view kIoName = "IO";
constexpr std::string_view kRomName = "ROM";

// Kinds of memory-like device that can occupy a range of the address space
enum class DeviceKind : uint8_t {
    Ram,
    Rom,
    Mmio
};

constexpr std::string_view to_string(DeviceKind kind) {
    switch (kind) {
        case DeviceKind::Ram:  return "RAM";
        case DeviceKind::Rom:  return "ROM";
        case DeviceKind::Mmio: return "MMIO";
    }
    return "?";
}

} // namespace micron

#endif // MICRON_TYPES_HPP
