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

#ifndef MICRON_MEMORY_ERROR_HPP
#define MICRON_MEMORY_ERROR_HPP

#include <cstdint>
#include <string_view>

namespace micron {

// Outcome of a byte access or image load.
//
// Overlap, ReadOnly and WriteOnly are reserved for MMIO devices with
// asymmetric ports. No current device produces them.
enum class MemoryError : uint8_t {
    None = 0,
    OutOfBounds,   // Address or image outside the device's capacity
    Overlap,
    ReadOnly,
    WriteOnly,
    Unmapped       // No device claims the address
};

// Outcome of registering a device with a MemoryMap
enum class MemoryMapError : uint8_t {
    None = 0,
    Overlap,       // Range collides with an existing entry
    OutOfBounds    // Empty range, or range extends past the 16-bit address space
};

constexpr std::string_view to_string(MemoryError error) {
    switch (error) {
        case MemoryError::None:        return "none";
        case MemoryError::OutOfBounds: return "out of bounds";
        case MemoryError::Overlap:     return "overlap";
        case MemoryError::ReadOnly:    return "read only";
        case MemoryError::WriteOnly:   return "write only";
        case MemoryError::Unmapped:    return "unmapped";
    }
    return "unknown";
}

constexpr std::string_view to_string(MemoryMapError error) {
    switch (error) {
        case MemoryMapError::None:        return "none";
        case MemoryMapError::Overlap:     return "overlap";
        case MemoryMapError::OutOfBounds: return "out of bounds";
    }
    return "unknown";
}

// Result of a byte read: the value is meaningful only when ok()
struct ReadResult {
    uint8_t value = 0;
    MemoryError error = MemoryError::None;

    constexpr bool ok() const noexcept { return error == MemoryError::None; }

    static constexpr ReadResult success(uint8_t value) noexcept {
        return ReadResult{value, MemoryError::None};
    }

    static constexpr ReadResult failure(MemoryError error) noexcept {
        return ReadResult{0, error};
    }
};

} // namespace micron

#endif // MICRON_MEMORY_ERROR_HPP
