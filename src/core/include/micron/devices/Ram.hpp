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

#include "ByteStore.hpp"
#include "../Types.hpp"

#include <cstdint>
#include <span>

namespace micron {

// Read-write memory answering to [base_offset, base_offset + size).
// Parameterized by kind so that plain RAM and the MMIO window share storage
// semantics while reporting different type tags.
template<DeviceKind Kind>
class ReadWriteMemory {
    ByteStore store_;

public:
    static constexpr DeviceKind kind = Kind;

    // Zero-filled
    ReadWriteMemory(uint32_t size, uint32_t base_offset)
        : store_(size, base_offset) {}

    // Initialize from an image, zero-padded to size.
    // Throws std::length_error if the image is larger than size.
    ReadWriteMemory(std::span<const uint8_t> image, uint32_t size, uint32_t base_offset)
        : store_(image, size, base_offset) {}

    [[nodiscard]] ReadResult read(uint16_t address) const {
        return store_.read(address);
    }

    [[nodiscard]] MemoryError write(uint16_t address, uint8_t value) {
        return store_.store(address, value);
    }

    [[nodiscard]] MemoryError load(std::span<const uint8_t> image) {
        return store_.load(image);
    }

    DeviceKind type_of() const noexcept { return Kind; }

    // Fail-fast access for pre-validated call sites: aborts when address is
    // outside the device
    const uint8_t& operator[](uint16_t address) const { return store_.at(address); }
    uint8_t& operator[](uint16_t address) { return store_.at(address); }

    uint32_t size() const noexcept { return store_.size(); }
    uint32_t base_offset() const noexcept { return store_.base_offset(); }
    bool contains(uint16_t address) const noexcept { return store_.contains(address); }

    // Direct access for inspection/testing
    std::span<const uint8_t> data() const noexcept { return store_.data(); }

    // Clear to zero
    void clear() { store_.clear(); }
};

using Ram = ReadWriteMemory<DeviceKind::Ram>;

} // namespace micron
