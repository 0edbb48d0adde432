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

#include "../MemoryError.hpp"

#include <cstdint>
#include <span>
#include <vector>

namespace micron {

// Backing storage shared by all device kinds.
//
// Holds exactly size() bytes answering to the absolute addresses
// [base_offset, base_offset + size). Addresses are widened to 32 bits
// before the range check, so a device may end at 0x10000.
class ByteStore {
    std::vector<uint8_t> data_;
    uint32_t base_offset_ = 0;

public:
    ByteStore(uint32_t size, uint32_t base_offset);

    // Initialize from an image; throws std::length_error if the image is
    // larger than size. Shorter images are zero-padded.
    ByteStore(std::span<const uint8_t> image, uint32_t size, uint32_t base_offset);

    uint32_t size() const noexcept { return static_cast<uint32_t>(data_.size()); }
    uint32_t base_offset() const noexcept { return base_offset_; }

    bool contains(uint16_t address) const noexcept {
        const uint32_t addr = address;
        return addr >= base_offset_ && addr - base_offset_ < size();
    }

    [[nodiscard]] ReadResult read(uint16_t address) const;
    [[nodiscard]] MemoryError store(uint16_t address, uint8_t value);

    // Replace the whole contents: zero everything, then copy image to the
    // low addresses. Storage is untouched if the image does not fit.
    [[nodiscard]] MemoryError load(std::span<const uint8_t> image);

    // Bounds-checked element access. Aborts the process on violation.
    uint8_t& at(uint16_t address);
    const uint8_t& at(uint16_t address) const;

    // Direct access for inspection
    std::span<const uint8_t> data() const noexcept { return data_; }

    void clear();
};

// Report an indexed access outside [base_offset, base_offset + size) and abort.
// The range is printed half-open so that empty devices read sensibly.
[[noreturn]] void fatal_access(uint16_t address, uint32_t base_offset, uint32_t size);

} // namespace micron
