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

#include "micron/devices/ByteStore.hpp"

#include <algorithm>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>

namespace micron {

ByteStore::ByteStore(uint32_t size, uint32_t base_offset)
    : data_(size, 0)
    , base_offset_(base_offset)
{
}

ByteStore::ByteStore(std::span<const uint8_t> image, uint32_t size, uint32_t base_offset)
    : data_(size, 0)
    , base_offset_(base_offset)
{
    if (image.size() > size) {
        throw std::length_error(
            "Image of " + std::to_string(image.size()) +
            " bytes does not fit a device of " + std::to_string(size) + " bytes");
    }
    std::copy(image.begin(), image.end(), data_.begin());
}

ReadResult ByteStore::read(uint16_t address) const {
    if (!contains(address)) {
        return ReadResult::failure(MemoryError::OutOfBounds);
    }
    return ReadResult::success(data_[address - base_offset_]);
}

MemoryError ByteStore::store(uint16_t address, uint8_t value) {
    if (!contains(address)) {
        return MemoryError::OutOfBounds;
    }
    data_[address - base_offset_] = value;
    return MemoryError::None;
}

MemoryError ByteStore::load(std::span<const uint8_t> image) {
    if (image.size() > data_.size()) {
        return MemoryError::OutOfBounds;
    }
    std::fill(data_.begin(), data_.end(), 0);
    std::copy(image.begin(), image.end(), data_.begin());
    return MemoryError::None;
}

uint8_t& ByteStore::at(uint16_t address) {
    if (!contains(address)) {
        fatal_access(address, base_offset_, size());
    }
    return data_[address - base_offset_];
}

const uint8_t& ByteStore::at(uint16_t address) const {
    if (!contains(address)) {
        fatal_access(address, base_offset_, size());
    }
    return data_[address - base_offset_];
}

void ByteStore::clear() {
    std::fill(data_.begin(), data_.end(), 0);
}

void fatal_access(uint16_t address, uint32_t base_offset, uint32_t size) {
    std::cerr << "Fatal: indexed access at $" << std::hex << std::uppercase
              << std::setw(4) << std::setfill('0') << address
              << " outside device range [$" << std::setw(4) << base_offset
              << ", $" << std::setw(4) << (base_offset + size) << ")"
              << std::dec << "\n";
    std::abort();
}

} // namespace micron
