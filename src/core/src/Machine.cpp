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

#include "micron/Machine.hpp"

#include <stdexcept>
#include <string>

namespace micron {

namespace {

void require_registered(MemoryMapError error, std::string_view name) {
    if (error != MemoryMapError::None) {
        throw std::logic_error("Default memory map rejected " + std::string(name) +
                               ": " + std::string(to_string(error)));
    }
}

} // anonymous namespace

Machine::Machine() {
    require_registered(
        memory_.create(std::string(kRamName), DeviceKind::Ram, kRamSize, kRamStart), kRamName);
    require_registered(
        memory_.create(std::string(kIoName), DeviceKind::Mmio, kIoSize, kIoStart), kIoName);
    require_registered(
        memory_.create(std::string(kRomName), DeviceKind::Rom, kRomSize, kRomStart), kRomName);
}

MemoryError Machine::load_rom(std::span<const uint8_t> image) {
    return load(kRomName, image);
}

MemoryError Machine::load_ram(std::span<const uint8_t> image) {
    return load(kRamName, image);
}

MemoryError Machine::load(std::string_view name, std::span<const uint8_t> image) {
    return memory_.load(name, image);
}

void Machine::warm_reset() {
    cpu_.reset();
}

void Machine::cold_reset() {
    memory_.clear_writable();
    cpu_.reset();
}

} // namespace micron
