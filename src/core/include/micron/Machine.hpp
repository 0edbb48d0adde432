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

#ifndef MICRON_MACHINE_HPP
#define MICRON_MACHINE_HPP

#include "Cpu.hpp"
#include "MemoryError.hpp"
#include "MemoryMap.hpp"
#include "Types.hpp"

#include <cstdint>
#include <span>
#include <string_view>

namespace micron {

// Microcomputer with a CPU register file and the default memory map:
//
//   $0000-$3FFF  RAM   16KB
//   $4000-$7FFF  IO    16KB memory-mapped I/O window
//   $8000-$FFFF  ROM   32KB
//
// The machine owns its address space; there is no process-wide memory.
class Machine {
public:
    Machine();

    // Non-copyable
    Machine(const Machine&) = delete;
    Machine& operator=(const Machine&) = delete;

    // Memory access through the address space
    [[nodiscard]] ReadResult read(uint16_t addr) const { return memory_.read(addr); }
    [[nodiscard]] MemoryError write(uint16_t addr, uint8_t value) { return memory_.write(addr, value); }

    // Replace the contents of the ROM or RAM device
    [[nodiscard]] MemoryError load_rom(std::span<const uint8_t> image);
    [[nodiscard]] MemoryError load_ram(std::span<const uint8_t> image);

    // Reset the CPU, leaving memory intact
    void warm_reset();

    // Zero RAM and the IO window, then reset the CPU. ROM contents survive.
    void cold_reset();

    // CPU access
    const Cpu& cpu() const { return cpu_; }
    Cpu& cpu() { return cpu_; }

    // Memory access
    const MemoryMap& memory() const { return memory_; }
    MemoryMap& memory() { return memory_; }

private:
    [[nodiscard]] MemoryError load(std::string_view name, std::span<const uint8_t> image);

    Cpu cpu_;
    MemoryMap memory_;
};

} // namespace micron

#endif // MICRON_MACHINE_HPP
