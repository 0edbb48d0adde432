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

#ifndef MICRON_CPU_HPP
#define MICRON_CPU_HPP

#include "Register.hpp"

namespace micron {

// 6502-style register file.
// No instruction semantics: the memory subsystem only needs a component that
// can be reset to zero.
struct Cpu {
    ByteRegister a;
    ByteRegister x;
    ByteRegister y;
    ByteRegister sp;
    ByteRegister flags;
    WordRegister pc;

    // Set every register to zero
    void reset();
};

} // namespace micron

#endif // MICRON_CPU_HPP
