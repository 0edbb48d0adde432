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

#include "Ram.hpp"

namespace micron {

// Memory-mapped I/O window.
// Backed by plain read-write storage: reads and writes have no side effects
// beyond the stored byte. A peripheral with register side effects replaces
// this alias with its own device type.
using Mmio = ReadWriteMemory<DeviceKind::Mmio>;

} // namespace micron
