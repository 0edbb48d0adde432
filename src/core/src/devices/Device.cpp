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

#include "micron/devices/Device.hpp"

#include <utility>

namespace micron {

Device make_device(DeviceKind kind, uint32_t size, uint32_t base_offset) {
    switch (kind) {
        case DeviceKind::Rom:
            return Rom(size, base_offset);
        case DeviceKind::Mmio:
            return Mmio(size, base_offset);
        case DeviceKind::Ram:
            break;
    }
    return Ram(size, base_offset);
}

DeviceResult make_device(DeviceKind kind, std::span<const uint8_t> image,
                         uint32_t size, uint32_t base_offset) {
    if (image.size() > size) {
        return DeviceResult{std::nullopt, MemoryError::OutOfBounds};
    }

    Device device = make_device(kind, size, base_offset);
    MemoryError error = load_device(device, image);
    if (error != MemoryError::None) {
        return DeviceResult{std::nullopt, error};
    }
    return DeviceResult{std::move(device), MemoryError::None};
}

} // namespace micron
