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

#include "Mmio.hpp"
#include "Ram.hpp"
#include "Rom.hpp"
#include "../MemoryError.hpp"
#include "../Types.hpp"

#include <concepts>
#include <cstdint>
#include <optional>
#include <span>
#include <variant>

namespace micron {

// Concept for any device that can occupy a range of the address space.
// Addresses are absolute: each device subtracts its own base offset.
template<typename T>
concept MemoryDevice = requires(T& device, const T& cdevice, uint16_t address, uint8_t value,
                                std::span<const uint8_t> image) {
    { cdevice.read(address) } -> std::same_as<ReadResult>;
    { device.write(address, value) } -> std::same_as<MemoryError>;
    { device.load(image) } -> std::same_as<MemoryError>;
    { cdevice.type_of() } -> std::same_as<DeviceKind>;
    { cdevice.size() } -> std::convertible_to<uint32_t>;
    { cdevice.base_offset() } -> std::convertible_to<uint32_t>;
};

// Closed set of device kinds. Dispatch is by std::visit, so each
// alternative is held by value with no heap indirection.
using Device = std::variant<Ram, Rom, Mmio>;

static_assert(MemoryDevice<Ram>);
static_assert(MemoryDevice<Rom>);
static_assert(MemoryDevice<Mmio>);

// Construct a zero-filled device of the requested kind
Device make_device(DeviceKind kind, uint32_t size, uint32_t base_offset);

// Result of building a device from an image: device is set only when ok()
struct DeviceResult {
    std::optional<Device> device;
    MemoryError error = MemoryError::None;

    bool ok() const noexcept { return error == MemoryError::None; }
};

// Construct a device holding image, zero-padded to size.
// OutOfBounds if the image is larger than the device.
[[nodiscard]] DeviceResult make_device(DeviceKind kind, std::span<const uint8_t> image,
                                       uint32_t size, uint32_t base_offset);

inline ReadResult read_device(const Device& device, uint16_t address) {
    return std::visit([address](const auto& d) { return d.read(address); }, device);
}

inline MemoryError write_device(Device& device, uint16_t address, uint8_t value) {
    return std::visit([address, value](auto& d) { return d.write(address, value); }, device);
}

inline MemoryError load_device(Device& device, std::span<const uint8_t> image) {
    return std::visit([image](auto& d) { return d.load(image); }, device);
}

inline DeviceKind kind_of(const Device& device) {
    return std::visit([](const auto& d) { return d.type_of(); }, device);
}

inline uint32_t size_of(const Device& device) {
    return std::visit([](const auto& d) { return d.size(); }, device);
}

inline uint32_t base_offset_of(const Device& device) {
    return std::visit([](const auto& d) { return d.base_offset(); }, device);
}

inline std::span<const uint8_t> data_of(const Device& device) {
    return std::visit([](const auto& d) { return d.data(); }, device);
}

} // namespace micron
