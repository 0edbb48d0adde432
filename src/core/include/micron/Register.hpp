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

#include <cstdint>
#include <type_traits>

namespace micron {

// A single CPU register holding an unsigned value, zero on construction
template<typename T>
class Register {
    static_assert(std::is_unsigned_v<T>, "Register value type must be unsigned");

    T value_ = 0;

public:
    constexpr Register() = default;

    constexpr T get() const noexcept { return value_; }
    constexpr void set(T value) noexcept { value_ = value; }
};

using ByteRegister = Register<uint8_t>;
using WordRegister = Register<uint16_t>;

} // namespace micron
