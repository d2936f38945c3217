/*
 * Bullet Ledger
 * Copyright (C) 2025 Joshua Olson
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#pragma once
#include <cstdint>
#include <limits>
#include <string>

constexpr uint32_t UINT32_MAXINT = std::numeric_limits<uint32_t>::max();
constexpr uint64_t UINT64_MAXINT = std::numeric_limits<uint64_t>::max();

enum class Sign : int8_t {
    POSITIVE = 1,
    NEGATIVE = -1,
};

// Signed amount as magnitude and sign. Zero is always positive.
struct Int64 {
    uint64_t magnitude = 0;
    Sign sgn = Sign::POSITIVE;

    static Int64 zero() { return Int64{}; }
    static Int64 from_signed(int64_t v);

    bool is_zero() const { return magnitude == 0; }
    bool is_negative() const { return sgn == Sign::NEGATIVE && magnitude != 0; }

    // throw std::overflow_error when the magnitude leaves uint64
    Int64 add(const Int64 &other) const;
    Int64 add(uint64_t amount) const;
    Int64 sub(uint64_t amount) const;
    Int64 neg() const;

    bool operator==(const Int64 &other) const;
    std::string to_string() const;
};
