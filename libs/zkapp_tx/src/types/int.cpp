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

#include "int.h"
#include <stdexcept>

static Int64 normalize(uint64_t magnitude, Sign sgn) {
    Int64 out;
    out.magnitude = magnitude;
    out.sgn = magnitude == 0 ? Sign::POSITIVE : sgn;
    return out;
}

Int64 Int64::from_signed(int64_t v) {
    if (v < 0) {
        // -(INT64_MIN) does not fit in int64
        uint64_t mag = static_cast<uint64_t>(-(v + 1)) + 1;
        return normalize(mag, Sign::NEGATIVE);
    }
    return normalize(static_cast<uint64_t>(v), Sign::POSITIVE);
}

Int64 Int64::add(const Int64 &other) const {
    if (sgn == other.sgn) {
        if (magnitude > UINT64_MAXINT - other.magnitude)
            throw std::overflow_error("Int64::add: magnitude overflow");
        return normalize(magnitude + other.magnitude, sgn);
    }
    if (magnitude >= other.magnitude)
        return normalize(magnitude - other.magnitude, sgn);
    return normalize(other.magnitude - magnitude, other.sgn);
}

Int64 Int64::add(uint64_t amount) const {
    return add(normalize(amount, Sign::POSITIVE));
}

Int64 Int64::sub(uint64_t amount) const {
    return add(normalize(amount, Sign::NEGATIVE));
}

Int64 Int64::neg() const {
    return normalize(magnitude, sgn == Sign::POSITIVE ? Sign::NEGATIVE : Sign::POSITIVE);
}

bool Int64::operator==(const Int64 &other) const {
    return magnitude == other.magnitude && sgn == other.sgn;
}

std::string Int64::to_string() const {
    std::string out = std::to_string(magnitude);
    return is_negative() ? "-" + out : out;
}
