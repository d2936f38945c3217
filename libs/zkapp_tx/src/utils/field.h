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
#include "blst.h"
#include "result.h"
#include "utils.h"
#include <cstdint>
#include <ostream>
#include <string>

// Element of the BLS12-381 scalar field, canonical little-endian.
using Field = blst_scalar;

Field new_scalar(const uint64_t v = 0);
Field field_from_bool(bool b);
Field neg_scalar(const Field &s);
Field scalar_add(const Field &a, const Field &b);
Field scalar_sub(const Field &a, const Field &b);
bool scalar_is_zero(const Field &s);

bool operator==(const Field &a, const Field &b);
bool operator!=(const Field &a, const Field &b);
std::ostream& operator<<(std::ostream& os, const Field &x);

bytes32 field_to_bytes(const Field &f);

// reduces modulo r, any length
Field field_from_bytes_reduce(const byte* data, size_t len);

// rejects values >= r
Result<Field, int> field_from_canonical(const byte* data);

// value must fit in the low limb
bool field_to_u64(const Field &f, uint64_t &out);

std::string field_to_string(const Field &f);
Result<Field, int> field_from_string(const std::string &dec);
