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

#include "field.h"
#include "bigint.h"
#include "codes.h"
#include <cstring>

Field new_scalar(const uint64_t v) {
    Field s;
    uint64_t limbs[4] = {v, 0, 0, 0};
    blst_scalar_from_uint64(&s, limbs);
    return s;
}

Field field_from_bool(bool b) {
    return new_scalar(b ? 1 : 0);
}

Field scalar_add(const Field &a, const Field &b) {
    Field res;
    blst_sk_add_n_check(&res, &a, &b);
    return res;
}

Field scalar_sub(const Field &a, const Field &b) {
    Field res;
    blst_sk_sub_n_check(&res, &a, &b);
    return res;
}

Field neg_scalar(const Field &s) {
    return scalar_sub(new_scalar(), s);
}

bool scalar_is_zero(const Field &s) {
    for (size_t i = 0; i < sizeof(s.b); i++) {
        if (s.b[i] != 0) return false;
    }
    return true;
}

bool operator==(const Field &a, const Field &b) {
    return std::memcmp(a.b, b.b, sizeof(a.b)) == 0;
}

bool operator!=(const Field &a, const Field &b) {
    return !(a == b);
}

std::ostream& operator<<(std::ostream& os, const Field &x) {
    os << field_to_string(x);
    return os;
}

bytes32 field_to_bytes(const Field &f) {
    bytes32 out;
    blst_lendian_from_scalar(out.data(), &f);
    return out;
}

Field field_from_bytes_reduce(const byte* data, size_t len) {
    Field s;
    blst_scalar_from_le_bytes(&s, data, len);
    return s;
}

Result<Field, int> field_from_canonical(const byte* data) {
    Field s;
    blst_scalar_from_lendian(&s, data);
    if (!blst_scalar_fr_check(&s)) return FIELD_RANGE_ERR;
    return s;
}

bool field_to_u64(const Field &f, uint64_t &out) {
    uint64_t limbs[4];
    blst_uint64_from_scalar(limbs, &f);
    if (limbs[1] != 0 || limbs[2] != 0 || limbs[3] != 0) return false;
    out = limbs[0];
    return true;
}

std::string field_to_string(const Field &f) {
    bytes32 bytes = field_to_bytes(f);
    return BigInt::from_le_bytes(bytes.data(), bytes.size()).to_decimal();
}

Result<Field, int> field_from_string(const std::string &dec) {
    // canonical form only: "0" or no leading zero
    if (dec.size() > 1 && dec[0] == '0') return FIELD_RANGE_ERR;

    BigInt n;
    if (!BigInt::from_decimal(dec, n)) return FIELD_RANGE_ERR;

    bytes32 bytes;
    if (!n.to_le_bytes(bytes.data(), bytes.size())) return FIELD_RANGE_ERR;
    return field_from_canonical(bytes.data());
}
