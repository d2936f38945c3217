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
#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

// Unsigned arbitrary precision integer, only what the decimal
// encoding of field elements needs.
class BigInt {
public:
    // Little-endian 64-bit limbs
    std::vector<uint64_t> limbs;

    BigInt() = default;
    explicit BigInt(uint64_t v) {
        if (v != 0)
            limbs.push_back(v);
    }

    // ---------- Queries ----------

    bool is_zero() const {
        return limbs.empty();
    }

    size_t bit_length() const {
        if (limbs.empty()) return 0;
        size_t last = limbs.size() - 1;
        uint64_t v = limbs[last];
        size_t bits = 64;
        while (v >> (bits - 1) == 0) bits--;
        return last * 64 + bits;
    }

    // ---------- Construction ----------

    // digits only, no sign. returns false on any other character
    static bool from_decimal(const std::string& dec, BigInt& out) {
        out.limbs.clear();
        if (dec.empty()) return false;

        for (char c : dec) {
            if (c < '0' || c > '9') return false;
            out.mul_u64(10);
            out.add_u64(static_cast<uint64_t>(c - '0'));
        }
        return true;
    }

    static BigInt from_le_bytes(const uint8_t* bytes, size_t len = 32) {
        BigInt x;
        x.limbs.resize((len + 7) / 8, 0);
        for (size_t i = 0; i < len; i++) {
            x.limbs[i / 8] |= uint64_t(bytes[i]) << ((i % 8) * 8);
        }
        x.trim();
        return x;
    }

    // ---------- Arithmetic ----------

    void add_u64(uint64_t v) {
        uint64_t carry = v;
        for (auto& limb : limbs) {
            if (!carry) break;
            __uint128_t t = (__uint128_t)limb + carry;
            limb = (uint64_t)t;
            carry = (uint64_t)(t >> 64);
        }
        if (carry) limbs.push_back(carry);
    }

    void mul_u64(uint64_t m) {
        uint64_t carry = 0;
        for (auto& limb : limbs) {
            __uint128_t t = (__uint128_t)limb * m + carry;
            limb = (uint64_t)t;
            carry = (uint64_t)(t >> 64);
        }
        if (carry) limbs.push_back(carry);
        trim();
    }

    // d must be nonzero
    uint64_t div_u64(uint64_t d) {
        __uint128_t rem = 0;

        for (size_t i = limbs.size(); i-- > 0;) {
            __uint128_t cur = (rem << 64) | limbs[i];
            limbs[i] = (uint64_t)(cur / d);
            rem = cur % d;
        }

        trim();
        return (uint64_t)rem;
    }

    // ---------- Conversion ----------

    std::string to_decimal() const {
        if (is_zero()) return "0";

        BigInt tmp = *this;
        std::string out;
        while (!tmp.is_zero()) {
            out.push_back(static_cast<char>('0' + tmp.div_u64(10)));
        }
        std::reverse(out.begin(), out.end());
        return out;
    }

    // little-endian output, false if the value needs more than len bytes
    bool to_le_bytes(uint8_t* out, size_t len = 32) const {
        if (bit_length() > len * 8) return false;
        std::fill(out, out + len, 0);
        for (size_t i = 0; i < limbs.size(); i++) {
            for (size_t j = 0; j < 8; j++) {
                size_t idx = i * 8 + j;
                if (idx < len) out[idx] = (limbs[i] >> (8 * j)) & 0xFF;
            }
        }
        return true;
    }

private:
    void trim() {
        while (!limbs.empty() && limbs.back() == 0)
            limbs.pop_back();
    }
};
