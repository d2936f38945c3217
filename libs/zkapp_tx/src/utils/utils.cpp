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

#include "utils.h"
#include "codes.h"
#include <fstream>
#include <stdexcept>

bytes32 gen_rand_32() {
    std::ifstream urandom("/dev/urandom", std::ios::binary);
    if (!urandom) throw std::runtime_error("Failed to open /dev/urandom");

    bytes32 buffer;
    urandom.read(reinterpret_cast<char*>(buffer.data()), buffer.size());
    return buffer;
}

static const char HEX_CHARS[] = "0123456789abcdef";

std::string to_hex(const byte* data, size_t len) {
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; i++) {
        out.push_back(HEX_CHARS[data[i] >> 4]);
        out.push_back(HEX_CHARS[data[i] & 0x0f]);
    }
    return out;
}

static int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

// lowercase only, so that every byte string has exactly one encoding
Result<std::vector<byte>, int> from_hex(const std::string& hex) {
    if (hex.size() % 2 != 0) return INVALID_HEX;

    std::vector<byte> out(hex.size() / 2);
    for (size_t i = 0; i < out.size(); i++) {
        int hi = hex_value(hex[2 * i]);
        int lo = hex_value(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) return INVALID_HEX;
        out[i] = static_cast<byte>((hi << 4) | lo);
    }
    return out;
}

std::string short_str(const std::string& s) {
    if (s.size() <= 4) return ".." + s;
    return ".." + s.substr(s.size() - 4);
}
