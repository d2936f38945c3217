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

#include "hashing.h"

Field hash_with_prefix(const char* prefix, const std::vector<Field> &inputs) {
    BlakeHasher hasher(prefix);
    for (const Field &f : inputs) {
        bytes32 bytes = field_to_bytes(f);
        hasher.update(bytes.data(), bytes.size());
    }
    bytes32 h = hasher.finalize();
    return field_from_bytes_reduce(h.data(), h.size());
}

Field hash_string(const char* prefix, const std::string &data) {
    BlakeHasher hasher(prefix);
    hasher.update(reinterpret_cast<const byte*>(data.data()), data.size());
    bytes32 h = hasher.finalize();
    return field_from_bytes_reduce(h.data(), h.size());
}
