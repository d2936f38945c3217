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

// extern.h
#include <cstddef>
#include <cstdint>

extern "C" {
    // Signs every part of a JSON transaction that belongs to private_key.
    // tag may be NULL for the default signature tag. *out_json is
    // released with zkapp_string_free.
    int zkapp_sign_json_transaction(
        const char* transaction_json,
        const unsigned char* private_key,
        size_t private_key_size,
        const char* tag,
        char** out_json
    );

    // hex public key of a 32 byte little-endian secret key
    int zkapp_public_key_from_private(
        const unsigned char* private_key,
        size_t private_key_size,
        char** out_hex
    );

    void zkapp_string_free(char* s);

    const char* zkapp_code_to_string(int code);

    void zkapp_set_log_level(int level);
}
