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
#include "field.h"
#include "result.h"
#include "utils.h"
#include <array>
#include <string>

constexpr size_t PUBLIC_KEY_SIZE = 48;
constexpr size_t SIGNATURE_SIZE  = 96;
constexpr size_t PUBLIC_KEY_FIELDS = 2;

struct PublicKey {
    blst_p1 point;
};

struct PrivateKey {
    blst_scalar sk;
};

struct key_pair {
    PublicKey pk;
    PrivateKey sk;
};

// hex of the compressed G2 identity, placeholder before signing
extern const std::string DUMMY_SIGNATURE;

// The G1 identity. No private key maps to it, so updates addressed
// to it are treated as inert placeholders.
PublicKey public_key_empty();
bool public_key_is_empty(const PublicKey &pk);

bool operator==(const PublicKey &a, const PublicKey &b);
bool operator!=(const PublicKey &a, const PublicKey &b);

std::array<byte, PUBLIC_KEY_SIZE> compress_public_key(const PublicKey &pk);
Result<PublicKey, int> public_key_from_bytes(const byte* data, size_t len);

std::string public_key_to_hex(const PublicKey &pk);
Result<PublicKey, int> public_key_from_hex(const std::string &hex);

// two 24 byte halves of the compressed encoding
std::array<Field, PUBLIC_KEY_FIELDS> public_key_to_fields(const PublicKey &pk);
Result<PublicKey, int> public_key_from_fields(const Field* fields);

key_pair gen_key_pair(const char* tag, const bytes32 &seed);
PublicKey to_public_key(const PrivateKey &sk);
Result<PrivateKey, int> private_key_from_bytes(const byte* data, size_t len);

// hex encoded compressed G2 signature over the field's 32 bytes
std::string sign_field(
    const Field &msg,
    const PrivateKey &sk,
    const std::string &tag
);

bool verify_field_signature(
    const PublicKey &pk,
    const std::string &signature,
    const Field &msg,
    const std::string &tag
);
