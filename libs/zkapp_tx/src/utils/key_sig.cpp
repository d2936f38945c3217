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

#include "key_sig.h"
#include "codes.h"
#include <cstdlib>
#include <cstring>

static std::string dummy_signature() {
    byte buff[SIGNATURE_SIZE];
    std::memset(buff, 0, sizeof(buff));
    buff[0] = 0xc0;
    return to_hex(buff, sizeof(buff));
}

const std::string DUMMY_SIGNATURE = dummy_signature();

PublicKey public_key_empty() {
    PublicKey pk;
    std::memset(&pk.point, 0, sizeof(pk.point));
    return pk;
}

bool public_key_is_empty(const PublicKey &pk) {
    return blst_p1_is_inf(&pk.point);
}

bool operator==(const PublicKey &a, const PublicKey &b) {
    return blst_p1_is_equal(&a.point, &b.point);
}

bool operator!=(const PublicKey &a, const PublicKey &b) {
    return !(a == b);
}

std::array<byte, PUBLIC_KEY_SIZE> compress_public_key(const PublicKey &pk) {
    std::array<byte, PUBLIC_KEY_SIZE> out;
    blst_p1_compress(out.data(), &pk.point);
    return out;
}

Result<PublicKey, int> public_key_from_bytes(const byte* data, size_t len) {
    if (!data) return NULL_PARAMETER;
    if (len != PUBLIC_KEY_SIZE) return INVALID_PUBLIC_KEY;

    blst_p1_affine aff;
    if (blst_p1_uncompress(&aff, data) != BLST_SUCCESS) return INVALID_PUBLIC_KEY;
    if (!blst_p1_affine_is_inf(&aff) && !blst_p1_affine_in_g1(&aff))
        return INVALID_PUBLIC_KEY;

    PublicKey pk;
    blst_p1_from_affine(&pk.point, &aff);
    return pk;
}

std::string public_key_to_hex(const PublicKey &pk) {
    auto bytes = compress_public_key(pk);
    return to_hex(bytes.data(), bytes.size());
}

Result<PublicKey, int> public_key_from_hex(const std::string &hex) {
    if (hex.size() != PUBLIC_KEY_SIZE * 2) return INVALID_PUBLIC_KEY;
    auto bytes = from_hex(hex);
    if (bytes.is_err()) return INVALID_PUBLIC_KEY;
    return public_key_from_bytes(bytes.unwrap().data(), bytes.unwrap().size());
}

const size_t HALF_KEY = PUBLIC_KEY_SIZE / 2;

std::array<Field, PUBLIC_KEY_FIELDS> public_key_to_fields(const PublicKey &pk) {
    auto bytes = compress_public_key(pk);
    std::array<Field, PUBLIC_KEY_FIELDS> out;
    // 24 bytes always stay below r
    out[0] = field_from_bytes_reduce(bytes.data(), HALF_KEY);
    out[1] = field_from_bytes_reduce(bytes.data() + HALF_KEY, HALF_KEY);
    return out;
}

Result<PublicKey, int> public_key_from_fields(const Field* fields) {
    if (!fields) return NULL_PARAMETER;

    byte bytes[PUBLIC_KEY_SIZE];
    for (size_t i = 0; i < PUBLIC_KEY_FIELDS; i++) {
        bytes32 half = field_to_bytes(fields[i]);
        for (size_t j = HALF_KEY; j < half.size(); j++) {
            if (half[j] != 0) return INVALID_PUBLIC_KEY;
        }
        std::memcpy(bytes + i * HALF_KEY, half.data(), HALF_KEY);
    }
    return public_key_from_bytes(bytes, sizeof(bytes));
}

key_pair gen_key_pair(const char* tag, const bytes32 &seed) {
    key_pair keys;
    blst_keygen(&keys.sk.sk,
                seed.data(),
                seed.size(),
                reinterpret_cast<const byte*>(tag),
                strlen(tag));
    blst_sk_to_pk_in_g1(&keys.pk.point, &keys.sk.sk);
    return keys;
}

PublicKey to_public_key(const PrivateKey &sk) {
    PublicKey pk;
    blst_sk_to_pk_in_g1(&pk.point, &sk.sk);
    return pk;
}

Result<PrivateKey, int> private_key_from_bytes(const byte* data, size_t len) {
    if (!data) return NULL_PARAMETER;
    if (len != 32) return INVALID_PRIVATE_KEY;

    PrivateKey sk;
    blst_scalar_from_lendian(&sk.sk, data);
    if (!blst_sk_check(&sk.sk)) return INVALID_PRIVATE_KEY;
    return sk;
}

std::string sign_field(
    const Field &msg,
    const PrivateKey &sk,
    const std::string &tag
) {
    bytes32 msg_bytes = field_to_bytes(msg);

    blst_p2 hash;
    blst_hash_to_g2(&hash,
                    msg_bytes.data(), msg_bytes.size(),
                    reinterpret_cast<const byte*>(tag.data()), tag.size());

    blst_p2 sig;
    blst_sign_pk_in_g1(&sig, &hash, &sk.sk);

    byte out[SIGNATURE_SIZE];
    blst_p2_compress(out, &sig);
    return to_hex(out, sizeof(out));
}

bool verify_field_signature(
    const PublicKey &pk,
    const std::string &signature,
    const Field &msg,
    const std::string &tag
) {
    if (public_key_is_empty(pk)) return false;
    if (signature.size() != SIGNATURE_SIZE * 2) return false;

    auto sig_bytes = from_hex(signature);
    if (sig_bytes.is_err()) return false;

    blst_p2_affine sig_affine;
    if (blst_p2_uncompress(&sig_affine, sig_bytes.unwrap().data()) != BLST_SUCCESS)
        return false;
    if (!blst_p2_affine_in_g2(&sig_affine)) return false;

    blst_p1_affine pk_affine;
    blst_p1_to_affine(&pk_affine, &pk.point);

    bytes32 msg_bytes = field_to_bytes(msg);

    blst_pairing* ctx = (blst_pairing*)malloc(blst_pairing_sizeof());
    if (!ctx) return false;
    blst_pairing_init(ctx, true,
                      reinterpret_cast<const byte*>(tag.data()), tag.size());

    BLST_ERROR err = blst_pairing_aggregate_pk_in_g1(
        ctx, &pk_affine, &sig_affine, msg_bytes.data(), msg_bytes.size());

    bool is_valid = false;
    if (err == BLST_SUCCESS) {
        blst_pairing_commit(ctx);
        is_valid = blst_pairing_finalverify(ctx);
    }

    free(ctx);
    return is_valid;
}
