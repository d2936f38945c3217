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
#include "key_sig.h"
#include "settings.h"
#include "utils.h"
#include <cstdint>

constexpr const char* TEST_KEY_TAG = "zkapp_tx_tests";

// deterministic key pair number n
inline key_pair test_keys(uint64_t n) {
    bytes32 seed{};
    for (size_t i = 0; i < 8; i++) {
        seed[i] = static_cast<byte>((n >> (8 * i)) & 0xff);
    }
    seed[31] = 0x5a;
    return gen_key_pair(TEST_KEY_TAG, seed);
}

inline Settings_ptr test_settings(uint32_t onchain_nonce = 0, bool proofs_enabled = true) {
    return init_settings(
        DEFAULT_SIGNATURE_TAG,
        DEFAULT_ACCOUNT_CREATION_FEE,
        proofs_enabled,
        [onchain_nonce](const PublicKey&, const Field&) { return onchain_nonce; }
    );
}
