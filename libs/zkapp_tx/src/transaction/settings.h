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
#include "field.h"
#include "key_sig.h"
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

constexpr const char* DEFAULT_SIGNATURE_TAG =
    "ZKAPP_TX_SIG_BLS12381G2_XMD:SHA-256_SSWU_RO_NUL_";
constexpr uint64_t DEFAULT_ACCOUNT_CREATION_FEE = 1000000000;

// on-chain nonce of (public key, token id) as of the start of the transaction
using NonceSource = std::function<uint32_t(const PublicKey&, const Field&)>;

struct Settings {
    std::string signature_tag;
    uint64_t account_creation_fee;
    bool proofs_enabled;
    NonceSource nonce_source;

    Settings(
        std::string signature_tag_,
        uint64_t account_creation_fee_,
        bool proofs_enabled_,
        NonceSource nonce_source_
    )
        : signature_tag(std::move(signature_tag_))
        , account_creation_fee(account_creation_fee_)
        , proofs_enabled(proofs_enabled_)
        , nonce_source(std::move(nonce_source_))
    {}

    uint32_t onchain_nonce(const PublicKey &pk, const Field &token_id) const;
};

using Settings_ptr = std::shared_ptr<Settings>;

// an empty nonce_source reports 0 for every account
Settings_ptr init_settings(
    std::string signature_tag = DEFAULT_SIGNATURE_TAG,
    uint64_t account_creation_fee = DEFAULT_ACCOUNT_CREATION_FEE,
    bool proofs_enabled = true,
    NonceSource nonce_source = nullptr
);
