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
#include "blake3.h"
#include "field.h"
#include <string>
#include <vector>

// Domain separation prefixes. Every prefix must stay unique.
constexpr const char* PREFIX_BODY               = "ZkappAcctUpdBody";
constexpr const char* PREFIX_ACCOUNT_UPDATE_NODE = "ZkappAcctUpdNode";
constexpr const char* PREFIX_ACCOUNT_UPDATE_CONS = "ZkappAcctUpdCons";
constexpr const char* PREFIX_FEE_PAYER          = "ZkappFeePayer";
constexpr const char* PREFIX_MEMO               = "ZkappMemo";
constexpr const char* PREFIX_TOKEN_ID           = "ZkappTokenId";
constexpr const char* PREFIX_ZKAPP_URI          = "ZkappUri";
constexpr const char* PREFIX_TOKEN_SYMBOL       = "ZkappTokenSymbol";
constexpr const char* PREFIX_EVENT              = "ZkappEvent";
constexpr const char* PREFIX_EVENTS             = "ZkappEvents";
constexpr const char* PREFIX_EVENTS_EMPTY       = "ZkappEventsEmpty";
constexpr const char* PREFIX_SEQUENCE_EVENTS    = "ZkappSeqEvents";
constexpr const char* PREFIX_SEQUENCE_EMPTY     = "ZkappSeqEventsEmpty";
constexpr const char* PREFIX_SEQUENCE_STATE     = "ZkappSeqStateEmpty";

class BlakeHasher {
private: blake3_hasher h_;
public:
    BlakeHasher() { blake3_hasher_init(&h_); }
    // keyed by a context string, one independent hash per prefix
    explicit BlakeHasher(const char* context) {
        blake3_hasher_init_derive_key(&h_, context);
    }
    ~BlakeHasher() = default;

    void update(const byte* data, const size_t size) {
        blake3_hasher_update(&h_, data, size);
    }
    bytes32 finalize() {
        bytes32 out;
        blake3_hasher_finalize(&h_, out.data(), out.size());
        return out;
    }
};

Field hash_with_prefix(const char* prefix, const std::vector<Field> &inputs);
Field hash_string(const char* prefix, const std::string &data);
