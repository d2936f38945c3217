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
#include "account_update.h"
#include "body.h"
#include "result.h"
#include <jsoncpp/json/json.h>
#include <optional>
#include <string>
#include <vector>

constexpr size_t MEMO_MAX_LENGTH = 32;

// Pays the fee, always authorized by a signature over the full commitment.
struct FeePayer {
    FeePayerBody body;
    std::string authorization = DUMMY_SIGNATURE;
    std::optional<LazySignature> lazy_authorization;

    static FeePayer default_fee_payer(const PublicKey &address, uint32_t nonce);
    static FeePayer dummy();

    Field hash() const;
};

/*
 *  Fee payer, call forest and memo.
 *
 *  JSON:
 *  {
 *    "feePayer": {"body": {...}, "authorization": "<sig hex>"},
 *    "accountUpdates": [ pre-order list, positions given by callDepth ],
 *    "memo": "<at most 32 bytes>"
 *  }
 */
struct ZkappCommand {
    FeePayer fee_payer;
    std::vector<AccountUpdate_ptr> account_updates;
    std::string memo;

    // deep copy of the forest
    ZkappCommand clone() const;

    Json::Value to_json() const;
    std::string to_json_string() const;
    static Result<ZkappCommand, int> from_json(const Json::Value &json);
    static Result<ZkappCommand, int> from_json_string(const std::string &text);

    Json::Value to_pretty() const;
};

struct TransactionCommitments {
    // commits to the call forest
    Field commitment;
    // adds memo and fee payer
    Field full_commitment;
};

Field memo_hash(const std::string &memo);

Result<TransactionCommitments, int> transaction_commitments(const ZkappCommand &command);
