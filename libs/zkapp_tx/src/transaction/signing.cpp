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

#include "signing.h"
#include "call_forest.h"
#include "codes.h"
#include "logging.h"
#include <variant>

static std::optional<PrivateKey> find_key(
    const PublicKey &pk,
    const std::optional<PrivateKey> &intent_key,
    const std::vector<PrivateKey> &extra_keys
) {
    if (intent_key) return intent_key;
    for (const PrivateKey &sk : extra_keys) {
        if (to_public_key(sk) == pk) return sk;
    }
    return std::nullopt;
}

static int sign_fee_payer(
    FeePayer &fee_payer,
    const Field &full_commitment,
    const std::vector<PrivateKey> &extra_keys,
    const Settings &settings
) {
    if (!fee_payer.lazy_authorization) return OK;

    auto key = find_key(fee_payer.body.public_key,
                        fee_payer.lazy_authorization->private_key,
                        extra_keys);
    if (!key) {
        std::string pk = public_key_to_hex(fee_payer.body.public_key);
        log_msg(LOG_ERROR,
            "add_missing_signatures: cannot add signature for fee payer (%s), "
            "private key is missing.", pk.c_str());
        return MISSING_PRIVATE_KEY;
    }
    fee_payer.authorization = sign_field(full_commitment, *key, settings.signature_tag);
    fee_payer.lazy_authorization.reset();
    return OK;
}

// Finalizes one lazy intent. One overload per intent kind.
struct SignIntent {
    AccountUpdate &update;
    const TransactionCommitments &commitments;
    const std::vector<PrivateKey> &extra_keys;
    const Settings &settings;

    int operator()(const std::monostate &) { return OK; }

    // needs no authorization, passes through as it is
    int operator()(const LazyNone &) { return OK; }

    int operator()(const LazySignature &intent) {
        auto key = find_key(update.body.public_key, intent.private_key, extra_keys);
        if (!key) {
            std::string pk = public_key_to_hex(update.body.public_key);
            log_msg(LOG_ERROR,
                "add_missing_signatures: cannot add signature for %s, "
                "private key is missing.", pk.c_str());
            return MISSING_PRIVATE_KEY;
        }
        const Field &message = update.body.use_full_commitment
            ? commitments.full_commitment
            : commitments.commitment;
        // replaces the intent, nothing of it is read after this
        update.set_signature(sign_field(message, *key, settings.signature_tag));
        return OK;
    }

    // left for add_missing_proofs
    int operator()(const LazyProof &) { return OK; }
};

static int sign_update(
    AccountUpdate &update,
    const TransactionCommitments &commitments,
    const std::vector<PrivateKey> &extra_keys,
    const Settings &settings
) {
    // updates addressed to the empty key are never authorized
    if (update.is_dummy()) return OK;

    SignIntent sign{update, commitments, extra_keys, settings};
    return std::visit(sign, update.lazy_authorization);
}

Result<ZkappCommand, int> add_missing_signatures(
    const ZkappCommand &command,
    const std::vector<PrivateKey> &extra_keys,
    const Settings &settings
) {
    auto commitments = transaction_commitments(command);
    if (commitments.is_err()) return commitments.unwrap_err();
    const TransactionCommitments &c = commitments.unwrap();

    ZkappCommand signed_cmd = command.clone();

    int rc = sign_fee_payer(signed_cmd.fee_payer, c.full_commitment, extra_keys, settings);
    if (rc != OK) return rc;

    for_each(signed_cmd.account_updates, [&](const AccountUpdate_ptr &update) {
        if (rc != OK) return;
        rc = sign_update(*update, c, extra_keys, settings);
    });
    if (rc != OK) return rc;

    return signed_cmd;
}

Result<std::string, int> sign_json_transaction(
    const std::string &transaction_json,
    const PrivateKey &private_key,
    const Settings &settings
) {
    auto parsed = ZkappCommand::from_json_string(transaction_json);
    if (parsed.is_err()) return parsed.unwrap_err();
    ZkappCommand &cmd = parsed.unwrap();

    auto commitments = transaction_commitments(cmd);
    if (commitments.is_err()) return commitments.unwrap_err();
    const TransactionCommitments &c = commitments.unwrap();

    PublicKey pk = to_public_key(private_key);

    if (cmd.fee_payer.body.public_key == pk) {
        cmd.fee_payer.authorization =
            sign_field(c.full_commitment, private_key, settings.signature_tag);
    }

    size_t signed_count = 0;
    for_each(cmd.account_updates, [&](const AccountUpdate_ptr &update) {
        if (update->body.public_key != pk) return;
        if (update->authorization.proof) return;

        const Field &message = update->body.use_full_commitment
            ? c.full_commitment
            : c.commitment;
        update->set_signature(sign_field(message, private_key, settings.signature_tag));
        signed_count++;
    });
    log_msg(LOG_DEBUG, "sign_json_transaction: signed %zu account updates", signed_count);

    return cmd.to_json_string();
}
