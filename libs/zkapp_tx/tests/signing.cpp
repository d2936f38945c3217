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

#include <cassert>
#include <cstdio>
#include <string>
#include "codes.h"
#include "extern.h"
#include "helpers.h"
#include "signing.h"
#include "transaction.h"

void test_add_missing_signatures() {
    Settings_ptr settings = test_settings(0);
    key_pair fee_payer = test_keys(300);
    key_pair alice = test_keys(301);
    key_pair bob = test_keys(302);
    key_pair carol = test_keys(303);
    key_pair dave = test_keys(304);

    auto tx = Transaction::begin(settings, fee_payer.pk);
    auto by_extra_key = tx->create_signed(alice.pk);

    auto proved = tx->create(bob.pk);
    LazyProof intent;
    intent.method_name = "deposit";
    proved->set_lazy_proof(intent);

    auto unauthorized = tx->create(carol.pk);
    unauthorized->set_lazy_none();

    auto by_intent_key = tx->create_signed(dave.sk);
    auto as_fee_payer = tx->create_signed(fee_payer.pk);

    auto built = tx->build_command();
    assert(built.is_ok());
    ZkappCommand &cmd = built.unwrap();
    TransactionCommitments c = transaction_commitments(cmd).unwrap();
    const std::string &tag = settings->signature_tag;

    auto res = add_missing_signatures(cmd, {fee_payer.sk, alice.sk}, *settings);
    assert(res.is_ok());
    ZkappCommand &signed_cmd = res.unwrap();
    auto &updates = signed_cmd.account_updates;
    assert(updates.size() == 5);

    assert(verify_field_signature(
        fee_payer.pk, signed_cmd.fee_payer.authorization, c.full_commitment, tag));
    assert(!signed_cmd.fee_payer.lazy_authorization);

    assert(!updates[0]->has_lazy_signature());
    assert(verify_field_signature(alice.pk, *updates[0]->authorization.signature, c.commitment, tag));

    assert(updates[1]->has_lazy_proof());
    assert(!updates[1]->authorization.signature);

    assert(std::holds_alternative<LazyNone>(updates[2]->lazy_authorization));
    assert(!updates[2]->authorization.signature && !updates[2]->authorization.proof);

    assert(verify_field_signature(dave.pk, *updates[3]->authorization.signature, c.commitment, tag));

    // same account as the fee payer signs the full commitment
    assert(updates[4]->body.use_full_commitment);
    assert(verify_field_signature(
        fee_payer.pk, *updates[4]->authorization.signature, c.full_commitment, tag));
    assert(!verify_field_signature(
        fee_payer.pk, *updates[4]->authorization.signature, c.commitment, tag));

    // the input command is untouched
    assert(by_extra_key->has_lazy_signature());
    assert(cmd.fee_payer.lazy_authorization.has_value());
    assert(cmd.fee_payer.authorization == DUMMY_SIGNATURE);

    printf("MISSING SIGNATURES ADDED. \n");
    printf("\n");
}

void test_missing_private_key() {
    Settings_ptr settings = test_settings(0);
    key_pair fee_payer = test_keys(310);
    key_pair alice = test_keys(311);

    auto tx = Transaction::begin(settings, fee_payer.pk);
    tx->create_signed(alice.pk);
    ZkappCommand cmd = tx->build_command().unwrap();

    auto no_alice = add_missing_signatures(cmd, {fee_payer.sk}, *settings);
    assert(no_alice.unwrap_err() == MISSING_PRIVATE_KEY);

    auto no_fee_payer = add_missing_signatures(cmd, {alice.sk}, *settings);
    assert(no_fee_payer.unwrap_err() == MISSING_PRIVATE_KEY);

    // the sender key given to the transaction is enough for the fee payer
    tx->sender_key = fee_payer.sk;
    ZkappCommand with_key = tx->build_command().unwrap();
    assert(add_missing_signatures(with_key, {alice.sk}, *settings).is_ok());

    printf("MISSING PRIVATE KEY REPORTED. \n");
    printf("\n");
}

void test_dummy_never_signed() {
    Settings_ptr settings = test_settings(0);
    key_pair fee_payer = test_keys(320);

    auto tx = Transaction::begin(settings, fee_payer.pk);
    auto real = tx->create(test_keys(321).pk);
    auto filler = AccountUpdate::dummy();
    filler->set_lazy_signature();
    make_child_account_update(real, filler);

    ZkappCommand cmd = tx->build_command().unwrap();
    auto res = add_missing_signatures(cmd, {fee_payer.sk}, *settings);
    assert(res.is_ok());
    auto kids = res.unwrap().account_updates[0]->children.account_updates;
    assert(kids.size() == 1);
    assert(kids[0]->has_lazy_signature());
    assert(!kids[0]->authorization.signature);

    printf("DUMMY LEFT UNSIGNED. \n");
    printf("\n");
}

void test_sign_json_two_parties() {
    Settings_ptr settings = test_settings(2);
    key_pair fee_payer = test_keys(330);
    key_pair alice = test_keys(331);

    auto tx = Transaction::begin(settings, fee_payer.pk);
    tx->memo = "two parties";
    tx->fee = 10;
    tx->create_signed(alice.pk);
    auto proved = tx->create(alice.pk);
    proved->set_proof("abcd");

    ZkappCommand cmd = tx->build_command().unwrap();
    TransactionCommitments c = transaction_commitments(cmd).unwrap();
    const std::string &tag = settings->signature_tag;

    auto first = sign_json_transaction(cmd.to_json_string(), fee_payer.sk, *settings);
    assert(first.is_ok());
    ZkappCommand after_first = ZkappCommand::from_json_string(first.unwrap()).unwrap();
    assert(verify_field_signature(
        fee_payer.pk, after_first.fee_payer.authorization, c.full_commitment, tag));
    assert(!after_first.account_updates[0]->authorization.signature);

    auto second = sign_json_transaction(first.unwrap(), alice.sk, *settings);
    assert(second.is_ok());
    ZkappCommand done = ZkappCommand::from_json_string(second.unwrap()).unwrap();

    TransactionCommitments again = transaction_commitments(done).unwrap();
    assert(again.commitment == c.commitment);
    assert(again.full_commitment == c.full_commitment);

    assert(verify_field_signature(
        fee_payer.pk, done.fee_payer.authorization, c.full_commitment, tag));
    assert(verify_field_signature(
        alice.pk, *done.account_updates[0]->authorization.signature, c.commitment, tag));

    // updates carrying a proof are left alone
    assert(done.account_updates[1]->authorization.proof == std::optional<std::string>("abcd"));
    assert(!done.account_updates[1]->authorization.signature);

    assert(sign_json_transaction("{", alice.sk, *settings).unwrap_err() == JSON_PARSE_ERR);

    printf("JSON SIGNING VALIDATED. \n");
    printf("\n");
}

void test_c_bindings() {
    key_pair fee_payer = test_keys(340);
    byte sk_bytes[32];
    blst_lendian_from_scalar(sk_bytes, &fee_payer.sk.sk);

    char* hex = nullptr;
    assert(zkapp_public_key_from_private(sk_bytes, sizeof(sk_bytes), &hex) == OK);
    assert(std::string(hex) == public_key_to_hex(fee_payer.pk));
    zkapp_string_free(hex);

    auto tx = Transaction::begin(init_settings(), fee_payer.pk);
    tx->create_signed(fee_payer.pk);
    ZkappCommand cmd = tx->build_command().unwrap();
    TransactionCommitments c = transaction_commitments(cmd).unwrap();
    std::string json = cmd.to_json_string();

    char* out = nullptr;
    int rc = zkapp_sign_json_transaction(json.c_str(), sk_bytes, sizeof(sk_bytes), nullptr, &out);
    assert(rc == OK);
    ZkappCommand done = ZkappCommand::from_json_string(out).unwrap();
    zkapp_string_free(out);

    assert(verify_field_signature(
        fee_payer.pk, done.fee_payer.authorization, c.full_commitment, DEFAULT_SIGNATURE_TAG));
    assert(verify_field_signature(
        fee_payer.pk, *done.account_updates[0]->authorization.signature,
        c.full_commitment, DEFAULT_SIGNATURE_TAG));

    out = nullptr;
    assert(zkapp_sign_json_transaction(nullptr, sk_bytes, 32, nullptr, &out) == NULL_PARAMETER);
    assert(zkapp_sign_json_transaction("{", sk_bytes, 32, nullptr, &out) == JSON_PARSE_ERR);
    assert(out == nullptr);
    assert(zkapp_public_key_from_private(sk_bytes, 16, &hex) == INVALID_PRIVATE_KEY);
    assert(std::string(zkapp_code_to_string(MISSING_PRIVATE_KEY)) == "missing private key");

    printf("C BINDINGS VALIDATED. \n");
    printf("\n");
}

void main_signing() {
    printf("=====================================\n");
    printf("============== SIGNING ==============\n");
    printf("=====================================\n\n");

    test_add_missing_signatures();
    test_missing_private_key();
    test_dummy_never_signed();
    test_sign_json_two_parties();
    test_c_bindings();

    printf("=====================================\n");
}
