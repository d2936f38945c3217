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
#include <stdexcept>
#include "codes.h"
#include "helpers.h"
#include "token.h"
#include "transaction.h"

void test_sibling_nonces() {
    key_pair fee_payer = test_keys(200);
    PublicKey alice = test_keys(201).pk;

    auto tx = Transaction::begin(test_settings(5), fee_payer.pk);
    auto u1 = tx->create_signed(alice);
    auto u2 = tx->create_signed(alice);

    auto &n1 = u1->body.preconditions.account.nonce;
    auto &n2 = u2->body.preconditions.account.nonce;
    assert(n1.is_some && n1.value.lower == 5 && n1.value.upper == 5);
    assert(n2.is_some && n2.value.lower == 6 && n2.value.upper == 6);
    assert(u1->body.increment_nonce);
    assert(u2->body.increment_nonce);
    assert(!u1->body.use_full_commitment);
    assert(u1->has_lazy_signature());

    assert(tx->get_nonce(*u1) == 5);
    assert(tx->get_nonce(*u2) == 6);
    assert(tx->fee_payer_nonce() == 5);

    printf("SIBLING NONCES VALIDATED. \n");
    printf("\n");
}

void test_fee_payer_nonce() {
    key_pair fee_payer = test_keys(202);
    auto tx = Transaction::begin(test_settings(9), fee_payer.pk);

    auto u = tx->create_signed(fee_payer.pk);
    SigningInfo info = tx->get_signing_info(*u);
    assert(info.is_same_as_fee_payer);
    assert(info.nonce == 10);
    assert(u->body.use_full_commitment);
    assert(!u->body.increment_nonce);
    assert(!u->body.preconditions.account.nonce.is_some);

    // u does not increment, the next one sees the same nonce
    auto again = tx->create_signed(fee_payer.pk);
    assert(tx->get_nonce(*again) == 10);

    // another token is another account
    Field custom = Token(test_keys(203).pk).id;
    auto on_token = tx->create_signed(fee_payer.pk, custom);
    SigningInfo token_info = tx->get_signing_info(*on_token);
    assert(!token_info.is_same_as_fee_payer);
    assert(token_info.nonce == 9);
    assert(on_token->body.increment_nonce);

    printf("FEE PAYER NONCE VALIDATED. \n");
    printf("\n");
}

void test_call_scopes() {
    auto tx = Transaction::begin(nullptr, test_keys(210).pk);
    auto self = tx->create(test_keys(211).pk);
    assert(!tx->in_call());

    {
        auto scope = tx->enter_call(self);
        auto inner = tx->create(test_keys(212).pk);
        assert(inner->parent.lock() == self);
        {
            auto nested = tx->enter_call(inner);
            auto deeper = tx->create(test_keys(213).pk);
            assert(deeper->parent.lock() == inner);
            assert(deeper->body.call_depth == 2);
        }
        assert(tx->current_call() == self);
    }
    assert(!tx->in_call());
    assert(tx->account_updates.size() == 1);

    bool threw = false;
    try {
        auto scope = tx->enter_call(self);
        throw std::runtime_error("method failed");
    } catch (const std::runtime_error &) {
        threw = true;
    }
    assert(threw);
    assert(!tx->in_call());

    auto top = tx->create(test_keys(214).pk);
    assert(top->parent.expired());
    assert(tx->account_updates.size() == 2);

    printf("CALL SCOPES VALIDATED. \n");
    printf("\n");
}

void test_fund_and_attach() {
    Settings_ptr settings = init_settings(DEFAULT_SIGNATURE_TAG, 1000);
    key_pair fee_payer = test_keys(220);
    auto tx = Transaction::begin(settings, fee_payer.pk);

    auto funding = tx->fund_new_account(fee_payer.pk, 3);
    assert(funding->body.balance_change == Int64::from_signed(-3000));
    assert(funding->has_lazy_signature());

    bool threw = false;
    try {
        tx->fund_new_account(fee_payer.pk, UINT64_MAXINT);
    } catch (const std::overflow_error &) {
        threw = true;
    }
    assert(threw);

    auto loose = AccountUpdate::default_account_update(test_keys(221).pk);
    tx->attach(loose);
    tx->attach(loose);
    assert(tx->account_updates.size() == 2);
    assert(tx->account_updates[1]->id == loose->id);

    printf("FUND & ATTACH VALIDATED. \n");
    printf("\n");
}

void test_build_command() {
    key_pair fee_payer = test_keys(230);
    auto tx = Transaction::begin(test_settings(4), fee_payer.pk);
    tx->fee = 100;
    tx->valid_until = 77;
    tx->memo = "hello";

    auto u = tx->create_signed(test_keys(231).pk);
    auto child = create_child_account_update(u, test_keys(232).pk);

    auto res = tx->build_command();
    assert(res.is_ok());
    ZkappCommand &cmd = res.unwrap();
    assert(cmd.fee_payer.body.public_key == fee_payer.pk);
    assert(cmd.fee_payer.body.nonce == 4);
    assert(cmd.fee_payer.body.fee == 100);
    assert(cmd.fee_payer.body.valid_until == std::optional<uint32_t>(77));
    assert(cmd.fee_payer.lazy_authorization.has_value());
    assert(cmd.memo == "hello");
    assert(cmd.account_updates.size() == 1);
    assert(child->body.caller == Token::get_id(u->public_key(), u->token_id()));

    tx->memo = std::string(33, 'x');
    assert(tx->build_command().unwrap_err() == MEMO_TOO_LONG);

    auto anonymous = Transaction::begin(nullptr);
    auto empty = anonymous->build_command();
    assert(empty.is_ok());
    assert(public_key_is_empty(empty.unwrap().fee_payer.body.public_key));
    assert(!empty.unwrap().fee_payer.lazy_authorization);

    printf("BUILD COMMAND VALIDATED. \n");
    printf("\n");
}

void main_nonce() {
    printf("=====================================\n");
    printf("======== TRANSACTION & NONCES =======\n");
    printf("=====================================\n\n");

    test_sibling_nonces();
    test_fee_payer_nonce();
    test_call_scopes();
    test_fund_and_attach();
    test_build_command();

    printf("=====================================\n");
}
