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
#include "account_update.h"
#include "call_forest.h"
#include "codes.h"
#include "helpers.h"
#include "json_codec.h"
#include "permissions.h"
#include "token.h"

static AccountUpdate_ptr busy_update() {
    auto u = AccountUpdate::default_account_update(test_keys(100).pk);
    u->label = "busy";

    Update &up = u->update();
    set_value(up.app_state[0], new_scalar(11));
    set_value(up.app_state[7], neg_scalar(new_scalar(1)));
    set_value(up.delegate, test_keys(101).pk);
    set_value(up.verification_key, StringWithHash{"vk-data", new_scalar(77)});
    set_value(up.permissions, Permissions::default_permissions());
    set_value(up.zkapp_uri, zkapp_uri("https://example.org/zkapp"));
    set_value(up.token_symbol, token_symbol("MINA").unwrap());
    set_value(up.timing, Timing{100, 2, 30, 4, 5});

    u->body.events.push({new_scalar(1), new_scalar(2)});
    u->body.events.push({});
    u->body.sequence_events.push({new_scalar(3)});
    u->balance_sub_in_place(250);
    u->body.call_data = new_scalar(909);

    auto &account = u->body.preconditions.account;
    assert_between(account.balance, uint64_t(10), uint64_t(1000));
    assert_equals(account.nonce, uint32_t(3));
    assert_equals(account.proved_state, true);
    assert_equals(account.state[2], new_scalar(8));
    assert_equals(u->body.preconditions.network.blockchain_length, uint32_t(500));

    u->set_lazy_signature();
    return u;
}

void test_fields_roundtrip() {
    auto u = busy_update();
    u->is_delegate_call = true;

    std::vector<Field> fields = u->to_fields();
    assert(fields.size() == AccountUpdate::size_in_fields());
    AccountUpdateAux aux = u->to_auxiliary();

    auto back = AccountUpdate::from_fields(fields, aux);
    assert(back.is_ok());
    AccountUpdate_ptr v = back.unwrap();

    assert(write_json(v->to_json()) == write_json(u->to_json()));
    assert(v->hash() == u->hash());
    assert(v->id == u->id);
    assert(v->label == "busy");
    assert(v->is_delegate_call);
    assert(v->has_lazy_signature());
    assert(v->body.events.data.size() == 2);

    std::vector<Field> short_fields(fields.begin(), fields.end() - 1);
    assert(AccountUpdate::from_fields(short_fields, aux).unwrap_err() == FIELD_COUNT_ERR);

    std::vector<Field> long_fields = fields;
    long_fields.push_back(new_scalar(0));
    assert(AccountUpdate::from_fields(long_fields, aux).unwrap_err() == FIELD_COUNT_ERR);

    // editState is the first permission, its constant flag comes first
    const Update &up = u->update();
    size_t edit_state = size_in_fields(u->body.public_key) + size_in_fields(u->body.token_id)
        + size_in_fields(up.app_state) + size_in_fields(up.delegate)
        + size_in_fields(up.verification_key) + 1;
    assert(fields[edit_state] == new_scalar(0));
    std::vector<Field> bad_permission = fields;
    bad_permission[edit_state] = new_scalar(1);
    assert(AccountUpdate::from_fields(bad_permission, aux).unwrap_err() == INVALID_PERMISSION);

    // strings are verificationKey, zkappUri, tokenSymbol
    AccountUpdateAux other_uri = aux;
    other_uri.body.strings[1] = "https://example.org/other";
    assert(AccountUpdate::from_fields(fields, other_uri).unwrap_err() == STRING_HASH_MISMATCH);

    AccountUpdateAux other_symbol = aux;
    other_symbol.body.strings[2] = "BTC";
    assert(AccountUpdate::from_fields(fields, other_symbol).unwrap_err() == STRING_HASH_MISMATCH);

    other_symbol.body.strings[2] = "ABCDEFGHIJ";
    assert(AccountUpdate::from_fields(fields, other_symbol).unwrap_err() == TOKEN_SYMBOL_TOO_LONG);

    printf("FIELDS ROUNDTRIP VALIDATED. \n");
    printf("\n");
}

void test_hash_ignores_non_body() {
    auto u = busy_update();
    Field h = u->hash();

    u->label = "renamed";
    u->body.call_depth = 3;
    u->set_signature(DUMMY_SIGNATURE);
    assert(u->hash() == h);

    u->body.increment_nonce = true;
    assert(u->hash() != h);

    printf("HASH INPUTS VALIDATED. \n");
    printf("\n");
}

void test_token_operations() {
    PublicKey owner_pk = test_keys(110).pk;
    PublicKey alice = test_keys(111).pk;
    PublicKey bob = test_keys(112).pk;

    auto owner = AccountUpdate::default_account_update(owner_pk);
    AccountUpdateToken token = owner->token();
    assert(token.id == Token(owner_pk).id);
    assert(token.parent_token_id == default_token_id());
    assert(token.id != default_token_id());

    auto minted = token.mint(alice, 100);
    assert(minted->token_id() == token.id);
    assert(minted->body.balance_change == Int64::from_signed(100));
    assert(minted->parent.lock() == owner);
    assert(minted->children.calls_type == CallsType::WITNESS);
    assert(!minted->has_any_authorization());

    auto burned = token.burn(bob, 30);
    assert(burned->body.balance_change == Int64::from_signed(-30));
    assert(burned->body.use_full_commitment);
    assert(burned->has_lazy_signature());
    assert(burned->body.authorization_kind.is_signed);

    auto received = token.send(alice, bob, 5);
    assert(received->body.balance_change == Int64::from_signed(5));
    assert(owner->children.account_updates.size() == 4);
    auto sender = owner->children.account_updates[2];
    assert(sender->public_key() == alice);
    assert(sender->body.balance_change == Int64::from_signed(-5));
    assert(sender->has_lazy_signature());

    printf("TOKEN OPERATIONS VALIDATED. \n");
    printf("\n");
}

void test_send() {
    auto from = AccountUpdate::default_account_update(test_keys(120).pk);
    from->send(test_keys(121).pk, 10);
    assert(from->body.balance_change == Int64::from_signed(-10));
    assert(from->children.account_updates.size() == 1);
    assert(from->children.account_updates[0]->body.balance_change == Int64::from_signed(10));

    auto to = AccountUpdate::default_account_update(test_keys(122).pk);
    from->send(to, 15);
    assert(from->body.balance_change == Int64::from_signed(-25));
    assert(to->body.balance_change == Int64::from_signed(15));

    auto other_token = AccountUpdate::default_account_update(
        test_keys(123).pk, Token(test_keys(124).pk).id);
    bool threw = false;
    try {
        from->send(other_token, 1);
    } catch (const std::runtime_error &) {
        threw = true;
    }
    assert(threw);
    assert(from->body.balance_change == Int64::from_signed(-25));

    printf("SEND VALIDATED. \n");
    printf("\n");
}

void test_authorization_transitions() {
    auto u = AccountUpdate::default_account_update(test_keys(130).pk);
    assert(!u->has_any_authorization());

    u->set_lazy_signature();
    assert(u->has_lazy_signature());
    assert(u->body.authorization_kind.is_signed);

    u->set_signature("abcd");
    assert(!u->has_lazy_signature());
    assert(u->authorization.signature == std::optional<std::string>("abcd"));

    LazyProof intent;
    intent.method_name = "deposit";
    u->set_lazy_proof(intent);
    assert(u->has_lazy_proof());
    assert(!u->authorization.signature);
    assert(u->body.authorization_kind.is_proved);
    assert(!u->body.authorization_kind.is_signed);

    u->set_lazy_none();
    assert(std::holds_alternative<LazyNone>(u->lazy_authorization));
    assert(!u->body.authorization_kind.is_proved);

    printf("AUTHORIZATION TRANSITIONS VALIDATED. \n");
    printf("\n");
}

void test_permissions() {
    const char* names[] = {"None", "Either", "Proof", "Signature", "Impossible"};
    for (const char* name : names) {
        auto p = permission_from_string(name);
        assert(p.is_ok());
        assert(permission_to_string(p.unwrap()).unwrap() == name);
    }
    assert(permission_from_string("Sometimes").unwrap_err() == INVALID_PERMISSION);
    assert(permission_from_string("Proof").unwrap() == AuthRequired::proof());
    assert(permission_to_string(AuthRequired{true, false, false}).is_err());
    assert(AuthRequired{} == AuthRequired::none());

    Permissions d = Permissions::default_permissions();
    assert(d.edit_state == AuthRequired::proof());
    assert(d.receive == AuthRequired::none());
    assert(d.set_delegate == AuthRequired::signature());
    assert(Permissions::dummy().send == AuthRequired::none());

    printf("PERMISSIONS VALIDATED. \n");
    printf("\n");
}

void test_int64() {
    Int64 x = Int64::zero();
    x = x.sub(5);
    assert(x.is_negative());
    assert(x.to_string() == "-5");
    x = x.add(5);
    assert(x.is_zero());
    assert(x.sgn == Sign::POSITIVE);
    assert(Int64::from_signed(-7).neg() == Int64::from_signed(7));

    bool threw = false;
    try {
        Int64{UINT64_MAXINT, Sign::POSITIVE}.add(1);
    } catch (const std::overflow_error &) {
        threw = true;
    }
    assert(threw);

    assert(token_symbol("TOOLONG").unwrap_err() == TOKEN_SYMBOL_TOO_LONG);

    printf("INT64 VALIDATED. \n");
    printf("\n");
}

void test_pretty() {
    auto plain = AccountUpdate::default_account_update(test_keys(140).pk);
    Json::Value p = plain->to_pretty();
    assert(p.isObject());
    assert(p.size() == 1);
    assert(p["publicKey"].asString().substr(0, 2) == "..");

    auto u = busy_update();
    u->body.call_depth = 1;
    Json::Value q = u->to_pretty();
    assert(q["label"].asString() == "busy");
    assert(q["authorizationKind"].asString() == "Signature");
    assert(q.isMember("balanceChange"));
    assert(q.isMember("callDepth"));
    assert(q["update"]["permissions"].isString());
    assert(!q.isMember("tokenId"));
    assert(!q.isMember("callData"));
    assert(!q.isMember("isDelegateCall"));

    printf("PRETTY VIEW VALIDATED. \n");
    printf("\n");
}

void main_account_update() {
    printf("=====================================\n");
    printf("=========== ACCOUNT UPDATE ==========\n");
    printf("=====================================\n\n");

    test_fields_roundtrip();
    test_hash_ignores_non_body();
    test_token_operations();
    test_send();
    test_authorization_transitions();
    test_permissions();
    test_int64();
    test_pretty();

    printf("=====================================\n");
}
