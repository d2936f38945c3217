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
#include "hashing.h"
#include "helpers.h"
#include "provable.h"
#include "token.h"

void test_empty_forest() {
    std::vector<AccountUpdate_ptr> forest;
    assert(to_flat_list(forest).empty());
    assert(hash_forest(forest) == empty_hash());

    auto lone = AccountUpdate::default_account_update(test_keys(10).pk);
    assert(hash_children_base(*lone) == empty_hash());
    assert(hash_children(*lone) == empty_hash());

    printf("EMPTY FOREST VALIDATED. \n");
    printf("\n");
}

void test_single_child_hash() {
    auto parent = AccountUpdate::default_account_update(test_keys(10).pk);
    auto child = AccountUpdate::default_account_update(test_keys(11).pk);
    parent->approve(child);

    Field node = hash_with_prefix(PREFIX_ACCOUNT_UPDATE_NODE, {child->hash(), empty_hash()});
    Field expected = hash_with_prefix(PREFIX_ACCOUNT_UPDATE_CONS, {node, empty_hash()});
    assert(hash_children_base(*parent) == expected);
    assert(hash_children(*parent) == expected);

    // a forest of one root hashes the same way
    Field root_node = hash_with_prefix(
        PREFIX_ACCOUNT_UPDATE_NODE, {parent->hash(), expected});
    assert(hash_forest({parent}) ==
           hash_with_prefix(PREFIX_ACCOUNT_UPDATE_CONS, {root_node, empty_hash()}));

    printf("SINGLE CHILD HASH VALIDATED. \n");
    printf("\n");
}

void test_dummy_skipped_in_hash() {
    PublicKey a = test_keys(12).pk;
    PublicKey b = test_keys(13).pk;

    auto with_dummy = AccountUpdate::default_account_update(test_keys(10).pk);
    create_child_account_update(with_dummy, a);
    make_child_account_update(with_dummy, AccountUpdate::dummy());
    create_child_account_update(with_dummy, b);
    assert(with_dummy->children.account_updates.size() == 3);

    auto without = AccountUpdate::default_account_update(test_keys(10).pk);
    create_child_account_update(without, a);
    create_child_account_update(without, b);

    assert(hash_children_base(*with_dummy) == hash_children_base(*without));
    assert(with_dummy->hash() == without->hash());

    // ordering matters
    auto swapped = AccountUpdate::default_account_update(test_keys(10).pk);
    create_child_account_update(swapped, b);
    create_child_account_update(swapped, a);
    assert(hash_children_base(*swapped) != hash_children_base(*without));

    printf("DUMMIES SKIPPED. \n");
    printf("\n");
}

void test_flatten() {
    auto r1 = AccountUpdate::default_account_update(test_keys(20).pk);
    auto a = create_child_account_update(r1, test_keys(21).pk);
    auto b = create_child_account_update(r1, test_keys(22).pk);
    auto c = create_child_account_update(b, test_keys(23).pk);
    auto d = AccountUpdate::dummy();
    auto r2 = AccountUpdate::default_account_update(test_keys(24).pk);

    // stale depths get overwritten
    for (auto &u : {r1, a, b, c, r2}) u->body.call_depth = 7;

    auto flat = to_flat_list({r1, d, r2});
    assert(flat.size() == 5);

    const uint64_t ids[] = {r1->id, a->id, b->id, c->id, r2->id};
    const int depths[] = {0, 1, 1, 2, 0};
    for (size_t i = 0; i < flat.size(); i++) {
        assert(flat[i]->id == ids[i]);
        assert(flat[i]->body.call_depth == depths[i]);
    }
    assert(compute_call_depth(*c) == 2);
    assert(compute_call_depth(*r1) == 0);

    printf("FLATTEN VALIDATED. \n");
    printf("\n");
}

void test_no_children_violation() {
    auto parent = AccountUpdate::default_account_update(test_keys(30).pk);
    witness_children(parent, AccountUpdatesLayout::no_children());
    assert(parent->children.calls_type == CallsType::EQUALS);

    // fine while the promise holds
    run_checked([&]() { hash_children(*parent); });

    parent->approve(AccountUpdate::default_account_update(test_keys(31).pk));

    // outside a circuit nothing is checked
    hash_children(*parent);

    bool threw = false;
    try {
        run_checked([&]() { hash_children(*parent); });
    } catch (const std::runtime_error &) {
        threw = true;
    }
    assert(threw);
    assert(!in_checked_computation());

    printf("NO CHILDREN VIOLATION CAUGHT. \n");
    printf("\n");
}

void test_witness_children_layouts() {
    auto parent = AccountUpdate::default_account_update(test_keys(32).pk);
    auto child = create_child_account_update(parent, test_keys(33).pk);
    Field before = hash_children_base(*parent);

    // missing static children are filled with dummies
    witness_children(parent, AccountUpdatesLayout::static_children(3));
    assert(parent->children.account_updates.size() == 3);
    assert(parent->children.account_updates[0]->id == child->id);
    assert(parent->children.account_updates[1]->is_dummy());
    assert(parent->children.account_updates[2]->is_dummy());
    assert(child->children.calls_type == CallsType::EQUALS);
    assert(hash_children_base(*parent) == before);

    auto any = AccountUpdate::default_account_update(test_keys(34).pk);
    create_child_account_update(any, test_keys(35).pk);
    witness_children(any, AccountUpdatesLayout::any_children());
    assert(any->children.calls_type == CallsType::WITNESS);

    Field outside = hash_children_base(*any);
    run_checked([&]() {
        assert(in_checked_computation());
        Field inside = hash_children(*any);
        assert(inside == outside);
        witness([&]() {
            assert(!in_checked_computation());
            return 0;
        });
        assert(in_checked_computation());
    });

    auto delegate = AccountUpdate::default_account_update(test_keys(36).pk);
    delegate->is_delegate_call = true;
    bool threw = false;
    try {
        witness_children(delegate, AccountUpdatesLayout::no_delegation());
    } catch (const std::runtime_error &) {
        threw = true;
    }
    assert(threw);

    printf("LAYOUTS VALIDATED. \n");
    printf("\n");
}

void test_callers() {
    auto r = AccountUpdate::default_account_update(test_keys(40).pk);
    auto c = create_child_account_update(r, test_keys(41).pk);
    auto g = create_child_account_update(c, test_keys(42).pk);
    g->is_delegate_call = true;

    add_callers({r});

    Field id_r = Token::get_id(r->public_key(), r->token_id());
    assert(r->body.caller == default_token_id());
    assert(c->body.caller == id_r);
    // a delegate call inherits its parent's caller
    assert(g->body.caller == id_r);

    CallerContext c_ctx = compute_caller_context(*c);
    assert(c_ctx.self == id_r);
    assert(c_ctx.caller == default_token_id());
    assert(c->body.caller == c_ctx.self);

    CallerContext g_ctx = compute_caller_context(*g);
    assert(g_ctx.self == Token::get_id(c->public_key(), c->token_id()));
    assert(g->body.caller == g_ctx.caller);

    printf("CALLERS VALIDATED. \n");
    printf("\n");
}

void test_for_each_predecessor() {
    auto r1 = AccountUpdate::default_account_update(test_keys(50).pk);
    auto a = create_child_account_update(r1, test_keys(51).pk);
    auto b = create_child_account_update(r1, test_keys(52).pk);
    auto r2 = AccountUpdate::default_account_update(test_keys(53).pk);

    std::vector<uint64_t> seen;
    for_each_predecessor({r1, r2}, *b, [&](const AccountUpdate_ptr &u) {
        seen.push_back(u->id);
    });
    assert(seen.size() == 2);
    assert(seen[0] == r1->id);
    assert(seen[1] == a->id);

    seen.clear();
    for_each({r1, r2}, [&](const AccountUpdate_ptr &u) { seen.push_back(u->id); });
    assert(seen.size() == 4);
    assert(seen[3] == r2->id);

    printf("PREDECESSORS VALIDATED. \n");
    printf("\n");
}

void test_unlink_and_clone() {
    auto parent = AccountUpdate::default_account_update(test_keys(60).pk);
    auto d1 = AccountUpdate::dummy();
    auto d2 = AccountUpdate::dummy();
    make_child_account_update(parent, d1);
    make_child_account_update(parent, d2);

    // structurally equal, removed by identity
    AccountUpdate::unlink(d2);
    assert(parent->children.account_updates.size() == 1);
    assert(parent->children.account_updates[0]->id == d1->id);
    assert(d2->parent.expired());

    // not attached anywhere: nothing happens
    AccountUpdate::unlink(d2);
    assert(parent->children.account_updates.size() == 1);

    // moving a child to a new parent takes it out of the old one
    auto other = AccountUpdate::default_account_update(test_keys(61).pk);
    make_child_account_update(other, d1);
    assert(parent->children.account_updates.empty());
    assert(other->children.account_updates.size() == 1);

    auto child = create_child_account_update(parent, test_keys(62).pk);
    auto copy = parent->clone();
    assert(copy->id == parent->id);
    auto copy_child = copy->children.account_updates[0];
    assert(copy_child->id == child->id);
    assert(copy_child.get() != child.get());
    assert(copy_child->parent.lock() == copy);

    copy_child->balance_add_in_place(5);
    assert(child->body.balance_change.is_zero());
    assert(copy_child->body.balance_change.magnitude == 5);

    printf("UNLINK & CLONE VALIDATED. \n");
    printf("\n");
}

void main_call_forest() {
    printf("=====================================\n");
    printf("============ CALL FOREST ============\n");
    printf("=====================================\n\n");

    test_empty_forest();
    test_single_child_hash();
    test_dummy_skipped_in_hash();
    test_flatten();
    test_no_children_violation();
    test_witness_children_layouts();
    test_callers();
    test_for_each_predecessor();
    test_unlink_and_clone();

    printf("=====================================\n");
}
