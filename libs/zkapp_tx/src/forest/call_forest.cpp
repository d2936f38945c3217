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

#include "call_forest.h"
#include "hashing.h"
#include "provable.h"
#include "token.h"

std::vector<AccountUpdate_ptr> to_flat_list(
    const std::vector<AccountUpdate_ptr> &forest,
    int depth
) {
    std::vector<AccountUpdate_ptr> out;
    for (const auto &update : forest) {
        if (update->is_dummy()) continue;
        update->body.call_depth = depth;
        out.push_back(update);
        auto below = to_flat_list(update->children.account_updates, depth + 1);
        out.insert(out.end(), below.begin(), below.end());
    }
    return out;
}

Field empty_hash() {
    return new_scalar(0);
}

static Field fold_list(const std::vector<AccountUpdate_ptr> &updates) {
    Field stack_hash = empty_hash();
    for (auto it = updates.rbegin(); it != updates.rend(); ++it) {
        const AccountUpdate &update = **it;
        Field calls = hash_children(update);
        Field node_hash = hash_with_prefix(
            PREFIX_ACCOUNT_UPDATE_NODE, {update.hash(), calls});
        Field new_hash = hash_with_prefix(
            PREFIX_ACCOUNT_UPDATE_CONS, {node_hash, stack_hash});
        stack_hash = field_select(update.is_dummy(), stack_hash, new_hash);
    }
    return stack_hash;
}

Field hash_children_base(const AccountUpdate &update) {
    return fold_list(update.children.account_updates);
}

Field hash_children(const AccountUpdate &update) {
    const Children &children = update.children;
    if (children.calls_type == CallsType::WITNESS) {
        return witness([&]() { return hash_children_base(update); });
    }
    Field calls = hash_children_base(update);
    if (children.calls_type == CallsType::EQUALS) {
        assert_field_equals(calls, children.calls_value, "hash_children");
    }
    return calls;
}

Field hash_forest(const std::vector<AccountUpdate_ptr> &forest) {
    return fold_list(forest);
}

CallerContext CallerContext::root() {
    return CallerContext{default_token_id(), default_token_id()};
}

void add_callers(
    const std::vector<AccountUpdate_ptr> &updates,
    const CallerContext &context
) {
    for (const auto &update : updates) {
        bool delegate = update->is_delegate_call;
        Field caller = field_select(delegate, context.caller, context.self);
        Field self = field_select(
            delegate,
            context.self,
            Token::get_id(update->body.public_key, update->body.token_id));
        update->body.caller = caller;
        add_callers(update->children.account_updates, CallerContext{self, caller});
    }
}

CallerContext compute_caller_context(const AccountUpdate &update) {
    std::vector<AccountUpdate_ptr> ancestors;
    for (auto p = update.parent.lock(); p; p = p->parent.lock()) {
        ancestors.push_back(p);
    }

    CallerContext context = CallerContext::root();
    for (auto it = ancestors.rbegin(); it != ancestors.rend(); ++it) {
        const AccountUpdate &a = **it;
        if (!a.is_delegate_call) {
            context.caller = context.self;
            context.self = Token::get_id(a.body.public_key, a.body.token_id);
        }
    }
    return context;
}

int compute_call_depth(const AccountUpdate &update) {
    int depth = 0;
    for (auto p = update.parent.lock(); p; p = p->parent.lock()) depth++;
    return depth;
}

void for_each(
    const std::vector<AccountUpdate_ptr> &updates,
    const UpdateCallback &callback
) {
    for (const auto &update : updates) {
        callback(update);
        for_each(update->children.account_updates, callback);
    }
}

void for_each_predecessor(
    const std::vector<AccountUpdate_ptr> &updates,
    const AccountUpdate &target,
    const UpdateCallback &callback
) {
    bool is_predecessor = true;
    for_each(updates, [&](const AccountUpdate_ptr &other) {
        if (other->id == target.id) is_predecessor = false;
        if (is_predecessor) callback(other);
    });
}
