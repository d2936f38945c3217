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
#include "field.h"
#include <functional>
#include <vector>

/*
 *  Algorithms over a call forest, the ordered list of top-level
 *  account updates each carrying its own children.
 *
 *  Children hash of a node, children c_1..c_n:
 *
 *      stack_n+1 = empty_hash()
 *      node_i    = H(prefix_node, [hash(c_i), hash_children(c_i)])
 *      stack_i   = is_dummy(c_i) ? stack_i+1 : H(prefix_cons, [node_i, stack_i+1])
 *
 *  folded from c_n down to c_1, the result is stack_1.
 */

// depth-first pre-order, sets call_depth and drops dummies with their subtrees
std::vector<AccountUpdate_ptr> to_flat_list(
    const std::vector<AccountUpdate_ptr> &forest,
    int depth = 0
);

Field empty_hash();

Field hash_children_base(const AccountUpdate &update);
Field hash_children(const AccountUpdate &update);
// the same fold over a list of roots
Field hash_forest(const std::vector<AccountUpdate_ptr> &forest);

struct CallerContext {
    Field self;
    Field caller;

    static CallerContext root();
};

void add_callers(
    const std::vector<AccountUpdate_ptr> &updates,
    const CallerContext &context = CallerContext::root()
);

// context of update from its ancestor chain alone
CallerContext compute_caller_context(const AccountUpdate &update);
int compute_call_depth(const AccountUpdate &update);

using UpdateCallback = std::function<void(const AccountUpdate_ptr&)>;

void for_each(
    const std::vector<AccountUpdate_ptr> &updates,
    const UpdateCallback &callback
);

// every node visited strictly before target, matched by id
void for_each_predecessor(
    const std::vector<AccountUpdate_ptr> &updates,
    const AccountUpdate &target,
    const UpdateCallback &callback
);
