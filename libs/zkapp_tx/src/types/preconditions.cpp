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

#include "preconditions.h"
#include "hashing.h"

static EpochData epoch_ignore_all() {
    EpochData e;
    e.ledger.hash = ignore(new_scalar());
    e.ledger.total_currency = ignore(uint64_range());
    e.seed = ignore(new_scalar());
    e.start_checkpoint = ignore(new_scalar());
    e.lock_checkpoint = ignore(new_scalar());
    e.epoch_length = ignore(uint32_range());
    return e;
}

NetworkPrecondition NetworkPrecondition::ignore_all() {
    NetworkPrecondition n;
    n.snarked_ledger_hash = ignore(new_scalar());
    n.timestamp = ignore(uint64_range());
    n.blockchain_length = ignore(uint32_range());
    n.min_window_density = ignore(uint32_range());
    n.total_currency = ignore(uint64_range());
    n.global_slot_since_hard_fork = ignore(uint32_range());
    n.global_slot_since_genesis = ignore(uint32_range());
    n.staking_epoch_data = epoch_ignore_all();
    n.next_epoch_data = epoch_ignore_all();
    return n;
}

AccountPrecondition AccountPrecondition::ignore_all() {
    AccountPrecondition a;
    a.balance = ignore(uint64_range());
    a.nonce = ignore(uint32_range());
    a.receipt_chain_hash = ignore(new_scalar());
    a.delegate = ignore(public_key_empty());
    for (auto &s : a.state) s = ignore(new_scalar());
    a.sequence_state = ignore(hash_with_prefix(PREFIX_SEQUENCE_STATE, {}));
    a.proved_state = ignore(false);
    a.is_new = ignore(false);
    return a;
}

Preconditions Preconditions::ignore_all() {
    return Preconditions{
        NetworkPrecondition::ignore_all(),
        AccountPrecondition::ignore_all()
    };
}
