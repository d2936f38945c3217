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
#include "field.h"
#include "int.h"
#include "key_sig.h"
#include <array>
#include <cstdint>

constexpr size_t ZKAPP_STATE_LENGTH = 8;

// Either a value that must hold, or nothing to check.
template <typename T>
struct OrIgnore {
    bool is_some = false;
    T value{};
};

template <typename T>
struct ClosedInterval {
    T lower{};
    T upper{};
};

template <typename V, typename P, typename T>
void visit(V& v, P& p, ClosedInterval<T>*) {
    v.field("lower", p.lower);
    v.field("upper", p.upper);
}

template <typename T>
OrIgnore<T> ignore(const T &dummy) {
    return OrIgnore<T>{false, dummy};
}

inline ClosedInterval<uint32_t> uint32_range() { return {0, UINT32_MAXINT}; }
inline ClosedInterval<uint64_t> uint64_range() { return {0, UINT64_MAXINT}; }

// lower == upper == value
template <typename T>
void assert_equals(OrIgnore<ClosedInterval<T>> &property, const T &value) {
    property.is_some = true;
    property.value.lower = value;
    property.value.upper = value;
}

template <typename T>
void assert_equals(OrIgnore<T> &property, const T &value) {
    property.is_some = true;
    property.value = value;
}

template <typename T>
void assert_between(
    OrIgnore<ClosedInterval<T>> &property,
    const T &lower,
    const T &upper
) {
    property.is_some = true;
    property.value.lower = lower;
    property.value.upper = upper;
}

struct EpochLedger {
    OrIgnore<Field> hash;
    OrIgnore<ClosedInterval<uint64_t>> total_currency;
};

template <typename V, typename P>
void visit(V& v, P& p, EpochLedger*) {
    v.field("hash", p.hash);
    v.field("totalCurrency", p.total_currency);
}

struct EpochData {
    EpochLedger ledger;
    OrIgnore<Field> seed;
    OrIgnore<Field> start_checkpoint;
    OrIgnore<Field> lock_checkpoint;
    OrIgnore<ClosedInterval<uint32_t>> epoch_length;
};

template <typename V, typename P>
void visit(V& v, P& p, EpochData*) {
    v.field("ledger", p.ledger);
    v.field("seed", p.seed);
    v.field("startCheckpoint", p.start_checkpoint);
    v.field("lockCheckpoint", p.lock_checkpoint);
    v.field("epochLength", p.epoch_length);
}

struct NetworkPrecondition {
    OrIgnore<Field> snarked_ledger_hash;
    OrIgnore<ClosedInterval<uint64_t>> timestamp;
    OrIgnore<ClosedInterval<uint32_t>> blockchain_length;
    OrIgnore<ClosedInterval<uint32_t>> min_window_density;
    OrIgnore<ClosedInterval<uint64_t>> total_currency;
    OrIgnore<ClosedInterval<uint32_t>> global_slot_since_hard_fork;
    OrIgnore<ClosedInterval<uint32_t>> global_slot_since_genesis;
    EpochData staking_epoch_data;
    EpochData next_epoch_data;

    static NetworkPrecondition ignore_all();
};

template <typename V, typename P>
void visit(V& v, P& p, NetworkPrecondition*) {
    v.field("snarkedLedgerHash", p.snarked_ledger_hash);
    v.field("timestamp", p.timestamp);
    v.field("blockchainLength", p.blockchain_length);
    v.field("minWindowDensity", p.min_window_density);
    v.field("totalCurrency", p.total_currency);
    v.field("globalSlotSinceHardFork", p.global_slot_since_hard_fork);
    v.field("globalSlotSinceGenesis", p.global_slot_since_genesis);
    v.field("stakingEpochData", p.staking_epoch_data);
    v.field("nextEpochData", p.next_epoch_data);
}

struct AccountPrecondition {
    OrIgnore<ClosedInterval<uint64_t>> balance;
    OrIgnore<ClosedInterval<uint32_t>> nonce;
    OrIgnore<Field> receipt_chain_hash;
    OrIgnore<PublicKey> delegate;
    std::array<OrIgnore<Field>, ZKAPP_STATE_LENGTH> state;
    OrIgnore<Field> sequence_state;
    OrIgnore<bool> proved_state;
    OrIgnore<bool> is_new;

    static AccountPrecondition ignore_all();
};

template <typename V, typename P>
void visit(V& v, P& p, AccountPrecondition*) {
    v.field("balance", p.balance);
    v.field("nonce", p.nonce);
    v.field("receiptChainHash", p.receipt_chain_hash);
    v.field("delegate", p.delegate);
    v.field("state", p.state);
    v.field("sequenceState", p.sequence_state);
    v.field("provedState", p.proved_state);
    v.field("isNew", p.is_new);
}

struct Preconditions {
    NetworkPrecondition network;
    AccountPrecondition account;

    static Preconditions ignore_all();
};

template <typename V, typename P>
void visit(V& v, P& p, Preconditions*) {
    v.field("network", p.network);
    v.field("account", p.account);
}
