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
#include "permissions.h"
#include "preconditions.h"
#include "result.h"
#include <array>
#include <optional>
#include <string>
#include <vector>

constexpr size_t TOKEN_SYMBOL_MAX_LENGTH = 6;

// isSome == false keeps the on-chain value, value is still hashed
template <typename T>
struct SetOrKeep {
    bool is_some = false;
    T value{};
};

template <typename T>
SetOrKeep<T> keep(const T &dummy) {
    return SetOrKeep<T>{false, dummy};
}

template <typename T>
void set_value(SetOrKeep<T> &maybe_value, const T &value) {
    maybe_value.is_some = true;
    maybe_value.value = value;
}

// Only the hash goes into the field representation.
struct StringWithHash {
    std::string data;
    Field hash = new_scalar();
};

StringWithHash zkapp_uri(const std::string &uri);
Result<StringWithHash, int> token_symbol(const std::string &symbol);

struct Timing {
    uint64_t initial_minimum_balance = 0;
    uint32_t cliff_time = 0;
    uint64_t cliff_amount = 0;
    uint32_t vesting_period = 0;
    uint64_t vesting_increment = 0;
};

template <typename V, typename P>
void visit(V& v, P& p, Timing*) {
    v.field("initialMinimumBalance", p.initial_minimum_balance);
    v.field("cliffTime", p.cliff_time);
    v.field("cliffAmount", p.cliff_amount);
    v.field("vestingPeriod", p.vesting_period);
    v.field("vestingIncrement", p.vesting_increment);
}

struct Update {
    std::array<SetOrKeep<Field>, ZKAPP_STATE_LENGTH> app_state;
    SetOrKeep<PublicKey> delegate;
    SetOrKeep<StringWithHash> verification_key;
    SetOrKeep<Permissions> permissions;
    SetOrKeep<StringWithHash> zkapp_uri;
    SetOrKeep<StringWithHash> token_symbol;
    SetOrKeep<Timing> timing;
    SetOrKeep<Field> voting_for;

    static Update no_update();
};

// set zkappUri and tokenSymbol must carry the hash of their data
int check_strings(const Update &update);

template <typename V, typename P>
void visit(V& v, P& p, Update*) {
    v.field("appState", p.app_state);
    v.field("delegate", p.delegate);
    v.field("verificationKey", p.verification_key);
    v.field("permissions", p.permissions);
    v.field("zkappUri", p.zkapp_uri);
    v.field("tokenSymbol", p.token_symbol);
    v.field("timing", p.timing);
    v.field("votingFor", p.voting_for);
}

enum class EventsKind : uint8_t {
    EVENTS,
    SEQUENCE,
};

/*
 *  Append-only list of events with a running commitment.
 *
 *  empty      = H(prefix_empty, [])
 *  push(e)    = H(prefix_list, [hash, H(prefix_event, e)])
 */
struct Events {
    EventsKind kind = EventsKind::EVENTS;
    Field hash = new_scalar();
    std::vector<std::vector<Field>> data;

    static Events empty(EventsKind kind);
    void push(const std::vector<Field> &event);
    // recompute hash from data
    void rehash();
};

struct AuthorizationKind {
    bool is_signed = false;
    bool is_proved = false;
};

template <typename V, typename P>
void visit(V& v, P& p, AuthorizationKind*) {
    v.field("isSigned", p.is_signed);
    v.field("isProved", p.is_proved);
}

struct Body {
    PublicKey public_key;
    Field token_id;
    Update update;
    Int64 balance_change;
    Events events;
    Events sequence_events;
    Field caller;
    Field call_data;
    int call_depth = 0;
    Preconditions preconditions;
    bool use_full_commitment = false;
    bool increment_nonce = false;
    AuthorizationKind authorization_kind;

    // changes nothing on the account of public_key
    static Body keep_all(const PublicKey &public_key);
    static Body dummy();
};

template <typename V, typename P>
void visit(V& v, P& p, Body*) {
    v.field("publicKey", p.public_key);
    v.field("tokenId", p.token_id);
    v.field("update", p.update);
    v.field("balanceChange", p.balance_change);
    v.field("events", p.events);
    v.field("sequenceEvents", p.sequence_events);
    v.field("caller", p.caller);
    v.field("callData", p.call_data);
    v.field("callDepth", p.call_depth);
    v.field("preconditions", p.preconditions);
    v.field("useFullCommitment", p.use_full_commitment);
    v.field("incrementNonce", p.increment_nonce);
    v.field("authorizationKind", p.authorization_kind);
}

struct FeePayerBody {
    PublicKey public_key;
    uint64_t fee = 0;
    std::optional<uint32_t> valid_until;
    uint32_t nonce = 0;

    static FeePayerBody keep_all(const PublicKey &public_key, uint32_t nonce);
};

template <typename V, typename P>
void visit(V& v, P& p, FeePayerBody*) {
    v.field("publicKey", p.public_key);
    v.field("fee", p.fee);
    v.field("validUntil", p.valid_until);
    v.field("nonce", p.nonce);
}
