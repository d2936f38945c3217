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

#include "body.h"
#include "codes.h"
#include "hashing.h"
#include "token.h"

StringWithHash zkapp_uri(const std::string &uri) {
    return StringWithHash{uri, hash_string(PREFIX_ZKAPP_URI, uri)};
}

Result<StringWithHash, int> token_symbol(const std::string &symbol) {
    if (symbol.size() > TOKEN_SYMBOL_MAX_LENGTH) return TOKEN_SYMBOL_TOO_LONG;
    return StringWithHash{symbol, hash_string(PREFIX_TOKEN_SYMBOL, symbol)};
}

Update Update::no_update() {
    Update u;
    for (auto &s : u.app_state) s = keep(new_scalar());
    u.delegate = keep(public_key_empty());
    u.verification_key = keep(StringWithHash{"", new_scalar()});
    u.permissions = keep(Permissions::initial());
    u.zkapp_uri = keep(zkapp_uri(""));
    u.token_symbol = keep(token_symbol("").unwrap());
    u.timing = keep(Timing{});
    u.voting_for = keep(new_scalar());
    return u;
}

int check_strings(const Update &update) {
    if (update.zkapp_uri.is_some) {
        const StringWithHash &uri = update.zkapp_uri.value;
        if (uri.hash != hash_string(PREFIX_ZKAPP_URI, uri.data)) return STRING_HASH_MISMATCH;
    }
    if (update.token_symbol.is_some) {
        auto res = token_symbol(update.token_symbol.value.data);
        if (res.is_err()) return res.unwrap_err();
        if (res.unwrap().hash != update.token_symbol.value.hash) return STRING_HASH_MISMATCH;
    }
    return OK;
}

static const char* empty_prefix(EventsKind kind) {
    return kind == EventsKind::EVENTS ? PREFIX_EVENTS_EMPTY : PREFIX_SEQUENCE_EMPTY;
}

static const char* list_prefix(EventsKind kind) {
    return kind == EventsKind::EVENTS ? PREFIX_EVENTS : PREFIX_SEQUENCE_EVENTS;
}

Events Events::empty(EventsKind kind) {
    Events e;
    e.kind = kind;
    e.hash = hash_with_prefix(empty_prefix(kind), {});
    return e;
}

void Events::push(const std::vector<Field> &event) {
    Field event_hash = hash_with_prefix(PREFIX_EVENT, event);
    hash = hash_with_prefix(list_prefix(kind), {hash, event_hash});
    data.push_back(event);
}

void Events::rehash() {
    std::vector<std::vector<Field>> all = std::move(data);
    data.clear();
    hash = hash_with_prefix(empty_prefix(kind), {});
    for (const auto &event : all) push(event);
}

Body Body::keep_all(const PublicKey &public_key) {
    Body b;
    b.public_key = public_key;
    b.token_id = default_token_id();
    b.update = Update::no_update();
    b.balance_change = Int64::zero();
    b.events = Events::empty(EventsKind::EVENTS);
    b.sequence_events = Events::empty(EventsKind::SEQUENCE);
    b.caller = default_token_id();
    b.call_data = new_scalar();
    b.call_depth = 0;
    b.preconditions = Preconditions::ignore_all();
    // transactions built here do not include the fee payer by default
    b.use_full_commitment = false;
    b.increment_nonce = false;
    b.authorization_kind = AuthorizationKind{false, false};
    return b;
}

Body Body::dummy() {
    return keep_all(public_key_empty());
}

FeePayerBody FeePayerBody::keep_all(const PublicKey &public_key, uint32_t nonce) {
    FeePayerBody b;
    b.public_key = public_key;
    b.nonce = nonce;
    return b;
}
