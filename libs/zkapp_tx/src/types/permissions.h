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
#include "result.h"
#include <string>

/*
 *  Which authorization a kind of account modification needs.
 *
 *  constant | sig_necessary | sig_sufficient
 *  ---------+---------------+---------------
 *    true   |     false     |     true        None
 *    true   |     true      |     false       Impossible
 *    false  |     false     |     false       Proof
 *    false  |     true      |     true        Signature
 *    false  |     false     |     true        Either
 */
struct AuthRequired {
    bool constant = true;
    bool signature_necessary = false;
    bool signature_sufficient = true;

    bool operator==(const AuthRequired &other) const = default;

    static AuthRequired none();
    static AuthRequired impossible();
    static AuthRequired proof();
    static AuthRequired signature();
    static AuthRequired proof_or_signature();
};

Result<AuthRequired, int> permission_from_string(const std::string &s);
Result<std::string, int> permission_to_string(const AuthRequired &p);

struct Permissions {
    AuthRequired edit_state;
    AuthRequired send;
    AuthRequired receive;
    AuthRequired set_delegate;
    AuthRequired set_permissions;
    AuthRequired set_verification_key;
    AuthRequired set_zkapp_uri;
    AuthRequired edit_sequence_state;
    AuthRequired set_token_symbol;
    AuthRequired increment_nonce;
    AuthRequired set_voting_for;

    bool operator==(const Permissions &other) const = default;

    // state and sequence state by proof, the rest by signature
    static Permissions default_permissions();
    // everything by signature, receive by anyone
    static Permissions initial();
    // everything allowed
    static Permissions dummy();
};

template <typename V, typename P>
void visit(V& v, P& p, Permissions*) {
    v.field("editState", p.edit_state);
    v.field("send", p.send);
    v.field("receive", p.receive);
    v.field("setDelegate", p.set_delegate);
    v.field("setPermissions", p.set_permissions);
    v.field("setVerificationKey", p.set_verification_key);
    v.field("setZkappUri", p.set_zkapp_uri);
    v.field("editSequenceState", p.edit_sequence_state);
    v.field("setTokenSymbol", p.set_token_symbol);
    v.field("incrementNonce", p.increment_nonce);
    v.field("setVotingFor", p.set_voting_for);
}
