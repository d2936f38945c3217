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

#include "token.h"
#include "hashing.h"

Field default_token_id() {
    return new_scalar(1);
}

Field Token::get_id(const PublicKey &token_owner, const Field &parent_token_id) {
    auto owner = public_key_to_fields(token_owner);
    std::vector<Field> input(owner.begin(), owner.end());
    input.push_back(parent_token_id);
    return hash_with_prefix(PREFIX_TOKEN_ID, input);
}

Field Token::get_id(const PublicKey &token_owner) {
    return get_id(token_owner, default_token_id());
}

Token::Token(const PublicKey &token_owner) :
    Token(token_owner, default_token_id()) {}

Token::Token(const PublicKey &token_owner, const Field &parent_token_id) :
    id(get_id(token_owner, parent_token_id)),
    parent_token_id(parent_token_id),
    token_owner(token_owner) {}
