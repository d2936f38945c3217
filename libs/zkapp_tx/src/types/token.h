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
#include "key_sig.h"

Field default_token_id();

// Derived descriptor of a custom token, not a stored entity.
struct Token {
    Field id;
    Field parent_token_id;
    PublicKey token_owner;

    static Field get_id(const PublicKey &token_owner, const Field &parent_token_id);
    static Field get_id(const PublicKey &token_owner);

    explicit Token(const PublicKey &token_owner);
    Token(const PublicKey &token_owner, const Field &parent_token_id);
};
