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

#include "permissions.h"
#include "codes.h"
#include "logging.h"

AuthRequired AuthRequired::none()               { return {true,  false, true};  }
AuthRequired AuthRequired::impossible()         { return {true,  true,  false}; }
AuthRequired AuthRequired::proof()              { return {false, false, false}; }
AuthRequired AuthRequired::signature()          { return {false, true,  true};  }
AuthRequired AuthRequired::proof_or_signature() { return {false, false, true};  }

Result<AuthRequired, int> permission_from_string(const std::string &s) {
    if (s == "None")       return AuthRequired::none();
    if (s == "Either")     return AuthRequired::proof_or_signature();
    if (s == "Proof")      return AuthRequired::proof();
    if (s == "Signature")  return AuthRequired::signature();
    if (s == "Impossible") return AuthRequired::impossible();

    log_msg(LOG_ERROR,
        "Cannot parse invalid permission. %s does not exist.", s.c_str());
    return INVALID_PERMISSION;
}

Result<std::string, int> permission_to_string(const AuthRequired &p) {
    if (p == AuthRequired::none())               return std::string("None");
    if (p == AuthRequired::proof_or_signature()) return std::string("Either");
    if (p == AuthRequired::proof())              return std::string("Proof");
    if (p == AuthRequired::signature())          return std::string("Signature");
    if (p == AuthRequired::impossible())         return std::string("Impossible");
    return INVALID_PERMISSION;
}

static Permissions all_of(const AuthRequired &p) {
    return Permissions{p, p, p, p, p, p, p, p, p, p, p};
}

Permissions Permissions::default_permissions() {
    Permissions p = all_of(AuthRequired::signature());
    p.edit_state = AuthRequired::proof();
    p.send = AuthRequired::proof();
    p.receive = AuthRequired::none();
    p.edit_sequence_state = AuthRequired::proof();
    return p;
}

Permissions Permissions::initial() {
    Permissions p = all_of(AuthRequired::signature());
    p.receive = AuthRequired::none();
    return p;
}

Permissions Permissions::dummy() {
    return all_of(AuthRequired::none());
}
