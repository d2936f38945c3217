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

#include "codes.h"

const char* code_to_string(int code) {
    switch (code) {
        case OK:                    return "ok";
        case MISSING_PRIVATE_KEY:   return "missing private key";
        case MISSING_PROVER:        return "missing prover";
        case UNKNOWN_METHOD:        return "unknown method";
        case INVALID_PERMISSION:    return "invalid permission";
        case JSON_PARSE_ERR:        return "malformed json";
        case JSON_MISSING_FIELD:    return "missing json field";
        case JSON_TYPE_ERR:         return "wrong json type";
        case JSON_UNKNOWN_FIELD:    return "unknown json field";
        case INT_RANGE_ERR:         return "integer out of range";
        case FIELD_RANGE_ERR:       return "field element out of range";
        case INVALID_PUBLIC_KEY:    return "invalid public key";
        case INVALID_PRIVATE_KEY:   return "invalid private key";
        case INVALID_HEX:           return "invalid hex string";
        case INVALID_CALL_DEPTH:    return "invalid call depth";
        case MEMO_TOO_LONG:         return "memo too long";
        case TOKEN_SYMBOL_TOO_LONG: return "token symbol too long";
        case FIELD_COUNT_ERR:       return "wrong number of fields";
        case INVALID_SIGNATURE:     return "invalid signature";
        case NULL_PARAMETER:        return "null parameter";
        case INTERNAL_ERR:          return "internal error";
        case STRING_HASH_MISMATCH:  return "string does not match its hash";
        default:                    return "unknown error";
    }
}
