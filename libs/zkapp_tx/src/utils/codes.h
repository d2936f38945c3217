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

enum ZkappCodes {
    OK = 0,

    MISSING_PRIVATE_KEY = 1,
    MISSING_PROVER = 2,
    UNKNOWN_METHOD = 3,
    INVALID_PERMISSION = 4,
    JSON_PARSE_ERR = 5,
    JSON_MISSING_FIELD = 6,
    JSON_TYPE_ERR = 7,
    JSON_UNKNOWN_FIELD = 8,
    INT_RANGE_ERR = 9,
    FIELD_RANGE_ERR = 10,
    INVALID_PUBLIC_KEY = 11,
    INVALID_PRIVATE_KEY = 12,
    INVALID_HEX = 13,
    INVALID_CALL_DEPTH = 14,
    MEMO_TOO_LONG = 15,
    TOKEN_SYMBOL_TOO_LONG = 16,
    FIELD_COUNT_ERR = 17,
    INVALID_SIGNATURE = 18,
    NULL_PARAMETER = 19,
    INTERNAL_ERR = 20,
    STRING_HASH_MISMATCH = 21,
};

const char* code_to_string(int code);
