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

#include "extern.h"
#include "codes.h"
#include "key_sig.h"
#include "logging.h"
#include "settings.h"
#include "signing.h"
#include <cstdlib>
#include <cstring>
#include <exception>

static char* copy_out(const std::string &s) {
    char* out = static_cast<char*>(malloc(s.size() + 1));
    if (!out) return nullptr;
    std::memcpy(out, s.data(), s.size());
    out[s.size()] = '\0';
    return out;
}

int zkapp_sign_json_transaction(
    const char* transaction_json,
    const unsigned char* private_key,
    size_t private_key_size,
    const char* tag,
    char** out_json
) {
    if (!transaction_json || !private_key || !out_json) return NULL_PARAMETER;

    auto sk = private_key_from_bytes(private_key, private_key_size);
    if (sk.is_err()) return sk.unwrap_err();

    try {
        Settings_ptr settings = init_settings(tag ? tag : DEFAULT_SIGNATURE_TAG);
        auto res = sign_json_transaction(transaction_json, sk.unwrap(), *settings);
        if (res.is_err()) return res.unwrap_err();

        *out_json = copy_out(res.unwrap());
        if (!*out_json) return INTERNAL_ERR;
        return OK;

    } catch (const std::exception &e) {
        log_msg(LOG_ERROR, "zkapp_sign_json_transaction: %s", e.what());
        return INTERNAL_ERR;
    }
}

int zkapp_public_key_from_private(
    const unsigned char* private_key,
    size_t private_key_size,
    char** out_hex
) {
    if (!private_key || !out_hex) return NULL_PARAMETER;

    auto sk = private_key_from_bytes(private_key, private_key_size);
    if (sk.is_err()) return sk.unwrap_err();

    *out_hex = copy_out(public_key_to_hex(to_public_key(sk.unwrap())));
    if (!*out_hex) return INTERNAL_ERR;
    return OK;
}

void zkapp_string_free(char* s) {
    free(s);
}

const char* zkapp_code_to_string(int code) {
    return code_to_string(code);
}

void zkapp_set_log_level(int level) {
    if (level < LOG_DEBUG || level > LOG_OFF) return;
    set_log_level(static_cast<LogLevel>(level));
}
