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

#include "settings.h"

uint32_t Settings::onchain_nonce(const PublicKey &pk, const Field &token_id) const {
    if (!nonce_source) return 0;
    return nonce_source(pk, token_id);
}

Settings_ptr init_settings(
    std::string signature_tag,
    uint64_t account_creation_fee,
    bool proofs_enabled,
    NonceSource nonce_source
) {
    return std::make_shared<Settings>(
        std::move(signature_tag),
        account_creation_fee,
        proofs_enabled,
        std::move(nonce_source)
    );
}
