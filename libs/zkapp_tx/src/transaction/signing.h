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
#include "key_sig.h"
#include "result.h"
#include "settings.h"
#include "zkapp_command.h"
#include <string>
#include <vector>

/*
 *  Turns pending signature intents into signatures.
 *
 *  Every node is cloned, the input command stays reusable. A lazy
 *  signature takes its key from the intent, else from extra_keys by
 *  public key, else fails with MISSING_PRIVATE_KEY. Nodes sign the full
 *  commitment when use_full_commitment is set, the partial one
 *  otherwise. The fee payer always signs the full commitment.
 */
Result<ZkappCommand, int> add_missing_signatures(
    const ZkappCommand &command,
    const std::vector<PrivateKey> &extra_keys,
    const Settings &settings
);

// Signs the fee payer and every unproved update that belong to private_key.
Result<std::string, int> sign_json_transaction(
    const std::string &transaction_json,
    const PrivateKey &private_key,
    const Settings &settings
);
