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
#include "account_update.h"
#include "provable.h"
#include "result.h"
#include "settings.h"
#include "zkapp_command.h"
#include <functional>
#include <optional>
#include <string>
#include <vector>

// attached instead of a real proof when proving is disabled
extern const std::string DUMMY_PROOF;

struct ProverInput {
    // [hash(update), hash_children(update)]
    std::vector<Field> public_input;
    std::vector<PreviousProof> previous_proofs;
    PublicKey public_key;
    Field token_id;
    std::vector<Field> args;
    size_t index;
    const ZkappCommand* transaction;
    AccountUpdate_ptr account_update;
};

// Runs one method circuit and returns the serialized proof.
using Prover = std::function<std::string(const ProverInput&, ProvingSession&)>;

// Contract class as the proving pipeline sees it. provers[i] proves method_names[i].
struct ZkappClass {
    std::string name;
    std::vector<std::string> method_names;
    std::vector<Prover> provers;
    bool compiled = false;
    int max_proofs_verified = 0;

    void compile(std::vector<Prover> provers_);
};

struct ZkappProof {
    ZkappPublicInput public_input;
    std::string proof;
    int max_proofs_verified;
};

struct ProvedCommand {
    ZkappCommand command;
    // one entry per update in pre-order, nullopt where nothing was proved
    std::vector<std::optional<ZkappProof>> proofs;
};

/*
 *  Proves every update that carries a lazy proof, one at a time in
 *  pre-order. Each prover run holds the proving context's session and
 *  releases it before the next update. A failing prover aborts the
 *  run, updates already proved stay proved in the clone that is
 *  thrown away.
 */
Result<ProvedCommand, int> add_missing_proofs(
    const ZkappCommand &command,
    ProvingContext &context,
    bool proofs_enabled
);

// proves only when settings.proofs_enabled, dummy proofs otherwise
Result<ProvedCommand, int> add_missing_proofs(
    const ZkappCommand &command,
    ProvingContext &context,
    const Settings &settings
);
