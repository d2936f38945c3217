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

#include "proving.h"
#include "call_forest.h"
#include "codes.h"
#include "logging.h"
#include <algorithm>

static std::string dummy_proof() {
    byte zeros[32] = {0};
    return to_hex(zeros, sizeof(zeros));
}

const std::string DUMMY_PROOF = dummy_proof();

void ZkappClass::compile(std::vector<Prover> provers_) {
    provers = std::move(provers_);
    compiled = true;
}

static Result<std::optional<ZkappProof>, int> add_proof(
    size_t index,
    const AccountUpdate_ptr &update,
    const ZkappCommand &command,
    ProvingContext &context,
    bool proofs_enabled
) {
    if (update->is_dummy() || !update->has_lazy_proof()) {
        return std::optional<ZkappProof>{};
    }
    if (!proofs_enabled) {
        update->set_proof(DUMMY_PROOF);
        return std::optional<ZkappProof>{};
    }

    LazyProof intent = std::get<LazyProof>(update->lazy_authorization);
    const ZkappClass* zkapp = intent.zkapp_class.get();
    const char* class_name = zkapp ? zkapp->name.c_str() : "?";

    if (!zkapp || !zkapp->compiled) {
        log_msg(LOG_ERROR,
            "Cannot prove execution of %s(), no prover found. "
            "Compile %s first.", intent.method_name.c_str(), class_name);
        return MISSING_PROVER;
    }

    auto it = std::find(zkapp->method_names.begin(), zkapp->method_names.end(),
                        intent.method_name);
    size_t i = static_cast<size_t>(it - zkapp->method_names.begin());
    if (it == zkapp->method_names.end() || i >= zkapp->provers.size()) {
        log_msg(LOG_ERROR,
            "Error when computing proofs: Method %s not found in %s.",
            intent.method_name.c_str(), class_name);
        return UNKNOWN_METHOD;
    }

    ZkappPublicInput public_input = update->to_public_input();

    ProverInput input;
    input.public_input = public_input.to_fields();
    input.previous_proofs = intent.previous_proofs;
    input.public_key = update->body.public_key;
    input.token_id = update->body.token_id;
    input.args = intent.args;
    input.index = index;
    input.transaction = &command;
    input.account_update = update;

    std::string proof;
    {
        ProvingContext::Session session(context, intent.memoized, intent.blinding_value);
        try {
            proof = zkapp->provers[i](input, session.get());
        } catch (...) {
            log_msg(LOG_ERROR, "Error when proving %s.%s()",
                    class_name, intent.method_name.c_str());
            throw;
        }
    }

    update->set_proof(proof);
    return std::optional<ZkappProof>(
        ZkappProof{public_input, proof, zkapp->max_proofs_verified});
}

Result<ProvedCommand, int> add_missing_proofs(
    const ZkappCommand &command,
    ProvingContext &context,
    bool proofs_enabled
) {
    ProvedCommand out;
    out.command = command.clone();

    std::vector<AccountUpdate_ptr> order;
    for_each(out.command.account_updates, [&](const AccountUpdate_ptr &update) {
        order.push_back(update);
    });

    for (size_t i = 0; i < order.size(); i++) {
        auto res = add_proof(i, order[i], command, context, proofs_enabled);
        if (res.is_err()) return res.unwrap_err();
        out.proofs.push_back(res.unwrap());
    }
    return out;
}

Result<ProvedCommand, int> add_missing_proofs(
    const ZkappCommand &command,
    ProvingContext &context,
    const Settings &settings
) {
    return add_missing_proofs(command, context, settings.proofs_enabled);
}
