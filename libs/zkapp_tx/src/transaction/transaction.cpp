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

#include "transaction.h"
#include "call_forest.h"
#include "codes.h"
#include "logging.h"
#include "token.h"
#include <algorithm>
#include <stdexcept>

Transaction::Transaction(Settings_ptr settings_, std::optional<PublicKey> sender_) :
    settings(std::move(settings_)),
    sender(std::move(sender_)) {}

Transaction_ptr Transaction::begin(
    Settings_ptr settings,
    std::optional<PublicKey> sender
) {
    if (!settings) settings = init_settings();
    return std::make_shared<Transaction>(std::move(settings), std::move(sender));
}

Transaction::CallScope::CallScope(Transaction &tx, AccountUpdate_ptr self) :
    tx_(tx)
{
    tx_.call_stack_.push_back(std::move(self));
}

Transaction::CallScope::~CallScope() {
    tx_.call_stack_.pop_back();
}

Transaction::CallScope Transaction::enter_call(AccountUpdate_ptr self) {
    return CallScope(*this, std::move(self));
}

AccountUpdate_ptr Transaction::current_call() const {
    if (call_stack_.empty()) return nullptr;
    return call_stack_.back();
}

AccountUpdate_ptr Transaction::create(
    const PublicKey &public_key,
    const std::optional<Field> &token_id
) {
    auto update = AccountUpdate::default_account_update(public_key, token_id);
    if (in_call()) {
        current_call()->approve(update);
    } else {
        update->transaction = weak_from_this();
        account_updates.push_back(update);
    }
    return update;
}

AccountUpdate_ptr Transaction::create_signed(
    const PublicKey &signer,
    const std::optional<Field> &token_id
) {
    auto update = create(signer, token_id);
    require_signature(update);
    return update;
}

AccountUpdate_ptr Transaction::create_signed(
    const PrivateKey &signer,
    const std::optional<Field> &token_id
) {
    auto update = create(to_public_key(signer), token_id);
    require_signature(update, signer);
    return update;
}

AccountUpdate_ptr Transaction::fund_new_account(
    const PublicKey &fee_payer,
    uint64_t number_of_accounts
) {
    uint64_t per_account = settings->account_creation_fee;
    if (number_of_accounts != 0 && per_account > UINT64_MAXINT / number_of_accounts) {
        throw std::overflow_error("fund_new_account: fee overflows uint64");
    }
    auto update = create_signed(fee_payer);
    update->balance_sub_in_place(per_account * number_of_accounts);
    return update;
}

void Transaction::attach(const AccountUpdate_ptr &update) {
    if (in_call()) {
        auto self = current_call();
        // attaching a call's own update to itself would make a cycle
        if (self->id == update->id) return;
        self->approve(update);
        return;
    }

    bool present = std::any_of(account_updates.begin(), account_updates.end(),
        [&](const AccountUpdate_ptr &u) { return u->id == update->id; });
    if (present) return;

    AccountUpdate::unlink(update);
    update->transaction = weak_from_this();
    account_updates.push_back(update);
}

SigningInfo Transaction::get_signing_info(const AccountUpdate &update) const {
    const PublicKey &pk = update.body.public_key;
    const Field &token_id = update.body.token_id;

    uint32_t nonce = settings->onchain_nonce(pk, token_id);

    // the fee payer already bumps its own nonce
    bool is_same_as_fee_payer = sender.has_value()
        && *sender == pk
        && token_id == default_token_id();
    if (is_same_as_fee_payer) nonce++;

    for_each_predecessor(account_updates, update, [&](const AccountUpdate_ptr &other) {
        if (other->body.public_key == pk
            && other->body.token_id == token_id
            && other->body.increment_nonce) {
            nonce++;
        }
    });
    return SigningInfo{nonce, is_same_as_fee_payer};
}

uint32_t Transaction::get_nonce(const AccountUpdate &update) const {
    return get_signing_info(update).nonce;
}

uint32_t Transaction::fee_payer_nonce() const {
    if (!sender) return 0;
    return settings->onchain_nonce(*sender, default_token_id());
}

void Transaction::require_signature(
    const AccountUpdate_ptr &update,
    const std::optional<PrivateKey> &private_key
) {
    SigningInfo info = get_signing_info(*update);

    // same account as the fee payer: the full commitment protects against replay
    update->body.use_full_commitment = info.is_same_as_fee_payer;

    bool increment = !info.is_same_as_fee_payer;
    update->body.increment_nonce = increment;

    auto &nonce = update->body.preconditions.account.nonce;
    nonce.is_some = increment;
    nonce.value.lower = increment ? info.nonce : 0;
    nonce.value.upper = increment ? info.nonce : UINT32_MAXINT;

    update->set_lazy_signature(private_key);
}

Result<ZkappCommand, int> Transaction::build_command() {
    if (memo.size() > MEMO_MAX_LENGTH) {
        log_msg(LOG_ERROR, "build_command: memo is %zu bytes, at most %zu allowed",
                memo.size(), MEMO_MAX_LENGTH);
        return MEMO_TOO_LONG;
    }

    add_callers(account_updates);
    to_flat_list(account_updates);

    ZkappCommand cmd;
    if (sender) {
        cmd.fee_payer = FeePayer::default_fee_payer(*sender, fee_payer_nonce());
        cmd.fee_payer.lazy_authorization = LazySignature{sender_key};
        cmd.fee_payer.body.fee = fee;
        cmd.fee_payer.body.valid_until = valid_until;
    } else {
        cmd.fee_payer = FeePayer::dummy();
    }
    cmd.account_updates = account_updates;
    cmd.memo = memo;
    return cmd;
}
