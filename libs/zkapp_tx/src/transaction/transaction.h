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
#include "settings.h"
#include "zkapp_command.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

class Transaction;
using Transaction_ptr = std::shared_ptr<Transaction>;

struct SigningInfo {
    uint32_t nonce;
    bool is_same_as_fee_payer;
};

/*
 *  A pending transaction: the fee payer, the top-level account updates
 *  and the stack of contract calls in progress. Updates created while a
 *  call is open become children of that call's own update.
 */
class Transaction : public std::enable_shared_from_this<Transaction> {
private:
    std::vector<AccountUpdate_ptr> call_stack_;

public:
    Settings_ptr settings;
    std::optional<PublicKey> sender;
    std::optional<PrivateKey> sender_key;
    uint64_t fee = 0;
    std::optional<uint32_t> valid_until;
    std::string memo;
    std::vector<AccountUpdate_ptr> account_updates;

    Transaction(Settings_ptr settings_, std::optional<PublicKey> sender_);

    static Transaction_ptr begin(
        Settings_ptr settings,
        std::optional<PublicKey> sender = std::nullopt
    );

    // Pops the call on destruction, also when unwinding.
    class CallScope {
    private:
        Transaction &tx_;
    public:
        CallScope(Transaction &tx, AccountUpdate_ptr self);
        ~CallScope();
        CallScope(const CallScope&) = delete;
        CallScope& operator=(const CallScope&) = delete;
    };

    CallScope enter_call(AccountUpdate_ptr self);
    bool in_call() const { return !call_stack_.empty(); }
    AccountUpdate_ptr current_call() const;

    AccountUpdate_ptr create(
        const PublicKey &public_key,
        const std::optional<Field> &token_id = std::nullopt
    );
    AccountUpdate_ptr create_signed(
        const PublicKey &signer,
        const std::optional<Field> &token_id = std::nullopt
    );
    AccountUpdate_ptr create_signed(
        const PrivateKey &signer,
        const std::optional<Field> &token_id = std::nullopt
    );
    // debits number_of_accounts creation fees from fee_payer
    AccountUpdate_ptr fund_new_account(
        const PublicKey &fee_payer,
        uint64_t number_of_accounts = 1
    );
    void attach(const AccountUpdate_ptr &update);

    SigningInfo get_signing_info(const AccountUpdate &update) const;
    uint32_t get_nonce(const AccountUpdate &update) const;
    uint32_t fee_payer_nonce() const;

    void require_signature(
        const AccountUpdate_ptr &update,
        const std::optional<PrivateKey> &private_key = std::nullopt
    );

    // runs the caller pass, shares the updates with this transaction
    Result<ZkappCommand, int> build_command();
};
