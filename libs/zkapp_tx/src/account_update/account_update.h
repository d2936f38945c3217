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
#include "body.h"
#include "fields.h"
#include "provable.h"
#include "result.h"
#include <jsoncpp/json/json.h>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

class AccountUpdate;
class Transaction;
struct ZkappClass;

using AccountUpdate_ptr = std::shared_ptr<AccountUpdate>;

//////////////////////////////////////////////
///////////    AUTHORIZATION    /////////////
////////////////////////////////////////////

// Final authorization, at most one of the two is set.
struct Control {
    std::optional<std::string> proof;
    std::optional<std::string> signature;
};

struct LazyNone {};

struct LazySignature {
    std::optional<PrivateKey> private_key;
};

struct PreviousProof {
    std::vector<Field> public_input;
    std::string proof;
};

struct LazyProof {
    std::string method_name;
    std::vector<Field> args;
    std::vector<PreviousProof> previous_proofs;
    std::shared_ptr<const ZkappClass> zkapp_class;
    std::vector<MemoizedValue> memoized;
    Field blinding_value = new_scalar();
};

using LazyAuthorization =
    std::variant<std::monostate, LazyNone, LazySignature, LazyProof>;

//////////////////////////////////////////////
///////////    CHILDREN & LAYOUT    /////////
////////////////////////////////////////////

enum class CallsType : uint8_t {
    NONE,
    WITNESS,
    EQUALS,
};

struct Children {
    CallsType calls_type = CallsType::NONE;
    // expected children hash when calls_type == EQUALS
    Field calls_value = new_scalar();
    std::vector<AccountUpdate_ptr> account_updates;
};

/*
 *  Shape of an update's children as far as a circuit can see it.
 *
 *  STATIC_CHILDREN  exactly children.size() children, each with its own
 *                   layout. Zero children means NoChildren and pins the
 *                   children hash to the empty hash.
 *  ANY_CHILDREN     any children, their hash is an unconstrained witness
 *  NO_DELEGATION    like ANY_CHILDREN, and the update must not be a
 *                   delegate call
 */
struct AccountUpdatesLayout {
    enum Kind : uint8_t {
        STATIC_CHILDREN,
        ANY_CHILDREN,
        NO_DELEGATION,
    };

    Kind kind = STATIC_CHILDREN;
    std::vector<AccountUpdatesLayout> children;

    static AccountUpdatesLayout no_children();
    static AccountUpdatesLayout any_children();
    static AccountUpdatesLayout no_delegation();
    // n children without grandchildren
    static AccountUpdatesLayout static_children(size_t n);
    static AccountUpdatesLayout static_children(std::vector<AccountUpdatesLayout> layouts);
};

struct ZkappPublicInput {
    Field account_update;
    Field calls;

    std::vector<Field> to_fields() const { return {account_update, calls}; }
};

// Everything of an update that is not a field element.
struct AccountUpdateAux {
    BodyAux body;
    Control authorization;
    LazyAuthorization lazy_authorization;
    Children children;
    std::weak_ptr<AccountUpdate> parent;
    uint64_t id = 0;
    std::string label;
};

//////////////////////////////////////////////
///////////    ACCOUNT UPDATE    ////////////
////////////////////////////////////////////

// token() view of an update, owner = the update's account
struct AccountUpdateToken {
    AccountUpdate_ptr owner_update;
    Field id;
    Field parent_token_id;
    PublicKey token_owner;

    AccountUpdate_ptr mint(const PublicKey &address, uint64_t amount);
    AccountUpdate_ptr burn(const PublicKey &address, uint64_t amount);
    // returns the receiving update
    AccountUpdate_ptr send(const PublicKey &from, const PublicKey &to, uint64_t amount);
};

uint64_t next_account_update_id();

/*
 *  One node of the call forest.
 *
 *  A node is owned by exactly one list at a time: its parent's
 *  children, or the account_updates of the transaction it belongs to.
 *  parent and transaction are back references only.
 *
 *  Always held by an AccountUpdate_ptr, the tree operations need
 *  shared_from_this().
 */
class AccountUpdate : public std::enable_shared_from_this<AccountUpdate> {
public:
    uint64_t id;
    std::string label;
    Body body;
    Control authorization;
    LazyAuthorization lazy_authorization;
    bool is_delegate_call = false;
    Children children;
    std::weak_ptr<AccountUpdate> parent;
    std::weak_ptr<Transaction> transaction;

    explicit AccountUpdate(const Body &body_);
    AccountUpdate(const Body &body_, const Control &authorization_);

    static AccountUpdate_ptr default_account_update(
        const PublicKey &address,
        const std::optional<Field> &token_id = std::nullopt
    );
    static AccountUpdate_ptr dummy();
    bool is_dummy() const;

    // deep copy, ids are kept
    AccountUpdate_ptr clone() const;

    // TREE
    void approve(
        AccountUpdate_ptr child,
        const AccountUpdatesLayout &layout = AccountUpdatesLayout::no_delegation()
    );
    static void unlink(AccountUpdate_ptr update);

    // VIEWS
    AccountUpdateToken token();
    const Field& token_id() const { return body.token_id; }
    const PublicKey& public_key() const { return body.public_key; }
    Update& update() { return body.update; }

    // BALANCE
    void balance_add_in_place(const Int64 &x);
    void balance_add_in_place(uint64_t amount);
    void balance_sub_in_place(uint64_t amount);
    void send(const PublicKey &to, uint64_t amount);
    // to must be on the same token
    void send(const AccountUpdate_ptr &to, uint64_t amount);

    // AUTHORIZATION
    void set_signature(const std::string &signature);
    void set_proof(const std::string &proof);
    void set_lazy_signature(const std::optional<PrivateKey> &private_key = std::nullopt);
    void set_lazy_proof(LazyProof proof);
    void set_lazy_none();
    bool has_lazy_signature() const;
    bool has_lazy_proof() const;
    bool has_any_authorization() const;

    // HASHING
    Field hash() const;
    ZkappPublicInput to_public_input() const;

    // CIRCUIT BOUNDARY
    std::vector<Field> to_fields() const;
    AccountUpdateAux to_auxiliary() const;
    static Result<AccountUpdate_ptr, int> from_fields(
        const std::vector<Field> &fields,
        const AccountUpdateAux &aux
    );
    static size_t size_in_fields();

    // JSON
    Json::Value to_json() const;
    static Result<AccountUpdate_ptr, int> from_json(const Json::Value &json);
    Json::Value to_pretty() const;
};

void make_child_account_update(
    const AccountUpdate_ptr &parent,
    AccountUpdate_ptr child
);

AccountUpdate_ptr create_child_account_update(
    const AccountUpdate_ptr &parent,
    const PublicKey &child_address,
    const std::optional<Field> &token_id = std::nullopt
);

void witness_children(
    const AccountUpdate_ptr &update,
    const AccountUpdatesLayout &layout
);

Json::Value control_to_json(const Control &control);
int control_from_json(const Json::Value &json, Control &out);
