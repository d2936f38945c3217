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

#include "account_update.h"
#include "call_forest.h"
#include "codes.h"
#include "hashing.h"
#include "json_codec.h"
#include "logging.h"
#include "token.h"
#include "transaction.h"
#include "utils.h"
#include <algorithm>
#include <atomic>
#include <stdexcept>

static std::atomic<uint64_t> account_update_counter{1};

uint64_t next_account_update_id() {
    return account_update_counter.fetch_add(1, std::memory_order_relaxed);
}

//////////////////////////////////////////////
///////////////    LAYOUT    ////////////////
////////////////////////////////////////////

AccountUpdatesLayout AccountUpdatesLayout::no_children() {
    return AccountUpdatesLayout{STATIC_CHILDREN, {}};
}

AccountUpdatesLayout AccountUpdatesLayout::any_children() {
    return AccountUpdatesLayout{ANY_CHILDREN, {}};
}

AccountUpdatesLayout AccountUpdatesLayout::no_delegation() {
    return AccountUpdatesLayout{NO_DELEGATION, {}};
}

AccountUpdatesLayout AccountUpdatesLayout::static_children(size_t n) {
    AccountUpdatesLayout l;
    l.kind = STATIC_CHILDREN;
    l.children.assign(n, no_children());
    return l;
}

AccountUpdatesLayout AccountUpdatesLayout::static_children(
    std::vector<AccountUpdatesLayout> layouts
) {
    AccountUpdatesLayout l;
    l.kind = STATIC_CHILDREN;
    l.children = std::move(layouts);
    return l;
}

void witness_children(
    const AccountUpdate_ptr &update,
    const AccountUpdatesLayout &layout
) {
    switch (layout.kind) {
    case AccountUpdatesLayout::ANY_CHILDREN:
        update->children.calls_type = CallsType::WITNESS;
        return;

    case AccountUpdatesLayout::NO_DELEGATION:
        update->children.calls_type = CallsType::WITNESS;
        if (update->is_delegate_call) {
            throw std::runtime_error(
                "witness_children: account update is a delegate call");
        }
        return;

    case AccountUpdatesLayout::STATIC_CHILDREN:
        break;
    }

    auto &kids = update->children.account_updates;
    size_t n = layout.children.size();
    for (size_t i = 0; i < n; i++) {
        if (i >= kids.size()) {
            auto filler = AccountUpdate::dummy();
            filler->parent = update;
            filler->body.call_depth = update->body.call_depth + 1;
            kids.push_back(filler);
        }
        witness_children(kids[i], layout.children[i]);
    }
    if (n == 0) {
        update->children.calls_type = CallsType::EQUALS;
        update->children.calls_value = empty_hash();
    }
}

//////////////////////////////////////////////
///////////    ACCOUNT UPDATE    ////////////
////////////////////////////////////////////

AccountUpdate::AccountUpdate(const Body &body_) :
    id(next_account_update_id()),
    body(body_) {}

AccountUpdate::AccountUpdate(const Body &body_, const Control &authorization_) :
    id(next_account_update_id()),
    body(body_),
    authorization(authorization_) {}

AccountUpdate_ptr AccountUpdate::default_account_update(
    const PublicKey &address,
    const std::optional<Field> &token_id
) {
    Body b = Body::keep_all(address);
    if (token_id) {
        b.token_id = *token_id;
        b.caller = *token_id;
    }
    return std::make_shared<AccountUpdate>(b);
}

AccountUpdate_ptr AccountUpdate::dummy() {
    return default_account_update(public_key_empty());
}

bool AccountUpdate::is_dummy() const {
    return public_key_is_empty(body.public_key);
}

AccountUpdate_ptr AccountUpdate::clone() const {
    auto cloned = std::make_shared<AccountUpdate>(body, authorization);
    cloned->id = id;
    cloned->label = label;
    cloned->lazy_authorization = lazy_authorization;
    cloned->is_delegate_call = is_delegate_call;
    cloned->parent = parent;
    cloned->children.calls_type = children.calls_type;
    cloned->children.calls_value = children.calls_value;
    for (const auto &child : children.account_updates) {
        auto c = child->clone();
        c->parent = cloned;
        cloned->children.account_updates.push_back(c);
    }
    return cloned;
}

void make_child_account_update(
    const AccountUpdate_ptr &parent,
    AccountUpdate_ptr child
) {
    child->body.call_depth = parent->body.call_depth + 1;

    auto &kids = parent->children.account_updates;
    bool was_child_already = std::any_of(kids.begin(), kids.end(),
        [&](const AccountUpdate_ptr &u) { return u->id == child->id; });

    if (!was_child_already) {
        AccountUpdate::unlink(child);
        kids.push_back(child);
    }
    child->parent = parent;
    child->transaction.reset();
}

AccountUpdate_ptr create_child_account_update(
    const AccountUpdate_ptr &parent,
    const PublicKey &child_address,
    const std::optional<Field> &token_id
) {
    auto child = AccountUpdate::default_account_update(child_address, token_id);
    make_child_account_update(parent, child);
    return child;
}

void AccountUpdate::approve(AccountUpdate_ptr child, const AccountUpdatesLayout &layout) {
    make_child_account_update(shared_from_this(), child);
    is_delegate_call = false;
    witness_children(child, layout);
}

void AccountUpdate::unlink(AccountUpdate_ptr update) {
    std::vector<AccountUpdate_ptr>* siblings = nullptr;

    auto parent = update->parent.lock();
    auto tx = update->transaction.lock();
    if (parent) {
        siblings = &parent->children.account_updates;
    } else if (tx) {
        siblings = &tx->account_updates;
    }

    if (siblings) {
        auto it = std::find_if(siblings->begin(), siblings->end(),
            [&](const AccountUpdate_ptr &u) { return u->id == update->id; });
        if (it != siblings->end()) siblings->erase(it);
    }
    update->parent.reset();
    update->transaction.reset();
}

//////////////////////////////////////////////
////////////    TOKEN & BALANCE    //////////
////////////////////////////////////////////

AccountUpdateToken AccountUpdate::token() {
    Token t(body.public_key, body.token_id);
    return AccountUpdateToken{shared_from_this(), t.id, t.parent_token_id, t.token_owner};
}

AccountUpdate_ptr AccountUpdateToken::mint(const PublicKey &address, uint64_t amount) {
    auto receiver = AccountUpdate::default_account_update(address, id);
    owner_update->approve(receiver);
    receiver->body.balance_change = receiver->body.balance_change.add(amount);
    return receiver;
}

AccountUpdate_ptr AccountUpdateToken::burn(const PublicKey &address, uint64_t amount) {
    auto sender = AccountUpdate::default_account_update(address, id);
    owner_update->approve(sender);
    sender->body.use_full_commitment = true;
    sender->body.balance_change = sender->body.balance_change.sub(amount);
    sender->set_lazy_signature();
    return sender;
}

AccountUpdate_ptr AccountUpdateToken::send(
    const PublicKey &from,
    const PublicKey &to,
    uint64_t amount
) {
    auto sender = AccountUpdate::default_account_update(from, id);
    owner_update->approve(sender);
    sender->body.use_full_commitment = true;
    sender->body.balance_change = sender->body.balance_change.sub(amount);
    sender->set_lazy_signature();

    auto receiver = create_child_account_update(owner_update, to, id);
    receiver->body.balance_change = receiver->body.balance_change.add(amount);
    return receiver;
}

void AccountUpdate::balance_add_in_place(const Int64 &x) {
    body.balance_change = body.balance_change.add(x);
}

void AccountUpdate::balance_add_in_place(uint64_t amount) {
    body.balance_change = body.balance_change.add(amount);
}

void AccountUpdate::balance_sub_in_place(uint64_t amount) {
    body.balance_change = body.balance_change.sub(amount);
}

void AccountUpdate::send(const PublicKey &to, uint64_t amount) {
    auto receiver = default_account_update(to, body.token_id);
    approve(receiver);
    balance_sub_in_place(amount);
    receiver->balance_add_in_place(amount);
}

void AccountUpdate::send(const AccountUpdate_ptr &to, uint64_t amount) {
    if (to->body.token_id != body.token_id) {
        throw std::runtime_error("send: receiver is on a different token");
    }
    balance_sub_in_place(amount);
    to->balance_add_in_place(amount);
}

//////////////////////////////////////////////
////////////    AUTHORIZATION    ////////////
////////////////////////////////////////////

void AccountUpdate::set_signature(const std::string &signature) {
    authorization = Control{std::nullopt, signature};
    lazy_authorization = std::monostate{};
}

void AccountUpdate::set_proof(const std::string &proof) {
    authorization = Control{proof, std::nullopt};
    lazy_authorization = std::monostate{};
}

void AccountUpdate::set_lazy_signature(const std::optional<PrivateKey> &private_key) {
    body.authorization_kind = AuthorizationKind{true, false};
    authorization = Control{};
    lazy_authorization = LazySignature{private_key};
}

void AccountUpdate::set_lazy_proof(LazyProof proof) {
    body.authorization_kind = AuthorizationKind{false, true};
    authorization = Control{};
    lazy_authorization = std::move(proof);
}

void AccountUpdate::set_lazy_none() {
    body.authorization_kind = AuthorizationKind{false, false};
    authorization = Control{};
    lazy_authorization = LazyNone{};
}

bool AccountUpdate::has_lazy_signature() const {
    return std::holds_alternative<LazySignature>(lazy_authorization);
}

bool AccountUpdate::has_lazy_proof() const {
    return std::holds_alternative<LazyProof>(lazy_authorization);
}

bool AccountUpdate::has_any_authorization() const {
    return !std::holds_alternative<std::monostate>(lazy_authorization)
        || authorization.proof.has_value()
        || authorization.signature.has_value();
}

//////////////////////////////////////////////
//////////    HASHING & FIELDS    ///////////
////////////////////////////////////////////

Field AccountUpdate::hash() const {
    return hash_with_prefix(PREFIX_BODY, to_field_list(body));
}

ZkappPublicInput AccountUpdate::to_public_input() const {
    return ZkappPublicInput{hash(), hash_children(*this)};
}

std::vector<Field> AccountUpdate::to_fields() const {
    FieldWriter w;
    w.field("body", body);
    w.field("isDelegateCall", is_delegate_call);
    return w.fields;
}

AccountUpdateAux AccountUpdate::to_auxiliary() const {
    FieldWriter w;
    w.field("body", body);

    AccountUpdateAux aux;
    aux.body = std::move(w.aux);
    aux.authorization = authorization;
    aux.lazy_authorization = lazy_authorization;
    aux.children.calls_type = children.calls_type;
    aux.children.calls_value = children.calls_value;
    for (const auto &child : children.account_updates) {
        aux.children.account_updates.push_back(child->clone());
    }
    aux.parent = parent;
    aux.id = id;
    aux.label = label;
    return aux;
}

Result<AccountUpdate_ptr, int> AccountUpdate::from_fields(
    const std::vector<Field> &fields,
    const AccountUpdateAux &aux
) {
    Body b = Body::dummy();
    bool delegate_call = false;

    FieldReader r(fields, aux.body);
    r.field("body", b);
    r.field("isDelegateCall", delegate_call);
    if (r.err != OK) return r.err;
    if (!r.consumed_all()) return FIELD_COUNT_ERR;
    int rc = check_strings(b.update);
    if (rc != OK) return rc;

    auto u = std::make_shared<AccountUpdate>(b, aux.authorization);
    u->id = aux.id;
    u->label = aux.label;
    u->lazy_authorization = aux.lazy_authorization;
    u->is_delegate_call = delegate_call;
    u->parent = aux.parent;
    u->children.calls_type = aux.children.calls_type;
    u->children.calls_value = aux.children.calls_value;
    for (const auto &child : aux.children.account_updates) {
        auto c = child->clone();
        c->parent = u;
        u->children.account_updates.push_back(c);
    }
    return u;
}

size_t AccountUpdate::size_in_fields() {
    return dummy()->to_fields().size();
}

//////////////////////////////////////////////
////////////////    JSON    /////////////////
////////////////////////////////////////////

static Json::Value optional_string(const std::optional<std::string> &s) {
    if (!s) return Json::Value(Json::nullValue);
    return Json::Value(*s);
}

Json::Value control_to_json(const Control &control) {
    Json::Value obj(Json::objectValue);
    obj["proof"] = optional_string(control.proof);
    obj["signature"] = optional_string(control.signature);
    return obj;
}

static int optional_string_from_json(const Json::Value &j, std::optional<std::string> &out) {
    if (j.isNull()) {
        out.reset();
        return OK;
    }
    if (!j.isString()) return JSON_TYPE_ERR;
    out = j.asString();
    return OK;
}

int control_from_json(const Json::Value &json, Control &out) {
    if (!json.isObject()) return JSON_TYPE_ERR;
    if (!json.isMember("proof") || !json.isMember("signature")) return JSON_MISSING_FIELD;
    if (json.size() != 2) return JSON_UNKNOWN_FIELD;

    int rc = optional_string_from_json(json["proof"], out.proof);
    if (rc != OK) return rc;
    return optional_string_from_json(json["signature"], out.signature);
}

Json::Value AccountUpdate::to_json() const {
    Json::Value obj(Json::objectValue);
    obj["body"] = JsonWriter::encode(body);
    obj["authorization"] = control_to_json(authorization);
    return obj;
}

Result<AccountUpdate_ptr, int> AccountUpdate::from_json(const Json::Value &json) {
    if (!json.isObject()) return JSON_TYPE_ERR;
    if (!json.isMember("body") || !json.isMember("authorization")) return JSON_MISSING_FIELD;
    if (json.size() != 2) return JSON_UNKNOWN_FIELD;

    Body b = Body::dummy();
    int rc = JsonReader::decode(json["body"], b);
    if (rc != OK) return rc;
    rc = check_strings(b.update);
    if (rc != OK) return rc;

    Control control;
    rc = control_from_json(json["authorization"], control);
    if (rc != OK) return rc;

    return std::make_shared<AccountUpdate>(b, control);
}

// drops nulls, then objects and arrays left without content
static Json::Value essential(const Json::Value &v) {
    if (v.isObject()) {
        Json::Value out(Json::objectValue);
        for (const auto &key : v.getMemberNames()) {
            Json::Value e = essential(v[key]);
            if (!e.isNull()) out[key] = e;
        }
        if (out.empty()) return Json::Value(Json::nullValue);
        return out;
    }
    if (v.isArray()) {
        bool any = false;
        Json::Value out(Json::arrayValue);
        for (const auto &x : v) {
            Json::Value e = essential(x);
            if (!e.isNull()) any = true;
            out.append(e);
        }
        if (!any) return Json::Value(Json::nullValue);
        return out;
    }
    return v;
}

static void stringify_member(Json::Value &obj, const char* key) {
    if (obj.isMember(key)) obj[key] = write_json(obj[key]);
}

Json::Value AccountUpdate::to_pretty() const {
    Json::Value json = essential(to_json());
    Json::Value body_json = json["body"];

    body_json.removeMember("callData");
    body_json["publicKey"] = short_str(public_key_to_hex(body.public_key));

    if (body.balance_change.is_zero()) body_json.removeMember("balanceChange");

    if (body.token_id == default_token_id()) body_json.removeMember("tokenId");
    else body_json["tokenId"] = short_str(field_to_string(body.token_id));

    if (body.call_depth == 0) body_json.removeMember("callDepth");

    if (body.caller == default_token_id()) body_json.removeMember("caller");
    else body_json["caller"] = short_str(field_to_string(body.caller));

    if (!body.increment_nonce) body_json.removeMember("incrementNonce");
    if (!body.use_full_commitment) body_json.removeMember("useFullCommitment");

    if (body_json.isMember("preconditions")) {
        stringify_member(body_json["preconditions"], "account");
        stringify_member(body_json["preconditions"], "network");
    }

    if (body_json.isMember("update")) {
        Json::Value &update_json = body_json["update"];
        if (update_json.isMember("verificationKey")) {
            Json::Value vk(Json::objectValue);
            vk["data"] = short_str(body.update.verification_key.value.data);
            vk["hash"] = short_str(field_to_string(body.update.verification_key.value.hash));
            update_json["verificationKey"] = write_json(vk);
        }
        stringify_member(update_json, "permissions");
        stringify_member(update_json, "appState");
        stringify_member(update_json, "timing");
    }

    stringify_member(body_json, "events");
    stringify_member(body_json, "sequenceEvents");

    body_json.removeMember("authorizationKind");
    if (body.authorization_kind.is_proved) body_json["authorizationKind"] = "Proof";
    else if (body.authorization_kind.is_signed) body_json["authorizationKind"] = "Signature";

    if (json.isMember("authorization")) {
        Json::Value auth(Json::objectValue);
        if (authorization.proof) auth["proof"] = short_str(*authorization.proof);
        if (authorization.signature) auth["signature"] = short_str(*authorization.signature);
        body_json["authorization"] = auth;
    }

    if (is_delegate_call) body_json["isDelegateCall"] = true;
    if (!label.empty()) body_json["label"] = label;
    return body_json;
}
