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

#include "zkapp_command.h"
#include "call_forest.h"
#include "codes.h"
#include "fields.h"
#include "hashing.h"
#include "json_codec.h"
#include "logging.h"
#include "utils.h"

//////////////////////////////////////////////
//////////////    FEE PAYER    //////////////
////////////////////////////////////////////

FeePayer FeePayer::default_fee_payer(const PublicKey &address, uint32_t nonce) {
    FeePayer fp;
    fp.body = FeePayerBody::keep_all(address, nonce);
    fp.authorization = DUMMY_SIGNATURE;
    fp.lazy_authorization = LazySignature{};
    return fp;
}

FeePayer FeePayer::dummy() {
    FeePayer fp;
    fp.body = FeePayerBody::keep_all(public_key_empty(), 0);
    fp.authorization = DUMMY_SIGNATURE;
    return fp;
}

Field FeePayer::hash() const {
    return hash_with_prefix(PREFIX_FEE_PAYER, to_field_list(body));
}

static Json::Value fee_payer_to_json(const FeePayer &fp) {
    Json::Value obj(Json::objectValue);
    obj["body"] = JsonWriter::encode(fp.body);
    obj["authorization"] = fp.authorization;
    return obj;
}

static bool is_signature_hex(const std::string &s) {
    return s.size() == SIGNATURE_SIZE * 2 && from_hex(s).is_ok();
}

static int fee_payer_from_json(const Json::Value &json, FeePayer &out) {
    if (!json.isObject()) return JSON_TYPE_ERR;
    if (!json.isMember("body") || !json.isMember("authorization")) return JSON_MISSING_FIELD;
    if (json.size() != 2) return JSON_UNKNOWN_FIELD;

    FeePayerBody body = FeePayerBody::keep_all(public_key_empty(), 0);
    int rc = JsonReader::decode(json["body"], body);
    if (rc != OK) return rc;

    const Json::Value &auth = json["authorization"];
    if (!auth.isString()) return JSON_TYPE_ERR;
    if (!is_signature_hex(auth.asString())) return INVALID_SIGNATURE;

    out.body = body;
    out.authorization = auth.asString();
    out.lazy_authorization.reset();
    return OK;
}

//////////////////////////////////////////////
////////////    ZKAPP COMMAND    ////////////
////////////////////////////////////////////

ZkappCommand ZkappCommand::clone() const {
    ZkappCommand out;
    out.fee_payer = fee_payer;
    out.memo = memo;
    for (const auto &update : account_updates) {
        out.account_updates.push_back(update->clone());
    }
    return out;
}

Json::Value ZkappCommand::to_json() const {
    Json::Value obj(Json::objectValue);
    obj["feePayer"] = fee_payer_to_json(fee_payer);

    Json::Value updates(Json::arrayValue);
    for (const auto &update : to_flat_list(account_updates)) {
        updates.append(update->to_json());
    }
    obj["accountUpdates"] = updates;
    obj["memo"] = memo;
    return obj;
}

std::string ZkappCommand::to_json_string() const {
    return write_json(to_json());
}

Result<ZkappCommand, int> ZkappCommand::from_json(const Json::Value &json) {
    if (!json.isObject()) return JSON_TYPE_ERR;
    for (const char* key : {"feePayer", "accountUpdates", "memo"}) {
        if (!json.isMember(key)) return JSON_MISSING_FIELD;
    }
    if (json.size() != 3) return JSON_UNKNOWN_FIELD;

    ZkappCommand cmd;

    const Json::Value &memo = json["memo"];
    if (!memo.isString()) return JSON_TYPE_ERR;
    cmd.memo = memo.asString();
    if (cmd.memo.size() > MEMO_MAX_LENGTH) return MEMO_TOO_LONG;

    int rc = fee_payer_from_json(json["feePayer"], cmd.fee_payer);
    if (rc != OK) return rc;

    const Json::Value &updates = json["accountUpdates"];
    if (!updates.isArray()) return JSON_TYPE_ERR;

    // path[d] is the most recent update at depth d
    std::vector<AccountUpdate_ptr> path;
    for (const Json::Value &u : updates) {
        auto res = AccountUpdate::from_json(u);
        if (res.is_err()) return res.unwrap_err();
        AccountUpdate_ptr update = res.unwrap();

        size_t depth = static_cast<size_t>(update->body.call_depth);
        if (depth > path.size()) {
            log_msg(LOG_WARN, "from_json: call depth jumps from %zu to %zu",
                    path.size(), depth);
            return INVALID_CALL_DEPTH;
        }
        path.resize(depth);

        if (depth == 0) {
            cmd.account_updates.push_back(update);
        } else {
            AccountUpdate_ptr parent = path[depth - 1];
            parent->children.account_updates.push_back(update);
            update->parent = parent;
        }
        path.push_back(update);
    }
    return cmd;
}

Result<ZkappCommand, int> ZkappCommand::from_json_string(const std::string &text) {
    auto parsed = parse_json(text);
    if (parsed.is_err()) return parsed.unwrap_err();
    return from_json(parsed.unwrap());
}

Json::Value ZkappCommand::to_pretty() const {
    Json::Value out(Json::arrayValue);

    Json::Value fp = JsonWriter::encode(fee_payer.body);
    fp["publicKey"] = short_str(public_key_to_hex(fee_payer.body.public_key));
    fp["authorization"] = short_str(fee_payer.authorization);
    if (!fee_payer.body.valid_until) fp.removeMember("validUntil");
    out.append(fp);

    for (const auto &update : to_flat_list(account_updates)) {
        out.append(update->to_pretty());
    }
    return out;
}

//////////////////////////////////////////////
/////////////    COMMITMENTS    /////////////
////////////////////////////////////////////

Field memo_hash(const std::string &memo) {
    return hash_string(PREFIX_MEMO, memo);
}

Result<TransactionCommitments, int> transaction_commitments(const ZkappCommand &command) {
    if (command.memo.size() > MEMO_MAX_LENGTH) return MEMO_TOO_LONG;

    TransactionCommitments c;
    c.commitment = hash_forest(command.account_updates);
    c.full_commitment = hash_with_prefix(
        PREFIX_ACCOUNT_UPDATE_CONS,
        {memo_hash(command.memo), command.fee_payer.hash(), c.commitment});
    return c;
}
