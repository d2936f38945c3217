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

#include "json_codec.h"
#include "bigint.h"
#include "logging.h"
#include <memory>
#include <stdexcept>

Json::Value JsonWriter::encode(const Field &f) {
    return Json::Value(field_to_string(f));
}

Json::Value JsonWriter::encode(const bool &b) {
    return Json::Value(b);
}

Json::Value JsonWriter::encode(const uint32_t &x) {
    return Json::Value(std::to_string(x));
}

Json::Value JsonWriter::encode(const uint64_t &x) {
    return Json::Value(std::to_string(x));
}

Json::Value JsonWriter::encode(const int &call_depth) {
    return Json::Value(call_depth);
}

Json::Value JsonWriter::encode(const Int64 &x) {
    Json::Value obj(Json::objectValue);
    obj["magnitude"] = std::to_string(x.magnitude);
    obj["sgn"] = x.is_negative() ? "Negative" : "Positive";
    return obj;
}

Json::Value JsonWriter::encode(const PublicKey &pk) {
    return Json::Value(public_key_to_hex(pk));
}

Json::Value JsonWriter::encode(const AuthRequired &auth) {
    auto res = permission_to_string(auth);
    if (res.is_err()) {
        throw std::runtime_error("encode: not a valid permission");
    }
    return Json::Value(res.unwrap());
}

Json::Value JsonWriter::encode(const StringWithHash &s) {
    Json::Value obj(Json::objectValue);
    obj["data"] = s.data;
    obj["hash"] = field_to_string(s.hash);
    return obj;
}

Json::Value JsonWriter::encode(const Events &events) {
    Json::Value arr(Json::arrayValue);
    for (const auto &event : events.data) {
        Json::Value e(Json::arrayValue);
        for (const Field &f : event) e.append(field_to_string(f));
        arr.append(e);
    }
    return arr;
}

Json::Value JsonWriter::encode(const std::optional<uint32_t> &x) {
    if (!x.has_value()) return Json::Value(Json::nullValue);
    return encode(x.value());
}

int JsonReader::decode(const Json::Value &j, Field &out) {
    if (!j.isString()) return JSON_TYPE_ERR;
    auto res = field_from_string(j.asString());
    if (res.is_err()) return res.unwrap_err();
    out = res.unwrap();
    return OK;
}

int JsonReader::decode(const Json::Value &j, bool &out) {
    if (!j.isBool()) return JSON_TYPE_ERR;
    out = j.asBool();
    return OK;
}

int decode_uint_string(const Json::Value &j, uint64_t max, uint64_t &out) {
    if (!j.isString()) return JSON_TYPE_ERR;
    const std::string s = j.asString();
    if (s.empty() || s.size() > 20) return INT_RANGE_ERR;
    if (s.size() > 1 && s[0] == '0') return INT_RANGE_ERR;

    BigInt value;
    if (!BigInt::from_decimal(s, value)) return INT_RANGE_ERR;

    byte le[8];
    if (!value.to_le_bytes(le, sizeof(le))) return INT_RANGE_ERR;
    uint64_t v = 0;
    for (int i = 7; i >= 0; i--) v = (v << 8) | le[i];
    if (v > max) return INT_RANGE_ERR;
    out = v;
    return OK;
}

int JsonReader::decode(const Json::Value &j, uint32_t &out) {
    uint64_t v = 0;
    int rc = decode_uint_string(j, UINT32_MAXINT, v);
    if (rc != OK) return rc;
    out = static_cast<uint32_t>(v);
    return OK;
}

int JsonReader::decode(const Json::Value &j, uint64_t &out) {
    return decode_uint_string(j, UINT64_MAXINT, out);
}

int JsonReader::decode(const Json::Value &j, int &call_depth) {
    if (!j.isInt()) return JSON_TYPE_ERR;
    int depth = j.asInt();
    if (depth < 0) return INVALID_CALL_DEPTH;
    call_depth = depth;
    return OK;
}

int JsonReader::decode(const Json::Value &j, Int64 &out) {
    if (!j.isObject()) return JSON_TYPE_ERR;
    if (!j.isMember("magnitude") || !j.isMember("sgn")) return JSON_MISSING_FIELD;
    if (j.size() != 2) return JSON_UNKNOWN_FIELD;

    uint64_t magnitude = 0;
    int rc = decode(j["magnitude"], magnitude);
    if (rc != OK) return rc;

    const Json::Value &sgn = j["sgn"];
    if (!sgn.isString()) return JSON_TYPE_ERR;
    if (sgn.asString() == "Positive") {
        out = Int64{magnitude, Sign::POSITIVE};
    } else if (sgn.asString() == "Negative") {
        out = Int64{magnitude, magnitude == 0 ? Sign::POSITIVE : Sign::NEGATIVE};
    } else {
        return JSON_TYPE_ERR;
    }
    return OK;
}

int JsonReader::decode(const Json::Value &j, PublicKey &out) {
    if (!j.isString()) return JSON_TYPE_ERR;
    auto res = public_key_from_hex(j.asString());
    if (res.is_err()) return res.unwrap_err();
    out = res.unwrap();
    return OK;
}

int JsonReader::decode(const Json::Value &j, AuthRequired &out) {
    if (!j.isString()) return JSON_TYPE_ERR;
    auto res = permission_from_string(j.asString());
    if (res.is_err()) return res.unwrap_err();
    out = res.unwrap();
    return OK;
}

int JsonReader::decode(const Json::Value &j, StringWithHash &out) {
    if (!j.isObject()) return JSON_TYPE_ERR;
    if (!j.isMember("data") || !j.isMember("hash")) return JSON_MISSING_FIELD;
    if (j.size() != 2) return JSON_UNKNOWN_FIELD;
    if (!j["data"].isString()) return JSON_TYPE_ERR;

    Field hash;
    int rc = decode(j["hash"], hash);
    if (rc != OK) return rc;
    out.data = j["data"].asString();
    out.hash = hash;
    return OK;
}

int JsonReader::decode(const Json::Value &j, Events &out) {
    if (!j.isArray()) return JSON_TYPE_ERR;

    std::vector<std::vector<Field>> data;
    for (const Json::Value &e : j) {
        if (!e.isArray()) return JSON_TYPE_ERR;
        std::vector<Field> event;
        for (const Json::Value &f : e) {
            Field x;
            int rc = decode(f, x);
            if (rc != OK) return rc;
            event.push_back(x);
        }
        data.push_back(std::move(event));
    }
    out.data = std::move(data);
    out.rehash();
    return OK;
}

int JsonReader::decode(const Json::Value &j, std::optional<uint32_t> &out) {
    if (j.isNull()) {
        out.reset();
        return OK;
    }
    uint32_t v = 0;
    int rc = decode(j, v);
    if (rc != OK) return rc;
    out = v;
    return OK;
}

Result<Json::Value, int> parse_json(const std::string &text) {
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    builder["failIfExtra"] = true;
    builder["rejectDupKeys"] = true;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errs;
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errs)) {
        log_msg(LOG_DEBUG, "parse_json: %s", errs.c_str());
        return JSON_PARSE_ERR;
    }
    return root;
}

std::string write_json(const Json::Value &value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}
