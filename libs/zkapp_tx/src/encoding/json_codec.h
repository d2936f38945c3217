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
#include "codes.h"
#include "result.h"
#include <jsoncpp/json/json.h>
#include <array>
#include <optional>
#include <string>

/*
 *  JSON layout of the body types.
 *
 *  Field, UInt32, UInt64   decimal string
 *  Int64                   {"magnitude": "5", "sgn": "Negative"}
 *  PublicKey               96 hex chars of the compressed point
 *  AuthRequired            "None" | "Either" | "Proof" | "Signature" | "Impossible"
 *  SetOrKeep, OrIgnore     null or the value
 *  Events                  [[field, ...], ...], hash recomputed on read
 *  callDepth               JSON integer
 *
 *  Decoding is strict: every key must be present, no unknown keys,
 *  exact types.
 */
class JsonWriter {
private:
    Json::Value &obj_;

public:
    explicit JsonWriter(Json::Value &obj) : obj_(obj) {}

    template <typename T>
    void field(const char* name, const T &value) {
        obj_[name] = encode(value);
    }

    static Json::Value encode(const Field &f);
    static Json::Value encode(const bool &b);
    static Json::Value encode(const uint32_t &x);
    static Json::Value encode(const uint64_t &x);
    static Json::Value encode(const int &call_depth);
    static Json::Value encode(const Int64 &x);
    static Json::Value encode(const PublicKey &pk);
    static Json::Value encode(const AuthRequired &auth);
    static Json::Value encode(const StringWithHash &s);
    static Json::Value encode(const Events &events);
    static Json::Value encode(const std::optional<uint32_t> &x);

    template <typename T>
    static Json::Value encode(const SetOrKeep<T> &s) {
        if (!s.is_some) return Json::Value(Json::nullValue);
        return encode(s.value);
    }

    template <typename T>
    static Json::Value encode(const OrIgnore<T> &s) {
        if (!s.is_some) return Json::Value(Json::nullValue);
        return encode(s.value);
    }

    template <typename T, size_t N>
    static Json::Value encode(const std::array<T, N> &a) {
        Json::Value arr(Json::arrayValue);
        for (const T &x : a) arr.append(encode(x));
        return arr;
    }

    template <typename T>
    static Json::Value encode(const T &value) {
        Json::Value obj(Json::objectValue);
        JsonWriter w(obj);
        visit(w, value, static_cast<T*>(nullptr));
        return obj;
    }
};

class JsonReader {
private:
    const Json::Value &obj_;
    unsigned visited_ = 0;

public:
    int err = OK;

    explicit JsonReader(const Json::Value &obj) : obj_(obj) {}

    unsigned visited() const { return visited_; }

    template <typename T>
    void field(const char* name, T &value) {
        if (err != OK) return;
        if (!obj_.isMember(name)) {
            err = JSON_MISSING_FIELD;
            return;
        }
        visited_++;
        err = decode(obj_[name], value);
    }

    static int decode(const Json::Value &j, Field &out);
    static int decode(const Json::Value &j, bool &out);
    static int decode(const Json::Value &j, uint32_t &out);
    static int decode(const Json::Value &j, uint64_t &out);
    static int decode(const Json::Value &j, int &call_depth);
    static int decode(const Json::Value &j, Int64 &out);
    static int decode(const Json::Value &j, PublicKey &out);
    static int decode(const Json::Value &j, AuthRequired &out);
    static int decode(const Json::Value &j, StringWithHash &out);
    static int decode(const Json::Value &j, Events &out);
    static int decode(const Json::Value &j, std::optional<uint32_t> &out);

    // null keeps the dummy already in out.value
    template <typename T>
    static int decode(const Json::Value &j, SetOrKeep<T> &out) {
        if (j.isNull()) {
            out.is_some = false;
            return OK;
        }
        out.is_some = true;
        return decode(j, out.value);
    }

    template <typename T>
    static int decode(const Json::Value &j, OrIgnore<T> &out) {
        if (j.isNull()) {
            out.is_some = false;
            return OK;
        }
        out.is_some = true;
        return decode(j, out.value);
    }

    template <typename T, size_t N>
    static int decode(const Json::Value &j, std::array<T, N> &out) {
        if (!j.isArray()) return JSON_TYPE_ERR;
        if (j.size() != N) return JSON_TYPE_ERR;
        for (Json::ArrayIndex i = 0; i < N; i++) {
            int rc = decode(j[i], out[i]);
            if (rc != OK) return rc;
        }
        return OK;
    }

    template <typename T>
    static int decode(const Json::Value &j, T &out) {
        if (!j.isObject()) return JSON_TYPE_ERR;
        JsonReader r(j);
        visit(r, out, static_cast<T*>(nullptr));
        if (r.err != OK) return r.err;
        if (r.visited() != j.size()) return JSON_UNKNOWN_FIELD;
        return OK;
    }
};

Result<Json::Value, int> parse_json(const std::string &text);
std::string write_json(const Json::Value &value);

int decode_uint_string(const Json::Value &j, uint64_t max, uint64_t &out);
