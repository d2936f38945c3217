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
#include "field.h"
#include <array>
#include <optional>
#include <string>
#include <vector>

/*
 *  Field layout of the body types.
 *
 *  Everything the circuit constrains becomes one or more field
 *  elements. Strings and event payloads only contribute their hash,
 *  the payloads themselves travel in BodyAux together with the call
 *  depth, which is recomputed by flattening and never hashed.
 *
 *    Field, bool, uint32, uint64   1
 *    Int64                         2 (magnitude, sign as +-1)
 *    PublicKey                     2
 *    AuthRequired                  3
 *    SetOrKeep / OrIgnore          1 + inner
 *    optional<uint32>              2
 */
struct BodyAux {
    std::vector<std::string> strings;
    std::vector<std::vector<std::vector<Field>>> events;
    int call_depth = 0;
};

class FieldWriter {
public:
    std::vector<Field> fields;
    BodyAux aux;

    void field(const char*, const Field &f) { fields.push_back(f); }
    void field(const char*, const bool &b) { fields.push_back(field_from_bool(b)); }
    void field(const char*, const uint32_t &x) { fields.push_back(new_scalar(x)); }
    void field(const char*, const uint64_t &x) { fields.push_back(new_scalar(x)); }
    void field(const char*, const int &call_depth) { aux.call_depth = call_depth; }
    void field(const char*, const Int64 &x);
    void field(const char*, const PublicKey &pk);
    void field(const char*, const AuthRequired &auth);
    void field(const char*, const StringWithHash &s);
    void field(const char*, const Events &events);
    void field(const char*, const std::optional<uint32_t> &x);

    template <typename T>
    void field(const char* name, const SetOrKeep<T> &s) {
        field(name, s.is_some);
        field(name, s.value);
    }

    template <typename T>
    void field(const char* name, const OrIgnore<T> &s) {
        field(name, s.is_some);
        field(name, s.value);
    }

    template <typename T, size_t N>
    void field(const char* name, const std::array<T, N> &a) {
        for (const T &x : a) field(name, x);
    }

    template <typename T>
    void field(const char*, const T &value) {
        visit(*this, value, static_cast<T*>(nullptr));
    }
};

// Reads fields back into a defaulted value. First error wins.
class FieldReader {
private:
    const std::vector<Field> &fields_;
    const BodyAux &aux_;
    size_t pos_ = 0;
    size_t string_pos_ = 0;
    size_t events_pos_ = 0;

    Field next();
    uint64_t next_uint(uint64_t max);

public:
    int err = OK;

    FieldReader(const std::vector<Field> &fields, const BodyAux &aux) :
        fields_(fields), aux_(aux) {}

    bool consumed_all() const { return pos_ == fields_.size(); }

    void field(const char*, Field &f) { f = next(); }
    void field(const char*, bool &b);
    void field(const char*, uint32_t &x) { x = static_cast<uint32_t>(next_uint(UINT32_MAXINT)); }
    void field(const char*, uint64_t &x) { x = next_uint(UINT64_MAXINT); }
    void field(const char*, int &call_depth) { call_depth = aux_.call_depth; }
    void field(const char*, Int64 &x);
    void field(const char*, PublicKey &pk);
    void field(const char*, AuthRequired &auth);
    void field(const char*, StringWithHash &s);
    void field(const char*, Events &events);
    void field(const char*, std::optional<uint32_t> &x);

    template <typename T>
    void field(const char* name, SetOrKeep<T> &s) {
        field(name, s.is_some);
        field(name, s.value);
    }

    template <typename T>
    void field(const char* name, OrIgnore<T> &s) {
        field(name, s.is_some);
        field(name, s.value);
    }

    template <typename T, size_t N>
    void field(const char* name, std::array<T, N> &a) {
        for (T &x : a) field(name, x);
    }

    template <typename T>
    void field(const char*, T &value) {
        visit(*this, value, static_cast<T*>(nullptr));
    }
};

template <typename T>
std::vector<Field> to_field_list(const T &value) {
    FieldWriter w;
    w.field("", value);
    return w.fields;
}

template <typename T>
size_t size_in_fields(const T &value) {
    return to_field_list(value).size();
}
