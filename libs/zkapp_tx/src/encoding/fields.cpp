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

#include "fields.h"

void FieldWriter::field(const char*, const Int64 &x) {
    fields.push_back(new_scalar(x.magnitude));
    Field one = new_scalar(1);
    fields.push_back(x.is_negative() ? neg_scalar(one) : one);
}

void FieldWriter::field(const char*, const PublicKey &pk) {
    auto pk_fields = public_key_to_fields(pk);
    fields.insert(fields.end(), pk_fields.begin(), pk_fields.end());
}

void FieldWriter::field(const char* name, const AuthRequired &auth) {
    field(name, auth.constant);
    field(name, auth.signature_necessary);
    field(name, auth.signature_sufficient);
}

void FieldWriter::field(const char*, const StringWithHash &s) {
    fields.push_back(s.hash);
    aux.strings.push_back(s.data);
}

void FieldWriter::field(const char*, const Events &events) {
    fields.push_back(events.hash);
    aux.events.push_back(events.data);
}

void FieldWriter::field(const char* name, const std::optional<uint32_t> &x) {
    field(name, x.has_value());
    field(name, x.value_or(0));
}

Field FieldReader::next() {
    if (pos_ >= fields_.size()) {
        if (err == OK) err = FIELD_COUNT_ERR;
        return new_scalar();
    }
    return fields_[pos_++];
}

uint64_t FieldReader::next_uint(uint64_t max) {
    Field f = next();
    uint64_t out = 0;
    if (!field_to_u64(f, out) || out > max) {
        if (err == OK) err = INT_RANGE_ERR;
        return 0;
    }
    return out;
}

void FieldReader::field(const char*, bool &b) {
    Field f = next();
    if (scalar_is_zero(f)) { b = false; return; }
    if (f == new_scalar(1)) { b = true; return; }
    b = false;
    if (err == OK) err = FIELD_RANGE_ERR;
}

void FieldReader::field(const char*, Int64 &x) {
    uint64_t magnitude = next_uint(UINT64_MAXINT);
    Field sgn = next();
    Field one = new_scalar(1);

    x.magnitude = magnitude;
    if (sgn == one) {
        x.sgn = Sign::POSITIVE;
    } else if (sgn == neg_scalar(one) && magnitude != 0) {
        x.sgn = Sign::NEGATIVE;
    } else {
        x.sgn = Sign::POSITIVE;
        if (err == OK) err = FIELD_RANGE_ERR;
    }
}

void FieldReader::field(const char*, PublicKey &pk) {
    Field pk_fields[PUBLIC_KEY_FIELDS];
    for (auto &f : pk_fields) f = next();
    if (err != OK) return;

    auto res = public_key_from_fields(pk_fields);
    if (res.is_err()) {
        err = res.unwrap_err();
        return;
    }
    pk = res.unwrap();
}

void FieldReader::field(const char* name, AuthRequired &auth) {
    field(name, auth.constant);
    field(name, auth.signature_necessary);
    field(name, auth.signature_sufficient);
    // three of the eight triples name no permission
    if (err == OK && permission_to_string(auth).is_err()) err = INVALID_PERMISSION;
}

void FieldReader::field(const char*, StringWithHash &s) {
    s.hash = next();
    if (string_pos_ >= aux_.strings.size()) {
        if (err == OK) err = FIELD_COUNT_ERR;
        return;
    }
    s.data = aux_.strings[string_pos_++];
}

void FieldReader::field(const char*, Events &events) {
    events.hash = next();
    if (events_pos_ >= aux_.events.size()) {
        if (err == OK) err = FIELD_COUNT_ERR;
        return;
    }
    events.data = aux_.events[events_pos_++];
}

void FieldReader::field(const char* name, std::optional<uint32_t> &x) {
    bool is_some = false;
    uint32_t value = 0;
    field(name, is_some);
    field(name, value);
    if (is_some) x = value;
    else x.reset();
}
