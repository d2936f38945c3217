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

#include "provable.h"
#include <stdexcept>

static thread_local int checked_depth = 0;

bool in_checked_computation() {
    return checked_depth > 0;
}

CheckedScope::CheckedScope() { checked_depth++; }
CheckedScope::~CheckedScope() { checked_depth--; }

AsProverScope::AsProverScope() : saved_depth_(checked_depth) {
    checked_depth = 0;
}
AsProverScope::~AsProverScope() {
    checked_depth = saved_depth_;
}

Field field_select(bool cond, const Field &a, const Field &b) {
    byte mask = static_cast<byte>(0) - static_cast<byte>(cond);
    Field out;
    for (size_t i = 0; i < sizeof(out.b); i++) {
        out.b[i] = (a.b[i] & mask) | (b.b[i] & static_cast<byte>(~mask));
    }
    return out;
}

void assert_field_equals(const Field &a, const Field &b, const char* what) {
    if (!in_checked_computation()) return;
    if (a != b) {
        throw std::runtime_error(
            std::string("assert_field_equals: ") + what +
            ": " + field_to_string(a) + " != " + field_to_string(b));
    }
}

ProvingContext::Session::Session(
    ProvingContext& ctx,
    std::vector<MemoizedValue> memoized,
    const Field &blinding_value
) :
    ctx_(ctx),
    guard_(ctx.lock_)
{
    ctx_.session_.memoized = std::move(memoized);
    ctx_.session_.current_index = 0;
    ctx_.session_.blinding_value = blinding_value;
    ctx_.active_ = true;
}

ProvingContext::Session::~Session() {
    ctx_.session_ = ProvingSession{};
    ctx_.active_ = false;
}

MemoizedValue memoize_witness(
    ProvingSession* session,
    const std::function<MemoizedValue()> &compute
) {
    if (session && session->current_index < session->memoized.size()) {
        return session->memoized[session->current_index++];
    }
    MemoizedValue value = witness(compute);
    if (session) {
        session->memoized.push_back(value);
        session->current_index++;
    }
    return value;
}
