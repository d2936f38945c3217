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
#include "field.h"
#include <functional>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

// =======================================
// ========= CHECKED COMPUTATION =========
// =======================================

bool in_checked_computation();

// Marks the current thread as running a constrained computation.
class CheckedScope {
public:
    CheckedScope();
    ~CheckedScope();
    CheckedScope(const CheckedScope&) = delete;
    CheckedScope& operator=(const CheckedScope&) = delete;
};

// Leaves checked mode for the lifetime of the scope (prover-side code).
class AsProverScope {
private:
    int saved_depth_;
public:
    AsProverScope();
    ~AsProverScope();
    AsProverScope(const AsProverScope&) = delete;
    AsProverScope& operator=(const AsProverScope&) = delete;
};

template <typename F>
decltype(auto) run_checked(F&& fn) {
    CheckedScope scope;
    return fn();
}

// Value computed outside the constraint system and injected unconstrained.
template <typename F>
decltype(auto) witness(F&& compute) {
    AsProverScope scope;
    return compute();
}

// cond ? a : b without branching on cond
Field field_select(bool cond, const Field &a, const Field &b);

// throws std::runtime_error when in checked mode and a != b
void assert_field_equals(const Field &a, const Field &b, const char* what);

// =======================================
// =========== PROVING SESSION ===========
// =======================================

struct MemoizedValue {
    std::vector<Field> fields;
    std::vector<std::string> aux;
};

struct ProvingSession {
    std::vector<MemoizedValue> memoized;
    size_t current_index = 0;
    Field blinding_value = new_scalar();
};

class ProvingContext {
private:
    std::mutex lock_;
    ProvingSession session_;
    bool active_ = false;

public:
    ProvingContext() = default;
    ProvingContext(const ProvingContext&) = delete;
    ProvingContext& operator=(const ProvingContext&) = delete;

    bool is_active() const { return active_; }

    // Exclusive hold on the session for one prover run.
    class Session {
    private:
        ProvingContext& ctx_;
        std::lock_guard<std::mutex> guard_;
    public:
        Session(
            ProvingContext& ctx,
            std::vector<MemoizedValue> memoized,
            const Field &blinding_value
        );
        ~Session();
        Session(const Session&) = delete;
        Session& operator=(const Session&) = delete;

        ProvingSession& get() { return ctx_.session_; }
    };
};

// Replays the next memoized value when a session is replaying one,
// otherwise computes it and records it.
MemoizedValue memoize_witness(
    ProvingSession* session,
    const std::function<MemoizedValue()> &compute
);
