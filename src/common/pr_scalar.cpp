// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file pr_scalar.cpp
 * @brief Scalar wrapper implementation.
 */

#include "pr_perl.hpp"
#include "pr_scalar.hpp"

namespace pearl {

Scalar::Scalar(RawSv handle, Ownership ownership)
    : Value(check_type(handle, SvType::Scalar, ValueKind::Scalar), ownership) {}

Scalar::Scalar(Interpreter& interp)
    : Value(RawSv::new_undef(interpreter_handle(interp)), Ownership::Adopt) {}

std::unique_ptr<Value> Scalar::referent() const {
    RawSv target = handle_.referent();
    if (target.is_null()) {
        return nullptr;
    }
    return Value::init_derived(target, Ownership::Retain);
}

void Scalar::set_undef() {
    if (SvREADONLY(handle_.sv)) {
        throw PerlError("Modification of a read-only value attempted");
    }
    handle_.set_undef();
}

void Scalar::assign(RawSv owned) {
    if (SvREADONLY(handle_.sv)) {
        owned.refcnt_dec();
        throw PerlError("Modification of a read-only value attempted");
    }
    handle_.set_sv(owned);
    owned.refcnt_dec();
}

std::string Scalar::debug_description() const {
    if (!defined()) {
        return "Scalar(undef)";
    }
    // Blessed references already stringify as "Class=HASH(0x...)"
    if (is_ref() || is_int() || is_double()) {
        return "Scalar(" + handle_.text() + ")";
    }
    return "Scalar(\"" + handle_.text() + "\")";
}

} // namespace pearl
