// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file pr_value.cpp
 * @brief Value lifetime and most-specific wrapper construction.
 */

#include "pr_value.hpp"
#include "pr_array.hpp"
#include "pr_hash.hpp"
#include "pr_object.hpp"
#include "pr_scalar.hpp"
#include "pr_sub.hpp"

namespace pearl {

Value::Value(RawSv handle, Ownership ownership)
    : handle_(handle) {
    PR_ASSERT(!handle_.is_null(), "Value constructed from null handle");
    if (ownership == Ownership::Retain) {
        handle_.refcnt_inc();
    }
}

Value::Value(const Value& other)
    : handle_(other.handle_) {
    if (!handle_.is_null()) {
        handle_.refcnt_inc();
    }
}

Value::Value(Value&& other) noexcept
    : handle_(other.handle_) {
    other.handle_ = RawSv();
}

Value& Value::operator=(Value other) noexcept {
    swap(*this, other);
    return *this;
}

Value::~Value() {
    // Moved-from wrappers hold nothing
    if (!handle_.is_null()) {
        handle_.refcnt_dec();
    }
}

const RawSv& Value::check_type(const RawSv& handle, SvType wanted, ValueKind kind) {
    if (handle.is_null()) {
        throw UnexpectedValueType(kind, "null handle");
    }
    SvType actual = handle.type();
    if (actual != wanted) {
        throw UnexpectedValueType(kind, actual);
    }
    return handle;
}

ValueKind Value::derived_kind(const RawSv& handle) {
    switch (handle.type()) {
        case SvType::Scalar:
            return handle.is_object() ? ValueKind::Object : ValueKind::Scalar;
        case SvType::Array: return ValueKind::Array;
        case SvType::Hash:  return ValueKind::Hash;
        case SvType::Code:  return ValueKind::Sub;
        default:
            return ValueKind::Generic;
    }
}

std::unique_ptr<Value> Value::init_derived(RawSv handle, Ownership ownership) {
    switch (derived_kind(handle)) {
        case ValueKind::Object:
            return ObjectRegistry::instance().create(handle, ownership);
        case ValueKind::Scalar:
            return std::make_unique<Scalar>(handle, ownership);
        case ValueKind::Array:
            return std::make_unique<Array>(handle, ownership);
        case ValueKind::Hash:
            return std::make_unique<Hash>(handle, ownership);
        case ValueKind::Sub:
            return std::make_unique<Sub>(handle, ownership);
        case ValueKind::Generic:
            break;
    }
    return std::make_unique<Value>(handle, ownership);
}

Scalar Value::make_ref() const {
    return Scalar(RawSv::new_ref(handle_), Ownership::Adopt);
}

std::string Value::debug_description() const {
    return std::string("Value(") + sv_type_name(type()) + ")";
}

} // namespace pearl
