// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file pr_value.hpp
 * @brief Reference-counting wrapper for any SV.
 *
 * Value owns exactly one reference to its SV: either adopted from the
 * creator (Ownership::Adopt) or taken on construction (Ownership::Retain).
 * The destructor gives that reference back. Subclasses narrow the SV type
 * and check it before any reference is taken.
 */

#pragma once

#include "pr_handle.hpp"
#include "pr_error.hpp"
#include <memory>
#include <string>
#include <utility>

namespace pearl {

class Value {
public:
    // Wraps without type checks; the generic variant accepts any SV
    Value(RawSv handle, Ownership ownership);

    Value(const Value& other);
    Value(Value&& other) noexcept;
    Value& operator=(Value other) noexcept;
    virtual ~Value();

    // Most specific variant for a handle of unknown type
    static ValueKind derived_kind(const RawSv& handle);

    // Builds the most specific wrapper (blessed references go through
    // the ObjectRegistry)
    static std::unique_ptr<Value> init_derived(RawSv handle, Ownership ownership);

    virtual ValueKind kind() const { return ValueKind::Generic; }

    // Handle access. The handle stays valid while this wrapper lives.
    const RawSv& handle() const { return handle_; }
    ::interpreter* perl() const { return handle_.perl; }
    SvType type() const { return handle_.type(); }

    // Current reference count of the underlying SV
    uint32_t refcount() const { return handle_.refcnt(); }

    // New reference to this value (\$x, \@a, \%h, \&s)
    Scalar make_ref() const;

    // Dumps the SV to STDERR
    void dump() const { handle_.dump(); }

    // e.g. "Value(Array)"
    virtual std::string debug_description() const;

    friend void swap(Value& a, Value& b) noexcept {
        std::swap(a.handle_, b.handle_);
    }

protected:
    // Throws UnexpectedValueType unless the handle has the wanted tag.
    // Never touches the reference count.
    static const RawSv& check_type(const RawSv& handle, SvType wanted, ValueKind kind);

    RawSv handle_;
};

// Downcast a derived wrapper; nullptr when the variant does not match
template<typename T>
std::unique_ptr<T> value_cast(std::unique_ptr<Value> value) {
    if (auto* p = dynamic_cast<T*>(value.get())) {
        value.release();
        return std::unique_ptr<T>(p);
    }
    return nullptr;
}

} // namespace pearl
