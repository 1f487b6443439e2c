// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file pr_scalar.hpp
 * @brief Scalar wrapper: undef, integer, float, text or reference.
 */

#pragma once

#include "pr_convert.hpp"
#include <memory>
#include <optional>
#include <string>

namespace pearl {

class Scalar : public Value {
public:
    static constexpr ValueKind static_kind = ValueKind::Scalar;

    // Throws UnexpectedValueType unless the handle is a scalar
    Scalar(RawSv handle, Ownership ownership);

    // New undef
    explicit Scalar(Interpreter& interp);

    // New scalar holding a converted host value
    template<typename T,
             typename = std::enable_if_t<!std::is_base_of_v<Value, std::decay_t<T>>>>
    Scalar(Interpreter& interp, const T& value)
        : Value(to_sv(interpreter_handle(interp), value), Ownership::Adopt) {}

    ValueKind kind() const override { return ValueKind::Scalar; }

    // ========== Tags ==========

    // Runs get-magic, so tied scalars and $1 report their fetched value
    bool defined() const {
        handle_.get_magic();
        return handle_.defined();
    }
    bool is_int() const { return handle_.is_int(); }
    bool is_double() const { return handle_.is_double(); }
    bool is_string() const { return handle_.is_string(); }
    bool is_ref() const { return handle_.is_ref(); }
    bool is_utf8() const { return handle_.is_utf8(); }
    bool is_object() const { return handle_.is_object(); }

    // Most specific wrapper for the referent, nullptr unless a reference
    std::unique_ptr<Value> referent() const;

    // Package of a blessed referent
    std::optional<std::string> classname() const { return handle_.classname(); }

    // ========== Conversion ==========

    // Checked; std::optional<U> gives the nilable variant
    template<typename T>
    T as() const { return FromSv<T>::checked(handle_); }

    // Perl's own coercion, never throws
    template<typename T>
    T unchecked_as() const { return FromSv<T>::unchecked(handle_); }

    // ========== Mutation ==========

    // Assigns like `$x = value`; visible through every alias of this SV.
    // Throws PerlError on a read-only SV.
    template<typename T>
    void set(const T& value) {
        assign(ToSv<std::decay_t<T>>::convert(perl(), value));
    }

    void set_undef();

    std::string debug_description() const override;

private:
    // Copies `owned` into this SV and drops its reference
    void assign(RawSv owned);
};

} // namespace pearl
