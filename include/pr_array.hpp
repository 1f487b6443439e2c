// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file pr_array.hpp
 * @brief Indexed proxy over an AV.
 *
 * 0-based and auto-extending: storing past the end grows the array and
 * leaves the skipped slots undefined. Element wrappers alias the stored
 * SVs, so Scalar::set on a fetched element changes the array.
 */

#pragma once

#include "pr_scalar.hpp"
#include <optional>
#include <vector>

namespace pearl {

class Array : public Value {
public:
    static constexpr ValueKind static_kind = ValueKind::Array;

    // Throws UnexpectedValueType unless the handle is an AV
    Array(RawSv handle, Ownership ownership);

    // Referent of an array reference (@$ref)
    explicit Array(const Scalar& ref);

    // New empty array
    explicit Array(Interpreter& interp);

    ValueKind kind() const override { return ValueKind::Array; }

    size_t size() const;
    bool empty() const { return size() == 0; }

    // Element at index, std::nullopt for a slot that is absent or undef
    std::optional<Scalar> fetch(size_t index) const;

    // Checked-nilable element conversion
    template<typename T>
    std::optional<T> fetch(size_t index) const {
        return FromSv<std::optional<T>>::checked(slot(index));
    }

    // Total: missing slots give a fresh undef not stored in the array
    Scalar operator[](size_t index) const;

    // Throws PerlError for a tied or read-only array and for an index
    // past SSize_t's range
    template<typename T>
    void store(size_t index, const T& value) {
        store_owned(index, ToSv<std::decay_t<T>>::convert(perl(), value));
    }

    // `delete $a[i]`: the prior value, std::nullopt when there was none
    std::optional<Scalar> remove(size_t index);

    bool exists(size_t index) const;

    template<typename T>
    void push(const T& value) {
        push_owned(ToSv<std::decay_t<T>>::convert(perl(), value));
    }

    // Last element, std::nullopt on an empty array; a hole pops as undef
    std::optional<Scalar> pop();
    void clear();

    // Bulk checked conversion, fails as a whole on the first bad element
    template<typename T>
    std::vector<T> to_vector() const {
        return FromSv<std::vector<T>>::checked(handle_);
    }

    std::string debug_description() const override;

private:
    RawSv slot(size_t index) const;
    void store_owned(size_t index, RawSv owned);
    void push_owned(RawSv owned);
};

} // namespace pearl
