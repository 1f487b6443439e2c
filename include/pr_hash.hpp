// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file pr_hash.hpp
 * @brief Keyed proxy over an HV.
 *
 * Keys are UTF-8 and passed verbatim; keys with non-ASCII bytes are stored
 * with Perl's UTF-8 key flag.
 */

#pragma once

#include "pr_scalar.hpp"
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace pearl {

class Hash : public Value {
public:
    static constexpr ValueKind static_kind = ValueKind::Hash;

    // Throws UnexpectedValueType unless the handle is an HV
    Hash(RawSv handle, Ownership ownership);

    // Referent of a hash reference (%$ref)
    explicit Hash(const Scalar& ref);

    // New empty hash
    explicit Hash(Interpreter& interp);

    ValueKind kind() const override { return ValueKind::Hash; }

    // std::nullopt for an absent key
    std::optional<Scalar> operator[](std::string_view key) const { return fetch(key); }
    std::optional<Scalar> fetch(std::string_view key) const;

    template<typename T>
    std::optional<T> fetch(std::string_view key) const {
        return FromSv<std::optional<T>>::checked(slot(key));
    }

    template<typename T>
    void store(std::string_view key, const T& value) {
        store_owned(key, ToSv<std::decay_t<T>>::convert(perl(), value));
    }

    // `delete $h{key}`: the prior value, std::nullopt when absent
    std::optional<Scalar> remove(std::string_view key);

    bool exists(std::string_view key) const;
    std::vector<std::string> keys() const;

    // Number of keys
    size_t size() const;
    bool empty() const { return size() == 0; }

    void clear();

    // Bulk checked conversions
    template<typename T>
    std::map<std::string, T> to_map() const {
        return FromSv<std::map<std::string, T>>::checked(handle_);
    }

    template<typename T>
    std::unordered_map<std::string, T> to_unordered_map() const {
        return FromSv<std::unordered_map<std::string, T>>::checked(handle_);
    }

    std::string debug_description() const override;

private:
    RawSv slot(std::string_view key) const;
    void store_owned(std::string_view key, RawSv owned);
};

} // namespace pearl
