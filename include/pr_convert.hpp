// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file pr_convert.hpp
 * @brief Conversions between C++ types and SVs.
 *
 * FromSv<T> has three modes:
 *   - checked():   throws ConversionError on undef, non-numeric text for a
 *                  numeric target, or a reference for a non-bool target
 *   - FromSv<std::optional<T>>::checked(): as above but undef -> nullopt
 *   - unchecked(): Perl's own coercion, never throws. Fallbacks: undef
 *                  gives 0 / 0.0 / "" / false, text gives its longest
 *                  numeric prefix or 0, a reference stringifies as
 *                  "SCALAR(0x...)", "ARRAY(0x...)", ...
 *
 * Get-magic ($1, tied scalars, tied elements) runs once per conversion.
 * The *_fetched() variants assume the caller already ran it.
 *
 * ToSv<T>::convert() always succeeds and returns a new SV whose reference
 * belongs to the caller.
 */

#pragma once

#include "pr_value.hpp"
#include <cstdint>
#include <functional>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <vector>

namespace pearl {

// ============================================================================
// Type Traits
// ============================================================================

template<typename T> struct is_optional : std::false_type {};
template<typename T> struct is_optional<std::optional<T>> : std::true_type {};
template<typename T> inline constexpr bool is_optional_v = is_optional<T>::value;

template<typename T> struct is_vector : std::false_type {};
template<typename T> struct is_vector<std::vector<T>> : std::true_type {};
template<typename T> inline constexpr bool is_vector_v = is_vector<T>::value;

template<typename T> struct is_string_map : std::false_type {};
template<typename T> struct is_string_map<std::map<std::string, T>> : std::true_type {};
template<typename T> struct is_string_map<std::unordered_map<std::string, T>> : std::true_type {};
template<typename T> inline constexpr bool is_string_map_v = is_string_map<T>::value;

template<typename T>
inline constexpr bool is_value_v = std::is_base_of_v<Value, T>;

// ============================================================================
// Conversion Helpers (pr_convert.cpp)
// ============================================================================

namespace detail {

// A null handle (absent container slot) counts as undef
inline bool is_undef(const RawSv& sv) { return sv.is_null() || !sv.defined(); }

// Runs get-magic on a non-null handle and passes it through
inline const RawSv& fetched(const RawSv& sv) {
    if (!sv.is_null()) sv.get_magic();
    return sv;
}

bool checked_bool(const RawSv& sv);
int64_t checked_int(const RawSv& sv);
uint64_t checked_uint(const RawSv& sv);
double checked_double(const RawSv& sv);
std::string checked_text(const RawSv& sv);

bool unchecked_bool(const RawSv& sv);

// Perl's canonical true/false values
RawSv new_bool(::interpreter* perl, bool value);

// Follows a reference to the container a wrapper of `kind` expects.
// Scalars and objects are returned unchanged.
RawSv resolve_container(const RawSv& sv, ValueKind kind);

// Array and hash access for bulk conversions (borrowed handles).
// Indices past SSize_t's range are absent, never counted from the end.
size_t array_size(const RawSv& av);
bool array_index_in_range(size_t index);
RawSv array_element(const RawSv& av, size_t index);
void hash_each(const RawSv& hv, const std::function<void(std::string, const RawSv&)>& fn);

// Builds \@array / \%hash from owned element references
RawSv new_array_ref(::interpreter* perl, SvList elements);
RawSv new_hash_ref(::interpreter* perl, std::vector<std::string> keys, SvList values);

[[noreturn]] void throw_out_of_range(int64_t value, const char* type_name);

} // namespace detail

// ============================================================================
// SV -> C++ Type Conversion (FromSv)
// ============================================================================

// Primary template (will fail for unsupported types)
template<typename T, typename = void>
struct FromSv {
    static T checked(const RawSv& sv) {
        static_assert(sizeof(T) == 0, "No conversion from SV defined for this type");
        return T{};
    }
};

// Specialization for bool. A reference is always true.
template<>
struct FromSv<bool> {
    static bool checked(const RawSv& sv) { return checked_fetched(detail::fetched(sv)); }
    static bool unchecked(const RawSv& sv) { return unchecked_fetched(detail::fetched(sv)); }

    static bool checked_fetched(const RawSv& sv) { return detail::checked_bool(sv); }
    static bool unchecked_fetched(const RawSv& sv) { return detail::unchecked_bool(sv); }
};

// Specialization for integral types. Fractions truncate toward zero.
template<typename T>
struct FromSv<T, std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>>> {
    static T checked(const RawSv& sv) { return checked_fetched(detail::fetched(sv)); }
    static T unchecked(const RawSv& sv) { return unchecked_fetched(detail::fetched(sv)); }

    static T checked_fetched(const RawSv& sv) {
        if constexpr (std::is_unsigned_v<T>) {
            uint64_t v = detail::checked_uint(sv);
            if constexpr (sizeof(T) < sizeof(uint64_t)) {
                if (v > std::numeric_limits<T>::max()) {
                    detail::throw_out_of_range(static_cast<int64_t>(v), "unsigned integer");
                }
            }
            return static_cast<T>(v);
        } else {
            int64_t v = detail::checked_int(sv);
            if constexpr (sizeof(T) < sizeof(int64_t)) {
                if (v < std::numeric_limits<T>::min() || v > std::numeric_limits<T>::max()) {
                    detail::throw_out_of_range(v, "integer");
                }
            }
            return static_cast<T>(v);
        }
    }

    static T unchecked_fetched(const RawSv& sv) {
        if (sv.is_null()) return T{};
        if constexpr (std::is_unsigned_v<T>) {
            return static_cast<T>(sv.uv());
        } else {
            return static_cast<T>(sv.iv());
        }
    }
};

// Specialization for floating point types
template<typename T>
struct FromSv<T, std::enable_if_t<std::is_floating_point_v<T>>> {
    static T checked(const RawSv& sv) { return checked_fetched(detail::fetched(sv)); }
    static T unchecked(const RawSv& sv) { return unchecked_fetched(detail::fetched(sv)); }

    static T checked_fetched(const RawSv& sv) {
        return static_cast<T>(detail::checked_double(sv));
    }

    static T unchecked_fetched(const RawSv& sv) {
        if (sv.is_null()) return T{};
        return static_cast<T>(sv.nv());
    }
};

// Specialization for std::string (UTF-8, embedded NULs kept)
template<>
struct FromSv<std::string> {
    static std::string checked(const RawSv& sv) { return checked_fetched(detail::fetched(sv)); }
    static std::string unchecked(const RawSv& sv) { return unchecked_fetched(detail::fetched(sv)); }

    static std::string checked_fetched(const RawSv& sv) { return detail::checked_text(sv); }

    static std::string unchecked_fetched(const RawSv& sv) {
        if (sv.is_null()) return std::string();
        return sv.text();
    }
};

// Nilable conversion: undef -> std::nullopt
template<typename T>
struct FromSv<std::optional<T>> {
    static std::optional<T> checked(const RawSv& sv) { return checked_fetched(detail::fetched(sv)); }
    static std::optional<T> unchecked(const RawSv& sv) { return unchecked_fetched(detail::fetched(sv)); }

    static std::optional<T> checked_fetched(const RawSv& sv) {
        if (detail::is_undef(sv)) return std::nullopt;
        return FromSv<T>::checked_fetched(sv);
    }

    static std::optional<T> unchecked_fetched(const RawSv& sv) {
        if (detail::is_undef(sv)) return std::nullopt;
        return FromSv<T>::unchecked_fetched(sv);
    }
};

// Wrappers take a new reference; containers and subs follow a reference.
// A plain Scalar may hold undef and aliases the SV, magic included; every
// other wrapper needs a value.
template<typename T>
struct FromSv<T, std::enable_if_t<is_value_v<T>>> {
    static T checked(const RawSv& sv) {
        if constexpr (T::static_kind == ValueKind::Scalar) {
            return checked_fetched(sv);
        } else {
            return checked_fetched(detail::fetched(sv));
        }
    }

    static T checked_fetched(const RawSv& sv) {
        bool missing = T::static_kind == ValueKind::Scalar ? sv.is_null() : detail::is_undef(sv);
        if (missing) {
            throw ConversionError(std::string("undefined value where ") +
                                  value_kind_name(T::static_kind) + " was expected");
        }
        return T(detail::resolve_container(sv, T::static_kind), Ownership::Retain);
    }
};

// Array reference -> std::vector<T>, each element checked
template<typename T>
struct FromSv<std::vector<T>> {
    static std::vector<T> checked(const RawSv& sv) { return checked_fetched(detail::fetched(sv)); }

    static std::vector<T> checked_fetched(const RawSv& sv) {
        if (detail::is_undef(sv)) {
            throw ConversionError("undefined value where an array was expected");
        }
        RawSv av = detail::resolve_container(sv, ValueKind::Array);
        size_t n = detail::array_size(av);
        std::vector<T> out;
        out.reserve(n);
        for (size_t i = 0; i < n; ++i) {
            out.push_back(FromSv<T>::checked(detail::array_element(av, i)));
        }
        return out;
    }
};

// Hash reference -> string-keyed map, each value checked
template<typename M>
struct FromSv<M, std::enable_if_t<is_string_map_v<M>>> {
    static M checked(const RawSv& sv) { return checked_fetched(detail::fetched(sv)); }

    static M checked_fetched(const RawSv& sv) {
        if (detail::is_undef(sv)) {
            throw ConversionError("undefined value where a hash was expected");
        }
        using Mapped = typename M::mapped_type;
        RawSv hv = detail::resolve_container(sv, ValueKind::Hash);
        M out;
        detail::hash_each(hv, [&out](std::string key, const RawSv& value) {
            out.insert_or_assign(std::move(key), FromSv<Mapped>::checked(value));
        });
        return out;
    }
};

// Convenience functions
template<typename T>
T from_sv(const RawSv& sv) {
    return FromSv<std::decay_t<T>>::checked(sv);
}

template<typename T>
T from_sv_unchecked(const RawSv& sv) {
    return FromSv<std::decay_t<T>>::unchecked(sv);
}

// ============================================================================
// C++ Type -> SV Conversion (ToSv)
// ============================================================================

// Primary template (will fail for unsupported types)
template<typename T, typename = void>
struct ToSv {
    static RawSv convert(::interpreter* perl, const T& value) {
        static_assert(sizeof(T) == 0, "No conversion to SV defined for this type");
        return RawSv();
    }
};

template<>
struct ToSv<bool> {
    static RawSv convert(::interpreter* perl, bool value) {
        return detail::new_bool(perl, value);
    }
};

template<typename T>
struct ToSv<T, std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>>> {
    static RawSv convert(::interpreter* perl, T value) {
        if constexpr (std::is_unsigned_v<T>) {
            return RawSv::new_uint(perl, static_cast<uint64_t>(value));
        } else {
            return RawSv::new_int(perl, static_cast<int64_t>(value));
        }
    }
};

template<typename T>
struct ToSv<T, std::enable_if_t<std::is_floating_point_v<T>>> {
    static RawSv convert(::interpreter* perl, T value) {
        return RawSv::new_double(perl, static_cast<double>(value));
    }
};

template<>
struct ToSv<std::string> {
    static RawSv convert(::interpreter* perl, const std::string& value) {
        return RawSv::new_text(perl, value);
    }
};

template<>
struct ToSv<std::string_view> {
    static RawSv convert(::interpreter* perl, std::string_view value) {
        return RawSv::new_text(perl, value);
    }
};

template<>
struct ToSv<const char*> {
    static RawSv convert(::interpreter* perl, const char* value) {
        if (value == nullptr) {
            return RawSv::new_undef(perl);
        }
        return RawSv::new_text(perl, value);
    }
};

template<>
struct ToSv<char*> {
    static RawSv convert(::interpreter* perl, const char* value) {
        return ToSv<const char*>::convert(perl, value);
    }
};

template<>
struct ToSv<std::nullopt_t> {
    static RawSv convert(::interpreter* perl, std::nullopt_t) {
        return RawSv::new_undef(perl);
    }
};

template<typename T>
struct ToSv<std::optional<T>> {
    static RawSv convert(::interpreter* perl, const std::optional<T>& value) {
        if (!value) {
            return RawSv::new_undef(perl);
        }
        return ToSv<T>::convert(perl, *value);
    }
};

// Scalars are copied like a Perl assignment; containers and subs are
// passed as references
template<typename T>
struct ToSv<T, std::enable_if_t<is_value_v<T>>> {
    static RawSv convert(::interpreter* perl, const Value& value) {
        (void)perl;
        if (value.type() == SvType::Scalar) {
            return RawSv::new_copy(value.handle());
        }
        return RawSv::new_ref(value.handle());
    }
};

template<typename T>
struct ToSv<std::vector<T>> {
    static RawSv convert(::interpreter* perl, const std::vector<T>& values) {
        SvList elements;
        elements.reserve(values.size());
        for (const auto& v : values) {
            elements.push_back(ToSv<T>::convert(perl, v));
        }
        return detail::new_array_ref(perl, std::move(elements));
    }
};

template<typename M>
struct ToSv<M, std::enable_if_t<is_string_map_v<M>>> {
    static RawSv convert(::interpreter* perl, const M& values) {
        std::vector<std::string> keys;
        SvList elements;
        keys.reserve(values.size());
        elements.reserve(values.size());
        for (const auto& [key, v] : values) {
            keys.push_back(key);
            elements.push_back(ToSv<typename M::mapped_type>::convert(perl, v));
        }
        return detail::new_hash_ref(perl, std::move(keys), std::move(elements));
    }
};

template<typename T>
RawSv to_sv(::interpreter* perl, T&& value) {
    using Decayed = std::decay_t<T>;
    return ToSv<Decayed>::convert(perl, std::forward<T>(value));
}

} // namespace pearl
