// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file pr_call.hpp
 * @brief Call marshaling between C++ callables and Perl subroutines.
 *
 * Calling into Perl: arguments are packed with ToSv, the context follows
 * the declared result type (void, std::tuple -> list, anything else ->
 * scalar) and results come back as an SvList of independent copies.
 *
 * Calling out of Perl: a C++ callable is wrapped into a HostBody. Its
 * parameter list is read at compile time into a ParamShape:
 *
 *   T                              Required (checked conversion)
 *   std::optional<T>               Optional (nullopt when omitted or undef)
 *   std::vector<T>, last           TrailingArray (remaining arguments)
 *   std::map<std::string, T>, last TrailingHash (remaining key/value pairs)
 *   Arguments&, only parameter     RawArguments (the stack view itself)
 *
 * The result is packed back: void -> nothing, std::tuple -> one SV per
 * slot, anything else -> one SV.
 */

#pragma once

#include "pr_scalar.hpp"
#include <array>
#include <cstdint>
#include <functional>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

namespace pearl {

// ============================================================================
// Arguments - view over the current XSUB's stack frame
// ============================================================================

// Borrowed window over ST(0) .. ST(items - 1). Elements alias the caller's
// variables: Scalar::set on an argument is visible to the Perl caller.
// Only valid during the call, so it can be neither copied nor moved.
class Arguments {
public:
    Arguments(::interpreter* perl, int32_t ax, size_t count)
        : perl_(perl), ax_(ax), count_(count) {}

    Arguments(const Arguments&) = delete;
    Arguments& operator=(const Arguments&) = delete;
    Arguments(Arguments&&) = delete;
    Arguments& operator=(Arguments&&) = delete;

    size_t size() const { return count_; }
    bool empty() const { return count_ == 0; }
    ::interpreter* perl() const { return perl_; }

    // Throws NoArgumentOnStack past the end
    Scalar operator[](size_t index) const;

    // Checked conversion of one argument. An optional target past the end
    // is std::nullopt, anything else throws NoArgumentOnStack.
    template<typename T>
    T get(size_t index) const {
        if constexpr (is_optional_v<T>) {
            return FromSv<T>::checked(value_at(index));
        } else {
            return FromSv<T>::checked(required(index));
        }
    }

    // Borrowed stack slot; null handle past the end
    RawSv value_at(size_t index) const;

    // Borrowed stack slot; throws NoArgumentOnStack past the end
    RawSv required(size_t index) const;

private:
    ::interpreter* perl_;
    int32_t ax_;    // Offset of ST(0) from PL_stack_base
    size_t count_;
};

// ============================================================================
// Function Traits
// ============================================================================

// Primary template: callable objects (lambdas, functors)
template<typename F>
struct FunctionTraits : FunctionTraits<decltype(&F::operator())> {};

// Specialization for function pointers
template<typename Ret, typename... Args>
struct FunctionTraits<Ret(*)(Args...)> {
    using return_type = Ret;
    using args_tuple = std::tuple<Args...>;
    static constexpr size_t arity = sizeof...(Args);

    template<size_t N>
    using arg = std::tuple_element_t<N, args_tuple>;
};

// Specialization for member function pointers
template<typename Ret, typename Class, typename... Args>
struct FunctionTraits<Ret(Class::*)(Args...)> {
    using return_type = Ret;
    using class_type = Class;
    using args_tuple = std::tuple<Args...>;
    static constexpr size_t arity = sizeof...(Args);

    template<size_t N>
    using arg = std::tuple_element_t<N, args_tuple>;
};

// Specialization for const member function pointers
template<typename Ret, typename Class, typename... Args>
struct FunctionTraits<Ret(Class::*)(Args...) const> {
    using return_type = Ret;
    using class_type = Class;
    using args_tuple = std::tuple<Args...>;
    static constexpr size_t arity = sizeof...(Args);

    template<size_t N>
    using arg = std::tuple_element_t<N, args_tuple>;
};

// Specialization for std::function
template<typename Ret, typename... Args>
struct FunctionTraits<std::function<Ret(Args...)>> {
    using return_type = Ret;
    using args_tuple = std::tuple<Args...>;
    static constexpr size_t arity = sizeof...(Args);

    template<size_t N>
    using arg = std::tuple_element_t<N, args_tuple>;
};

template<typename T> struct is_tuple : std::false_type {};
template<typename... Ts> struct is_tuple<std::tuple<Ts...>> : std::true_type {};
template<typename T> inline constexpr bool is_tuple_v = is_tuple<T>::value;

// ============================================================================
// Parameter Shapes
// ============================================================================

enum class ParamKind : uint8_t {
    Required,
    Optional,
    TrailingArray,
    TrailingHash,
    RawArguments
};

template<typename P>
constexpr ParamKind param_kind() {
    using D = std::remove_cv_t<std::remove_reference_t<P>>;
    if constexpr (std::is_same_v<D, Arguments>) {
        return ParamKind::RawArguments;
    } else if constexpr (is_optional_v<D>) {
        return ParamKind::Optional;
    } else if constexpr (is_vector_v<D>) {
        return ParamKind::TrailingArray;
    } else if constexpr (is_string_map_v<D>) {
        return ParamKind::TrailingHash;
    } else {
        return ParamKind::Required;
    }
}

template<typename... Params>
struct ParamShape {
    static constexpr size_t count = sizeof...(Params);
    static constexpr std::array<ParamKind, count> kinds{param_kind<Params>()...};

    static constexpr bool is_raw() {
        return count == 1 && kinds[0] == ParamKind::RawArguments;
    }

    // Required after Optional is ambiguous, trailing parameters soak up
    // everything after them and the raw view stands alone
    static constexpr bool well_formed() {
        bool seen_optional = false;
        for (size_t i = 0; i < count; ++i) {
            switch (kinds[i]) {
                case ParamKind::Required:
                    if (seen_optional) return false;
                    break;
                case ParamKind::Optional:
                    seen_optional = true;
                    break;
                case ParamKind::TrailingArray:
                case ParamKind::TrailingHash:
                    if (i + 1 != count) return false;
                    break;
                case ParamKind::RawArguments:
                    if (count != 1) return false;
                    break;
            }
        }
        return true;
    }

    static constexpr size_t required_count() {
        size_t n = 0;
        for (size_t i = 0; i < count; ++i) {
            if (kinds[i] == ParamKind::Required) ++n;
        }
        return n;
    }
};

// ============================================================================
// Host Bodies
// ============================================================================

// Type-erased C++ body of a Perl-visible sub. Returns owned result SVs.
using HostBody = std::function<SvList(Arguments&)>;

namespace detail {

template<typename P, size_t I>
std::remove_cv_t<std::remove_reference_t<P>> bind_param(const Arguments& args) {
    using D = std::remove_cv_t<std::remove_reference_t<P>>;
    constexpr ParamKind kind = param_kind<P>();

    if constexpr (kind == ParamKind::Required) {
        return FromSv<D>::checked(args.required(I));
    } else if constexpr (kind == ParamKind::Optional) {
        return FromSv<D>::checked(args.value_at(I));
    } else if constexpr (kind == ParamKind::TrailingArray) {
        using Elem = typename D::value_type;
        D out;
        for (size_t i = I; i < args.size(); ++i) {
            out.push_back(FromSv<Elem>::checked(args.value_at(i)));
        }
        return out;
    } else {
        // Alternating key/value pairs; an odd tail leaves its value undef
        using Mapped = typename D::mapped_type;
        D out;
        for (size_t i = I; i < args.size(); i += 2) {
            std::string key = FromSv<std::string>::checked(args.value_at(i));
            out.insert_or_assign(std::move(key), FromSv<Mapped>::checked(args.value_at(i + 1)));
        }
        return out;
    }
}

// Runs `call` and packs what it returns
template<typename Ret, typename Call>
SvList pack_return(::interpreter* perl, Call&& call) {
    SvList out;
    if constexpr (std::is_void_v<Ret>) {
        call();
    } else if constexpr (is_tuple_v<std::decay_t<Ret>>) {
        auto result = call();
        std::apply([&](const auto&... slot) {
            (out.push_back(to_sv(perl, slot)), ...);
        }, result);
    } else {
        auto result = call();
        out.push_back(to_sv(perl, result));
    }
    return out;
}

template<typename Ret, typename Fn, typename... Params, size_t... Is>
SvList invoke_bound(Fn& fn, Arguments& args, std::index_sequence<Is...>) {
    // Braced initialisation binds left to right
    std::tuple<std::remove_cv_t<std::remove_reference_t<Params>>...> bound{
        bind_param<Params, Is>(args)...
    };
    return pack_return<Ret>(args.perl(), [&]() -> decltype(auto) {
        return std::apply(fn, std::move(bound));
    });
}

template<typename Ret, typename Fn, typename... Params>
SvList invoke_host(Fn& fn, Arguments& args, std::tuple<Params...>*) {
    using Shape = ParamShape<Params...>;
    static_assert(Shape::well_formed(),
                  "Parameters must be required, then optional, then at most one trailing "
                  "std::vector or string-keyed map; Arguments& must be the only parameter");

    if constexpr (Shape::is_raw()) {
        return pack_return<Ret>(args.perl(), [&]() -> decltype(auto) { return fn(args); });
    } else {
        return invoke_bound<Ret, Fn, Params...>(fn, args, std::index_sequence_for<Params...>{});
    }
}

} // namespace detail

template<typename F>
HostBody make_host_body(F&& fn) {
    using Fn = std::decay_t<F>;
    using Traits = FunctionTraits<Fn>;
    using Ret = typename Traits::return_type;
    return [fn = Fn(std::forward<F>(fn))](Arguments& args) mutable -> SvList {
        return detail::invoke_host<Ret>(fn, args, static_cast<typename Traits::args_tuple*>(nullptr));
    };
}

// ============================================================================
// Calls into Perl
// ============================================================================

enum class CallContext : uint8_t {
    Void,
    Scalar,
    List
};

template<typename R>
constexpr CallContext call_context_for() {
    if constexpr (std::is_void_v<R>) {
        return CallContext::Void;
    } else if constexpr (is_tuple_v<R>) {
        return CallContext::List;
    } else {
        return CallContext::Scalar;
    }
}

namespace detail {

// Each takes the argument references and returns owned copies of the
// results. A die inside Perl throws InterpreterError with $@.
SvList invoke_sv(const RawSv& code, SvList args, CallContext context);
SvList invoke_named(::interpreter* perl, const std::string& name, SvList args, CallContext context);
// Invocant is args[0]
SvList invoke_method(::interpreter* perl, const std::string& method, SvList args, CallContext context);

template<typename... Args>
SvList pack_args(::interpreter* perl, const Args&... args) {
    SvList packed;
    packed.reserve(sizeof...(Args));
    (packed.push_back(to_sv(perl, args)), ...);
    return packed;
}

template<typename Tuple, size_t... Is>
Tuple unpack_tuple(const SvList& results, std::index_sequence<Is...>) {
    // Missing trailing values read as undef
    return Tuple{
        FromSv<std::tuple_element_t<Is, Tuple>>::checked(
            Is < results.size() ? results[Is] : RawSv())...
    };
}

template<typename R>
R unpack_result(const SvList& results) {
    if constexpr (std::is_void_v<R>) {
        return;
    } else if constexpr (is_tuple_v<R>) {
        return unpack_tuple<R>(results, std::make_index_sequence<std::tuple_size_v<R>>{});
    } else {
        return FromSv<R>::checked(results.empty() ? RawSv() : results[0]);
    }
}

// Wraps every result as an independent Scalar
std::vector<Scalar> adopt_list(SvList results);

} // namespace detail

} // namespace pearl
